#include <gtest/gtest.h>
#include "stagedag/keys/descriptor.inline.hpp"
#include "stagedag/keys/eval_context.hpp"
#include "stagedag/keys/key.inline.hpp"

using namespace stagedag;

class EvalContextTests : public ::testing::Test
{
protected:
    KeyRegistry registry;
    Key<std::string> log_level = registry.create<std::string>(
        "log_level", "", Stage::Both, "info", desc::string());
    Key<int> port = registry.create<int>("port", "", Stage::Configure, 8080, desc::integer());
    EvalContext ctx;
};

// =============================================================================
// Binding Tests
// =============================================================================

TEST_F(EvalContextTests, Set_BindsWithExplicitProvenance)
{
    ctx.set(port, 9000);
    ASSERT_TRUE(ctx.is_bound(port));
    EXPECT_EQ(ctx.get(port), 9000);
    EXPECT_EQ(ctx.find("port")->provenance, Provenance::Explicit);
}

TEST_F(EvalContextTests, Get_UnboundIsNullopt)
{
    EXPECT_FALSE(ctx.get(port).has_value());
    EXPECT_EQ(ctx.find("port"), nullptr);
}

TEST_F(EvalContextTests, Bind_SecondTimeFails)
{
    ctx.set(port, 9000);
    try
    {
        ctx.bind(port, ValueCell::of(1), Provenance::CommandLine);
        FAIL() << "Expected KeyError";
    }
    catch (const KeyError& e)
    {
        EXPECT_EQ(e.code(), KeyErrorCode::AlreadyBound);
        EXPECT_EQ(e.key_name(), "port");
    }
    EXPECT_EQ(ctx.get(port), 9000);
}

TEST_F(EvalContextTests, Bind_WrongTypeFails)
{
    try
    {
        ctx.bind(port, ValueCell::of(std::string("80")), Provenance::CommandLine);
        FAIL() << "Expected KeyError";
    }
    catch (const KeyError& e)
    {
        EXPECT_EQ(e.code(), KeyErrorCode::TypeMismatch);
    }
    EXPECT_FALSE(ctx.is_bound(port));
}

// =============================================================================
// Default Filling Tests
// =============================================================================

TEST_F(EvalContextTests, FillDefaults_FillsOnlyUnboundKeys)
{
    ctx.set(log_level, std::string("debug"));
    size_t filled = ctx.fill_defaults(KeySet{log_level, port});
    EXPECT_EQ(filled, 1u);
    EXPECT_EQ(ctx.get(log_level), std::string("debug"));
    EXPECT_EQ(ctx.get(port), 8080);
    EXPECT_EQ(ctx.provenance("port"), Provenance::Default);
    EXPECT_EQ(ctx.provenance("log_level"), Provenance::Explicit);
    EXPECT_FALSE(ctx.provenance("missing").has_value());
}

TEST_F(EvalContextTests, FillDefaults_SecondCallFillsNothing)
{
    ctx.fill_defaults(KeySet{log_level, port});
    EXPECT_EQ(ctx.fill_defaults(KeySet{log_level, port}), 0u);
    EXPECT_EQ(ctx.size(), 2u);
}

TEST_F(EvalContextTests, BoundNames_AreInNameOrder)
{
    ctx.set(port, 1);
    ctx.set(log_level, std::string("warn"));
    EXPECT_EQ(ctx.bound_names(), (std::vector<std::string>{"log_level", "port"}));
}

TEST_F(EvalContextTests, ProvenanceName_IsReadable)
{
    EXPECT_STREQ(provenance_name(Provenance::CommandLine), "command line");
    EXPECT_STREQ(provenance_name(Provenance::Default), "default");
}
