#include <gtest/gtest.h>
#include "stagedag/keys/descriptor.inline.hpp"
#include "stagedag/keys/key.inline.hpp"
#include "stagedag/keys/key_emit.hpp"
#include "common/log_capture.hpp"

using namespace stagedag;

class KeyEmitTests : public ::testing::Test
{
protected:
    KeyRegistry registry;
    Key<std::string> log_level = registry.create<std::string>(
        "log_level", "Minimum level of logged messages.", Stage::Both, "info", desc::string());
    Key<int> port = registry.create<int>("port", "", Stage::Configure, 8080, desc::integer());
    Key<std::vector<int>> weights = registry.create<std::vector<int>>(
        "weights", "", Stage::Run, std::vector<int>{1, 2}, desc::list(desc::integer()));
    EvalContext ctx;
};

// =============================================================================
// Serialize Tests
// =============================================================================

TEST_F(KeyEmitTests, Serialize_UsesResolvedValueNotDefault)
{
    ctx.set(log_level, std::string("debug"));
    EXPECT_EQ(serialize(log_level, ctx), "\"debug\"");
}

TEST_F(KeyEmitTests, Serialize_List)
{
    ctx.fill_defaults(KeySet{weights});
    EXPECT_EQ(serialize(weights, ctx), "std::vector<int>{1, 2}");
}

TEST_F(KeyEmitTests, Serialize_UnboundKeyIsInvariantViolation)
{
    LogCapture capture;
    try
    {
        serialize(port, ctx);
        FAIL() << "Expected KeyError";
    }
    catch (const KeyError& e)
    {
        EXPECT_EQ(e.code(), KeyErrorCode::UnresolvedKeyInvariant);
    }
    EXPECT_TRUE(capture.contains("codegen", "port"));
}

// =============================================================================
// Describe Tests
// =============================================================================

TEST_F(KeyEmitTests, Describe_IncludesHelpText)
{
    EXPECT_EQ(describe(log_level),
              "log_level : string [both] = info  # Minimum level of logged messages.");
}

TEST_F(KeyEmitTests, Describe_WithoutHelpText)
{
    EXPECT_EQ(describe(port), "port : integer [configure] = 8080");
    EXPECT_EQ(describe(weights), "weights : integer list [run] = 1,2");
}

TEST_F(KeyEmitTests, Emit_IsDocumentationBlock)
{
    EXPECT_EQ(emit(log_level),
              "--log_level=VALUE\n"
              "    Minimum level of logged messages.\n"
              "    Type: string. Stage: both. Default: 'info'.\n");
}

// =============================================================================
// Binding Description Tests
// =============================================================================

TEST_F(KeyEmitTests, DescribeBinding_MarksDefaults)
{
    ctx.set(port, 9000);
    ctx.fill_defaults(KeySet{log_level, port});
    EXPECT_EQ(describe_binding(port, ctx), "port=9000");
    EXPECT_EQ(describe_binding(log_level, ctx), "log_level=info (default)");
}

TEST_F(KeyEmitTests, DescribeBinding_Unset)
{
    EXPECT_EQ(describe_binding(port, ctx), "port is unset");
}
