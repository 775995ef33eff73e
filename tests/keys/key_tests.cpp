#include <gtest/gtest.h>
#include "stagedag/keys/descriptor.inline.hpp"
#include "stagedag/keys/key.hpp"
#include "stagedag/keys/key.inline.hpp"

using namespace stagedag;

// =============================================================================
// Identifier Tests
// =============================================================================

TEST(KeyTests, ToIdentifier_MapsDashToUnderscore)
{
    EXPECT_EQ(to_identifier("log-level"), "log_level");
    EXPECT_EQ(to_identifier("port"), "port");
}

TEST(KeyTests, ToIdentifier_DropsOtherCharacters)
{
    EXPECT_EQ(to_identifier("a.b c"), "abc");
}

TEST(KeyTests, ToIdentifier_RejectsEmptyOrDigitLeading)
{
    EXPECT_THROW(to_identifier(""), KeyError);
    EXPECT_THROW(to_identifier("..."), KeyError);
    try
    {
        to_identifier("9lives");
        FAIL() << "Expected KeyError";
    }
    catch (const KeyError& e)
    {
        EXPECT_EQ(e.code(), KeyErrorCode::IllegalKeyName);
        EXPECT_EQ(e.key_name(), "9lives");
    }
}

// =============================================================================
// KeyRegistry Tests
// =============================================================================

class KeyRegistryTests : public ::testing::Test
{
protected:
    KeyRegistry registry;
};

TEST_F(KeyRegistryTests, Create_ExposesAttributes)
{
    auto port = registry.create<int>("port", "Listening port.", Stage::Configure, 8080,
                                     desc::integer());
    EXPECT_EQ(port.name(), "port");
    EXPECT_EQ(port.stage(), Stage::Configure);
    EXPECT_EQ(port.default_value(), 8080);
    EXPECT_EQ(port.descriptor(), desc::integer());
    EXPECT_EQ(port.doc().names(), std::vector<std::string>{"port"});
    EXPECT_EQ(port.doc().doc(), "Listening port.");
    EXPECT_TRUE(port.is_configure());
    EXPECT_FALSE(port.is_runtime());
}

TEST_F(KeyRegistryTests, Create_DuplicateNameFails)
{
    registry.create<int>("port", "", Stage::Configure, 80, desc::integer());
    try
    {
        registry.create<std::string>("port", "", Stage::Run, "x", desc::string());
        FAIL() << "Expected KeyError";
    }
    catch (const KeyError& e)
    {
        EXPECT_EQ(e.code(), KeyErrorCode::DuplicateKeyName);
        EXPECT_EQ(e.key_name(), "port");
        EXPECT_STREQ(e.what(), "A key named 'port' already exists");
    }
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(KeyRegistryTests, Create_SameIdentifierFails)
{
    registry.create<int>("a-b", "", Stage::Configure, 1, desc::integer());
    try
    {
        registry.create<int>("a_b", "", Stage::Configure, 2, desc::integer());
        FAIL() << "Expected KeyError";
    }
    catch (const KeyError& e)
    {
        EXPECT_EQ(e.code(), KeyErrorCode::DuplicateKeyName);
        EXPECT_EQ(e.key_name(), "a_b");
        EXPECT_STREQ(e.what(), "Key 'a_b' has the same identifier 'a_b' as key 'a-b'");
    }
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_FALSE(registry.contains("a_b"));
}

TEST_F(KeyRegistryTests, Create_IllegalNameFails)
{
    try
    {
        registry.create<int>("1st", "", Stage::Both, 0, desc::integer());
        FAIL() << "Expected KeyError";
    }
    catch (const KeyError& e)
    {
        EXPECT_EQ(e.code(), KeyErrorCode::IllegalKeyName);
    }
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(KeyRegistryTests, CreateRaw_UsesFullDoc)
{
    auto level = registry.create_raw<std::string>(
        Doc{{"log_level", "l"}, "Log level.", "LEVEL", "LOGGING"}, Stage::Both, "info",
        "log_level", desc::string());
    EXPECT_EQ(level.doc().docv(), "LEVEL");
    EXPECT_EQ(level.doc().docs(), "LOGGING");
    EXPECT_EQ(level.doc().names().size(), 2u);
}

TEST_F(KeyRegistryTests, CreateRaw_NullDescriptorFails)
{
    EXPECT_THROW(registry.create_raw<int>(Doc(std::vector<std::string>{"x"}), Stage::Run, 0, "x", nullptr),
                 std::invalid_argument);
}

TEST_F(KeyRegistryTests, SeparateRegistries_AreIndependent)
{
    KeyRegistry other;
    registry.create<int>("port", "", Stage::Configure, 80, desc::integer());
    EXPECT_NO_THROW(other.create<int>("port", "", Stage::Configure, 81, desc::integer()));
}

TEST_F(KeyRegistryTests, Find_ReturnsRegisteredKey)
{
    registry.create<bool>("tls", "", Stage::Run, false, desc::boolean());
    auto found = registry.find("tls");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name(), "tls");
    EXPECT_FALSE(registry.find("missing").has_value());
    EXPECT_TRUE(registry.contains("tls"));
}

// =============================================================================
// AnyKey Tests
// =============================================================================

TEST_F(KeyRegistryTests, AnyKey_EqualityIsByName)
{
    auto port = registry.create<int>("port", "", Stage::Configure, 80, desc::integer());
    AnyKey a = port;
    AnyKey b = port.erase();
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.info().type_name(), "int");
    EXPECT_EQ(a.info().value_type(), std::type_index{typeid(int)});
}

TEST_F(KeyRegistryTests, KeySet_IsOrderedByName)
{
    auto z = registry.create<int>("zeta", "", Stage::Run, 0, desc::integer());
    auto a = registry.create<int>("alpha", "", Stage::Run, 0, desc::integer());
    auto m = registry.create<int>("mu", "", Stage::Run, 0, desc::integer());
    KeySet keys{z, a, m};
    std::vector<std::string> names;
    for (const auto& key : keys)
    {
        names.push_back(key.name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"alpha", "mu", "zeta"}));
}

// =============================================================================
// Stage Tests
// =============================================================================

TEST_F(KeyRegistryTests, FilterStage_KeepsMatchingAndBoth)
{
    auto c = registry.create<int>("c", "", Stage::Configure, 0, desc::integer());
    auto r = registry.create<int>("r", "", Stage::Run, 0, desc::integer());
    auto b = registry.create<int>("b", "", Stage::Both, 0, desc::integer());
    KeySet all{c, r, b};

    EXPECT_EQ(filter_stage(Stage::Configure, all), (KeySet{c, b}));
    EXPECT_EQ(filter_stage(Stage::Run, all), (KeySet{r, b}));
    EXPECT_EQ(filter_stage(Stage::Both, all), all);
}

TEST_F(KeyRegistryTests, BothStage_IsRuntimeAndConfigure)
{
    auto b = registry.create<int>("b", "", Stage::Both, 0, desc::integer());
    EXPECT_TRUE(b.is_runtime());
    EXPECT_TRUE(b.is_configure());
    EXPECT_STREQ(stage_name(Stage::Both), "both");
}
