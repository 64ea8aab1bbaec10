/**
 * @file test_build_config.cpp
 * @brief Unit tests for defaults/environment/flag layering and JSON table loading
 */

#include <gtest/gtest.h>
#include <config/build_config.hpp>
#include <support/mini_wordnet.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <stdexcept>
#include <vector>

using namespace Lexicode;

namespace {

const char* const ENV_VARS[] = {
    "LEXICODE_WORDNET_DIR", "LEXICODE_SENTIWORDNET", "LEXICODE_OVERRIDES", "LEXICODE_SUPERCLASSES",
    "LEXICODE_SCHEMA", "LEXICODE_LOCK_TIMEOUT_MS", "PGHOST", "PGPORT", "PGDATABASE", "PGUSER", "PGPASSWORD",
};

class BuildConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : ENV_VARS) {
            if (const char* v = std::getenv(name)) saved_.emplace_back(name, v);
            ::unsetenv(name);
        }
        saved_level_ = Logger::min_level();
        Logger::set_min_level(Logger::Level::Error);
    }

    void TearDown() override {
        for (const char* name : ENV_VARS) ::unsetenv(name);
        for (const auto& [name, value] : saved_) ::setenv(name.c_str(), value.c_str(), 1);
        Logger::set_min_level(saved_level_);
    }

    static BuildConfig load(std::vector<const char*> args) {
        args.insert(args.begin(), "lexicode-build");
        return BuildConfig::load(static_cast<int>(args.size()), args.data());
    }

    std::vector<std::pair<std::string, std::string>> saved_;
    Logger::Level saved_level_ = Logger::Level::Stat;
};

} // namespace

// ============================================================================
// Layering
// ============================================================================

TEST_F(BuildConfigTest, Defaults) {
    BuildConfig config = load({});
    EXPECT_EQ(config.schema, "lexicode");
    EXPECT_FALSE(config.dry_run);
    EXPECT_FALSE(config.has_sources());
    EXPECT_EQ(config.database.host, "localhost");
    EXPECT_EQ(config.database.port, "5432");
    EXPECT_EQ(config.database.lock_timeout_ms, 5000);
    EXPECT_EQ(config.database.conninfo(), "host=localhost port=5432 dbname=lexicode user=postgres");
}

TEST_F(BuildConfigTest, EnvironmentThenFlags) {
    ::setenv("LEXICODE_WORDNET_DIR", "/env/dict", 1);
    ::setenv("LEXICODE_SCHEMA", "from_env", 1);
    ::setenv("PGPASSWORD", "secret", 1);
    ::setenv("LEXICODE_LOCK_TIMEOUT_MS", "250", 1);

    BuildConfig config = load({"--schema", "from_flag", "--sentiwordnet", "/x/swn.txt", "--dry-run"});
    EXPECT_EQ(config.wordnet_dir, "/env/dict");
    EXPECT_EQ(config.schema, "from_flag");
    EXPECT_EQ(config.sentiwordnet_path, "/x/swn.txt");
    EXPECT_TRUE(config.dry_run);
    EXPECT_TRUE(config.has_sources());
    EXPECT_EQ(config.database.lock_timeout_ms, 250);
    EXPECT_NE(config.database.conninfo().find("password=secret"), std::string::npos);
}

TEST_F(BuildConfigTest, UsageErrors) {
    EXPECT_THROW(load({"--bogus"}), UsageError);
    EXPECT_THROW(load({"--wordnet"}), UsageError);
    EXPECT_THROW(load({"--schema", "Bad-Name"}), UsageError);
    EXPECT_THROW(load({}).require_sources(), UsageError);
    EXPECT_TRUE(load({"-h"}).help);
}

TEST_F(BuildConfigTest, BadLockTimeout) {
    ::setenv("LEXICODE_LOCK_TIMEOUT_MS", "soon", 1);
    EXPECT_THROW(DatabaseConfig::from_env(), std::invalid_argument);
    ::setenv("LEXICODE_LOCK_TIMEOUT_MS", "-1", 1);
    EXPECT_THROW(DatabaseConfig::from_env(), std::invalid_argument);
}

TEST_F(BuildConfigTest, BadLockTimeoutIsUsageError) {
    for (const char* value : {"abc", "-1", "5000ms", "12 "}) {
        ::setenv("LEXICODE_LOCK_TIMEOUT_MS", value, 1);
        EXPECT_THROW(DatabaseConfig::from_env(), UsageError) << value;
        EXPECT_THROW(load({"--dry-run"}), UsageError) << value;
    }
    ::setenv("LEXICODE_LOCK_TIMEOUT_MS", "250", 1);
    EXPECT_EQ(load({"--dry-run"}).database.lock_timeout_ms, 250);
}

TEST(SchemaNameTest, LowercaseIdentifiersOnly) {
    EXPECT_TRUE(is_valid_schema_name("lexicode"));
    EXPECT_TRUE(is_valid_schema_name("_lex_2"));
    EXPECT_FALSE(is_valid_schema_name(""));
    EXPECT_FALSE(is_valid_schema_name("2lex"));
    EXPECT_FALSE(is_valid_schema_name("Lex"));
    EXPECT_FALSE(is_valid_schema_name("lex;drop"));
    EXPECT_FALSE(is_valid_schema_name(std::string(49, 'a')));
}

// ============================================================================
// JSON tables
// ============================================================================

TEST(TableJsonTest, OverrideValues) {
    auto doc = nlohmann::json::parse(R"({"Fired": "negative", "hired": 1, "sacked": "NEG", "bonus": "pos"})");
    OverrideTable table = override_table_from_json(doc);
    EXPECT_EQ(table.size(), 4u);
    EXPECT_EQ(table.find("fired"), Valence::Negative);
    EXPECT_EQ(table.find("hired"), Valence::Positive);
    EXPECT_EQ(table.find("sacked"), Valence::Negative);
    EXPECT_EQ(table.find("bonus"), Valence::Positive);
}

TEST(TableJsonTest, InvalidOverridesRejected) {
    EXPECT_THROW(override_table_from_json(nlohmann::json::parse(R"({"calm": 0})")), std::invalid_argument);
    EXPECT_THROW(override_table_from_json(nlohmann::json::parse(R"({"calm": "neutral"})")), std::invalid_argument);
    EXPECT_THROW(override_table_from_json(nlohmann::json::parse(R"(["fired"])")), std::invalid_argument);
}

TEST(TableJsonTest, SuperclassTable) {
    auto table = superclass_table_from_json(nlohmann::json::parse(R"({"layoff.n.01": "0233"})"));
    EXPECT_EQ(table.lookup("layoff.n.01"), std::optional<std::string>("0233"));
    EXPECT_THROW(superclass_table_from_json(nlohmann::json::parse(R"({"x.n.01": 233})")), std::invalid_argument);
    EXPECT_THROW(superclass_table_from_json(nlohmann::json::parse(R"({"x.n.01": "233"})")), std::invalid_argument);
}

TEST_F(BuildConfigTest, LoadTablesReplacesConfiguredTables) {
    LexicodeTest::MiniWordNet dir("config_tables");
    dir.write("overrides.json", R"({"layoff": "positive"})");
    dir.write("broken.json", "{ not json");

    BuildConfig config = load({"--overrides", dir.path("overrides.json").c_str()});
    ResolverTables tables = config.load_tables();
    EXPECT_EQ(tables.overrides.size(), 1u);
    EXPECT_EQ(tables.overrides.find("layoff"), Valence::Positive);
    EXPECT_EQ(tables.superclasses.size(), SuperclassTable::defaults().size());

    config.superclasses_path = dir.path("broken.json");
    EXPECT_THROW(config.load_tables(), std::invalid_argument);
    config.superclasses_path = dir.path("missing.json");
    EXPECT_THROW(config.load_tables(), std::invalid_argument);
}
