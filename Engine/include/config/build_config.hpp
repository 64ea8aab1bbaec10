/**
 * @file build_config.hpp
 * @brief Build/validate settings from defaults, environment and command line
 */

#pragma once

#include <classify/resolver_tables.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace Lexicode {

/**
 * @brief Bad command line; tools exit with code 2
 */
class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief libpq connection settings
 *
 * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD, LEXICODE_LOCK_TIMEOUT_MS
 * Defaults: localhost, 5432, lexicode, postgres, (no password), 5000
 */
struct DatabaseConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "lexicode";
    std::string user = "postgres";
    std::string password;
    int lock_timeout_ms = 5000;

    /**
     * @throws UsageError if LEXICODE_LOCK_TIMEOUT_MS is not a whole non-negative integer
     */
    static DatabaseConfig from_env();

    std::string conninfo() const;
};

struct BuildConfig {
    static constexpr const char* DEFAULT_SCHEMA = "lexicode";

    std::string wordnet_dir;          // WordNet 3.0 dict/ directory
    std::string sentiwordnet_path;    // SentiWordNet_3.0.0.txt
    std::string overrides_path;       // optional JSON override table
    std::string superclasses_path;    // optional JSON superclass table
    std::string schema = DEFAULT_SCHEMA;
    std::string report_path;          // optional JSON report
    bool dry_run = false;
    bool help = false;
    DatabaseConfig database;

    /**
     * @brief Defaults overlaid with LEXICODE_* and PG* environment variables
     */
    static BuildConfig from_env();

    /**
     * @brief from_env() overlaid with command-line flags
     * @throws UsageError on unknown flags, missing values or a bad schema name
     */
    static BuildConfig load(int argc, const char* const* argv);

    /**
     * @throws UsageError on unknown flags or missing values
     */
    void apply_args(int argc, const char* const* argv);

    /**
     * @brief True when both knowledge-base inputs are set
     */
    bool has_sources() const { return !wordnet_dir.empty() && !sentiwordnet_path.empty(); }

    /**
     * @throws UsageError unless has_sources()
     */
    void require_sources() const;

    /**
     * @brief Built-in tables with any configured JSON replacements applied
     * @throws std::invalid_argument for unreadable or invalid table files
     */
    ResolverTables load_tables() const;

    static std::string usage(const std::string& program);
};

/**
 * @brief Schema names are lowercase identifiers: [a-z_][a-z0-9_]*, at most 48 chars
 */
bool is_valid_schema_name(const std::string& name);

/**
 * @brief {"layoff.n.01": "0233", ...}
 * @throws std::invalid_argument on non-object input or non 4-digit codes
 */
SuperclassTable superclass_table_from_json(const nlohmann::json& doc);

/**
 * @brief {"fired": "negative", "promoted": 1, ...}; values positive/negative or 1/2
 * @throws std::invalid_argument on non-object input or other values
 */
OverrideTable override_table_from_json(const nlohmann::json& doc);

SuperclassTable load_superclass_table(const std::string& path);
OverrideTable load_override_table(const std::string& path);

} // namespace Lexicode
