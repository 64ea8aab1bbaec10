#include <config/build_config.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Lexicode {

namespace {

void read_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) target = value;
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::invalid_argument("Cannot open table file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(path + ": " + e.what());
    }
}

} // namespace

DatabaseConfig DatabaseConfig::from_env() {
    DatabaseConfig config;
    read_env("PGHOST", config.host);
    read_env("PGPORT", config.port);
    read_env("PGDATABASE", config.dbname);
    read_env("PGUSER", config.user);
    read_env("PGPASSWORD", config.password);

    std::string timeout;
    read_env("LEXICODE_LOCK_TIMEOUT_MS", timeout);
    if (!timeout.empty()) {
        size_t used = 0;
        try {
            config.lock_timeout_ms = std::stoi(timeout, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || used != timeout.size()) {
            throw UsageError("LEXICODE_LOCK_TIMEOUT_MS must be an integer, got '" + timeout + "'");
        }
        if (config.lock_timeout_ms < 0) {
            throw UsageError("LEXICODE_LOCK_TIMEOUT_MS must not be negative");
        }
    }
    return config;
}

std::string DatabaseConfig::conninfo() const {
    std::ostringstream conninfo;
    conninfo << "host=" << host << " ";
    conninfo << "port=" << port << " ";
    conninfo << "dbname=" << dbname << " ";
    conninfo << "user=" << user;
    if (!password.empty()) {
        conninfo << " password=" << password;
    }
    return conninfo.str();
}

bool is_valid_schema_name(const std::string& name) {
    if (name.empty() || name.size() > 48) return false;
    if (!(std::islower(static_cast<unsigned char>(name[0])) || name[0] == '_')) return false;
    for (char ch : name) {
        auto c = static_cast<unsigned char>(ch);
        if (!(std::islower(c) || std::isdigit(c) || ch == '_')) return false;
    }
    return true;
}

BuildConfig BuildConfig::from_env() {
    BuildConfig config;
    read_env("LEXICODE_WORDNET_DIR", config.wordnet_dir);
    read_env("LEXICODE_SENTIWORDNET", config.sentiwordnet_path);
    read_env("LEXICODE_OVERRIDES", config.overrides_path);
    read_env("LEXICODE_SUPERCLASSES", config.superclasses_path);
    read_env("LEXICODE_SCHEMA", config.schema);
    config.database = DatabaseConfig::from_env();
    return config;
}

BuildConfig BuildConfig::load(int argc, const char* const* argv) {
    BuildConfig config = from_env();
    config.apply_args(argc, argv);
    if (!is_valid_schema_name(config.schema)) {
        throw UsageError("Invalid schema name '" + config.schema + "'");
    }
    return config;
}

void BuildConfig::apply_args(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw UsageError("Missing value for " + arg);
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") help = true;
        else if (arg == "--dry-run") dry_run = true;
        else if (arg == "--wordnet") wordnet_dir = value();
        else if (arg == "--sentiwordnet") sentiwordnet_path = value();
        else if (arg == "--overrides") overrides_path = value();
        else if (arg == "--superclasses") superclasses_path = value();
        else if (arg == "--schema") schema = value();
        else if (arg == "--report") report_path = value();
        else throw UsageError("Unknown argument: " + arg);
    }
}

void BuildConfig::require_sources() const {
    if (wordnet_dir.empty()) {
        throw UsageError("No WordNet directory (--wordnet or LEXICODE_WORDNET_DIR)");
    }
    if (sentiwordnet_path.empty()) {
        throw UsageError("No SentiWordNet file (--sentiwordnet or LEXICODE_SENTIWORDNET)");
    }
}

ResolverTables BuildConfig::load_tables() const {
    ResolverTables tables;
    if (!superclasses_path.empty()) {
        tables.superclasses = load_superclass_table(superclasses_path);
        Logger::stat("Superclass table: " + std::to_string(tables.superclasses.size()) +
                     " roots from " + superclasses_path);
    }
    if (!overrides_path.empty()) {
        tables.overrides = load_override_table(overrides_path);
        Logger::stat("Override table: " + std::to_string(tables.overrides.size()) +
                     " words from " + overrides_path);
    }
    return tables;
}

std::string BuildConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --wordnet <dir>        WordNet 3.0 dict directory     (LEXICODE_WORDNET_DIR)\n"
        << "  --sentiwordnet <file>  SentiWordNet 3.0 scores file   (LEXICODE_SENTIWORDNET)\n"
        << "  --overrides <json>     override table replacement     (LEXICODE_OVERRIDES)\n"
        << "  --superclasses <json>  superclass table replacement   (LEXICODE_SUPERCLASSES)\n"
        << "  --schema <name>        destination schema [lexicode]  (LEXICODE_SCHEMA)\n"
        << "  --dry-run              keep the lexicon in memory, no database\n"
        << "  --report <file>        write a JSON report\n"
        << "  --help                 show this text\n"
        << "Database: PGHOST PGPORT PGDATABASE PGUSER PGPASSWORD LEXICODE_LOCK_TIMEOUT_MS\n";
    return out.str();
}

SuperclassTable superclass_table_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Superclass table must be a JSON object");
    }
    SuperclassTable::Map entries;
    for (auto& [name, value] : doc.items()) {
        if (!value.is_string()) {
            throw std::invalid_argument("Superclass code for " + name + " must be a string");
        }
        entries[name] = value.get<std::string>();
    }
    return SuperclassTable(std::move(entries));
}

OverrideTable override_table_from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Override table must be a JSON object");
    }
    OverrideTable table;
    for (auto& [word, value] : doc.items()) {
        Valence valence = Valence::Neutral;
        if (value.is_string()) {
            std::string label = to_lower_ascii(value.get<std::string>());
            if (label == "positive" || label == "pos") valence = Valence::Positive;
            else if (label == "negative" || label == "neg") valence = Valence::Negative;
        } else if (value.is_number_integer()) {
            int digit = value.get<int>();
            if (digit == 1) valence = Valence::Positive;
            else if (digit == 2) valence = Valence::Negative;
        }
        if (valence == Valence::Neutral) {
            throw std::invalid_argument("Override for '" + word + "' must be positive/negative or 1/2, got " +
                                        value.dump());
        }
        table.set(word, valence);
    }
    return table;
}

SuperclassTable load_superclass_table(const std::string& path) {
    return superclass_table_from_json(read_json_file(path));
}

OverrideTable load_override_table(const std::string& path) {
    return override_table_from_json(read_json_file(path));
}

} // namespace Lexicode
