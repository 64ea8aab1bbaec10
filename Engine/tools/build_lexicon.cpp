// build_lexicon.cpp
// Builds the lexicon from WordNet + SentiWordNet, writes it to a PostgreSQL schema
// (or memory with --dry-run), then validates what was written.

#include <config/build_config.hpp>
#include <database/postgres_connection.hpp>
#include <knowledge/knowledge_base.hpp>
#include <lexicon/lexicon_builder.hpp>
#include <report/build_report.hpp>
#include <storage/lexicon_writer.hpp>
#include <storage/memory_lexicon_store.hpp>
#include <storage/postgres_lexicon_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <validate/validator.hpp>

#include <iostream>
#include <string>

namespace Lexicode {

ValidationInput persist(LexiconStore& store, const BuildResult& result, const std::string& schema,
                        WriteOutcome& outcome) {
    Logger::info("Writing lexicon");
    LexiconWriter writer(store);
    outcome = writer.write(result, schema);
    if (outcome.redirected) {
        Logger::warn("Lexicon written to " + outcome.destination + " instead of " + schema);
    }

    store.open_destination(outcome.destination);
    ValidationInput input;
    input.rows = store.load_entries();
    input.recorded_fingerprint = store.load_metadata("fingerprint");
    return input;
}

} // namespace Lexicode

int main(int argc, char** argv) {
    using namespace Lexicode;

    BuildConfig config;
    try {
        config = BuildConfig::load(argc, argv);
        if (config.help) {
            std::cout << BuildConfig::usage(argv[0]);
            return 0;
        }
        config.require_sources();
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n\n" << BuildConfig::usage(argv[0]);
        return 2;
    }

    PhaseTimer total;
    try {
        ResolverTables tables = config.load_tables();
        Logger::stat("Superclass roots: " + std::to_string(tables.superclasses.size()) +
                     ", overrides: " + std::to_string(tables.overrides.size()));

        KnowledgeBase kb = KnowledgeBase::load(config.wordnet_dir, config.sentiwordnet_path);

        Logger::info("Building lexicon");
        LexiconBuilder builder(tables);
        BuildResult result = builder.build(kb.graph, kb.sentiment, kb.morphy);

        WriteOutcome outcome;
        ValidationInput input;
        if (config.dry_run) {
            MemoryLexiconStore store;
            input = persist(store, result, config.schema, outcome);
        } else {
            PostgresConnection db(config.database);
            PostgresLexiconStore store(db, config.database.lock_timeout_ms);
            input = persist(store, result, config.schema, outcome);
        }
        input.overrides = &tables.overrides;

        BuildReport::log_summary(result, &outcome);

        ValidationReport validation = Validator::run(input);
        Validator::log(validation);

        if (!config.report_path.empty()) {
            nlohmann::json doc = BuildReport::to_json(result, &outcome);
            doc["validation"] = BuildReport::to_json(validation);
            BuildReport::write(config.report_path, doc);
        }

        Logger::success("Build finished in " + std::to_string(total.elapsed_sec()) + "s");
        return validation.passed() ? 0 : 1;

    } catch (const std::exception& ex) {
        Logger::error(std::string("[FATAL] ") + ex.what());
        return 1;
    }
}
