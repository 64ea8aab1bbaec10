// validate_lexicon.cpp
// Validates a lexicon already stored in a PostgreSQL schema. With --wordnet and
// --sentiwordnet the lexicon is also rebuilt in memory and compared word by word.

#include <config/build_config.hpp>
#include <database/postgres_connection.hpp>
#include <knowledge/knowledge_base.hpp>
#include <lexicon/lexicon_builder.hpp>
#include <report/build_report.hpp>
#include <storage/postgres_lexicon_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <validate/validator.hpp>

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace Lexicode;

    BuildConfig config;
    try {
        config = BuildConfig::load(argc, argv);
        if (config.help) {
            std::cout << BuildConfig::usage(argv[0]);
            return 0;
        }
        if (config.dry_run) throw UsageError("--dry-run does not apply to validation");
        if (!config.has_sources() && (!config.wordnet_dir.empty() || !config.sentiwordnet_path.empty())) {
            throw UsageError("A rebuild needs both --wordnet and --sentiwordnet");
        }
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n\n" << BuildConfig::usage(argv[0]);
        return 2;
    }

    PhaseTimer total;
    try {
        ResolverTables tables = config.load_tables();

        PostgresConnection db(config.database);
        PostgresLexiconStore store(db, config.database.lock_timeout_ms);
        store.open_destination(config.schema);

        ValidationInput input;
        input.rows = store.load_entries();
        input.recorded_fingerprint = store.load_metadata("fingerprint");
        input.overrides = &tables.overrides;
        Logger::stat("Loaded " + std::to_string(input.rows.size()) + " rows from " + config.schema);

        if (config.has_sources()) {
            Logger::info("Rebuilding for the determinism check");
            KnowledgeBase kb = KnowledgeBase::load(config.wordnet_dir, config.sentiwordnet_path);
            LexiconBuilder builder(tables);
            input.reference = builder.build(kb.graph, kb.sentiment, kb.morphy).final_snapshot.entries();
        }

        ValidationReport report = Validator::run(input);
        Validator::log(report);

        if (!config.report_path.empty()) {
            BuildReport::write(config.report_path, BuildReport::to_json(report));
        }

        Logger::stat("Validation took " + std::to_string(total.elapsed_sec()) + "s");
        return report.passed() ? 0 : 1;

    } catch (const std::exception& ex) {
        Logger::error(std::string("[FATAL] ") + ex.what());
        return 1;
    }
}
