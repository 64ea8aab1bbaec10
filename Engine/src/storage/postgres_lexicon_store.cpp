#include <storage/postgres_lexicon_store.hpp>
#include <database/bulk_copy.hpp>

namespace Lexicode {

PostgresLexiconStore::PostgresLexiconStore(PostgresConnection& db, int lock_timeout_ms)
    : db_(db), lock_timeout_ms_(lock_timeout_ms) {}

bool PostgresLexiconStore::is_unavailable_state(const std::string& sqlstate) {
    return sqlstate == "42501" || sqlstate == "55P03" || sqlstate == "55006" || sqlstate == "2BP01";
}

std::string PostgresLexiconStore::table(const std::string& name) const {
    return BulkCopy::quote_identifier(schema_) + "." + BulkCopy::quote_identifier(name);
}

void PostgresLexiconStore::reset_destination(const std::string& name) {
    std::string schema = BulkCopy::quote_identifier(name);
    try {
        db_.execute("SET LOCAL lock_timeout = " + std::to_string(lock_timeout_ms_));
        db_.execute("DROP SCHEMA IF EXISTS " + schema + " CASCADE");
    } catch (const DatabaseError& e) {
        if (is_unavailable_state(e.sqlstate())) {
            throw DestinationUnavailable(name, e.what());
        }
        throw;
    }

    db_.execute("CREATE SCHEMA " + schema);
    schema_ = name;
    create_tables();
}

void PostgresLexiconStore::create_tables() {
    db_.execute("CREATE TABLE " + table("lexicon") + " ("
                "word TEXT NOT NULL, "
                "code TEXT NOT NULL, "
                "priority INTEGER NOT NULL DEFAULT 0, "
                "PRIMARY KEY (word, code))");
    db_.execute("CREATE INDEX idx_lexicon_word ON " + table("lexicon") + " (word)");

    db_.execute("CREATE TABLE " + table("lemma_base_form") + " ("
                "word TEXT PRIMARY KEY, "
                "lemma TEXT NOT NULL)");
    db_.execute("CREATE INDEX idx_lemma_base_form_lemma ON " + table("lemma_base_form") + " (lemma)");

    db_.execute("CREATE TABLE " + table("antonym") + " ("
                "word TEXT NOT NULL, "
                "antonym TEXT NOT NULL, "
                "PRIMARY KEY (word, antonym))");

    db_.execute("CREATE TABLE " + table("build_info") + " ("
                "key TEXT PRIMARY KEY, "
                "value TEXT NOT NULL)");
}

void PostgresLexiconStore::open_destination(const std::string& name) {
    auto found = db_.query_single("SELECT 1 FROM information_schema.schemata WHERE schema_name = $1", {name});
    if (!found) {
        throw std::runtime_error("Destination '" + name + "' does not exist");
    }
    schema_ = name;
}

void PostgresLexiconStore::insert_entries(const std::vector<LexiconEntry>& entries) {
    BulkCopy copy(db_, "ON CONFLICT (word, code) DO NOTHING");
    copy.begin_table(schema_ + ".lexicon", {"word", "code", "priority"});
    for (const auto& e : entries) {
        copy.add_row({e.word, e.code, std::to_string(e.priority)});
    }
    copy.flush();
}

bool PostgresLexiconStore::update_code(const std::string& word, const std::string& old_code,
                                       const std::string& new_code) {
    long changed = db_.execute_count("UPDATE " + table("lexicon") + " SET code = $1 WHERE word = $2 AND code = $3",
                                     {new_code, word, old_code});
    return changed > 0;
}

void PostgresLexiconStore::insert_base_forms(const std::map<std::string, std::string>& base_forms) {
    BulkCopy copy(db_, "ON CONFLICT (word) DO NOTHING");
    copy.begin_table(schema_ + ".lemma_base_form", {"word", "lemma"});
    for (const auto& [word, lemma] : base_forms) {
        copy.add_row({word, lemma});
    }
    copy.flush();
}

void PostgresLexiconStore::insert_antonyms(const std::vector<AntonymPair>& pairs) {
    BulkCopy copy(db_, "ON CONFLICT (word, antonym) DO NOTHING");
    copy.begin_table(schema_ + ".antonym", {"word", "antonym"});
    for (const auto& pair : pairs) {
        copy.add_row({pair.word, pair.antonym});
    }
    copy.flush();
}

void PostgresLexiconStore::write_metadata(const std::string& key, const std::string& value) {
    db_.execute("INSERT INTO " + table("build_info") + " (key, value) VALUES ($1, $2) "
                "ON CONFLICT (key) DO UPDATE SET value = EXCLUDED.value",
                {key, value});
}

std::vector<LexiconEntry> PostgresLexiconStore::load_entries() {
    std::vector<LexiconEntry> entries;
    db_.query("SELECT word, code, priority FROM " + table("lexicon") + " ORDER BY word, code", {},
              [&](const PostgresConnection::Row& row) {
                  LexiconEntry e;
                  e.word = row[0];
                  e.code = row[1];
                  e.priority = static_cast<uint32_t>(std::stoul(row[2]));
                  entries.push_back(std::move(e));
              });
    return entries;
}

std::optional<std::string> PostgresLexiconStore::load_metadata(const std::string& key) {
    return db_.query_single("SELECT value FROM " + table("build_info") + " WHERE key = $1", {key});
}

} // namespace Lexicode
