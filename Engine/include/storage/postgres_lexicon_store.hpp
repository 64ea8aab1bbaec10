/**
 * @file postgres_lexicon_store.hpp
 * @brief LexiconStore over one PostgreSQL schema per destination
 *
 * Tables (inside schema <destination>):
 *   lexicon(word, code, priority)  PRIMARY KEY (word, code), index on word
 *   lemma_base_form(word, lemma)   PRIMARY KEY (word), index on lemma
 *   antonym(word, antonym)         PRIMARY KEY (word, antonym)
 *   build_info(key, value)         PRIMARY KEY (key)
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <storage/lexicon_store.hpp>

namespace Lexicode {

class PostgresLexiconStore : public LexiconStore {
public:
    PostgresLexiconStore(PostgresConnection& db, int lock_timeout_ms);

    /**
     * @brief SQLSTATEs meaning "exists but cannot be dropped now"
     *
     * 42501 insufficient_privilege, 55P03 lock_not_available,
     * 55006 object_in_use, 2BP01 dependent_objects_still_exist
     */
    static bool is_unavailable_state(const std::string& sqlstate);

    void reset_destination(const std::string& name) override;
    void open_destination(const std::string& name) override;
    const std::string& destination() const override { return schema_; }

    void begin() override { db_.begin(); }
    void commit() override { db_.commit(); }
    void rollback() override { db_.rollback(); }

    void insert_entries(const std::vector<LexiconEntry>& entries) override;
    bool update_code(const std::string& word, const std::string& old_code, const std::string& new_code) override;
    void insert_base_forms(const std::map<std::string, std::string>& base_forms) override;
    void insert_antonyms(const std::vector<AntonymPair>& pairs) override;
    void write_metadata(const std::string& key, const std::string& value) override;

    std::vector<LexiconEntry> load_entries() override;
    std::optional<std::string> load_metadata(const std::string& key) override;

private:
    std::string table(const std::string& name) const;
    void create_tables();

    PostgresConnection& db_;
    int lock_timeout_ms_;
    std::string schema_;
};

} // namespace Lexicode
