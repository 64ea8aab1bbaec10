/**
 * @file memory_lexicon_store.hpp
 * @brief In-process LexiconStore used by --dry-run and the tests
 */

#pragma once

#include <storage/lexicon_store.hpp>
#include <set>
#include <unordered_set>

namespace Lexicode {

class MemoryLexiconStore : public LexiconStore {
public:
    struct Destination {
        LexiconSnapshot lexicon;
        std::map<std::string, std::string> base_forms;
        std::set<AntonymPair> antonyms;
        std::map<std::string, std::string> metadata;
    };

    /**
     * @brief Create @p name if absent and refuse to drop it from now on
     */
    void lock_destination(const std::string& name);
    void unlock_destination(const std::string& name);

    bool has_destination(const std::string& name) const { return committed_.count(name) > 0; }

    /**
     * @brief Committed state of a destination
     * @throws std::out_of_range if it does not exist
     */
    const Destination& committed(const std::string& name) const { return committed_.at(name); }

    bool in_transaction() const { return working_.has_value(); }

    void reset_destination(const std::string& name) override;
    void open_destination(const std::string& name) override;
    const std::string& destination() const override { return current_; }

    void begin() override;
    void commit() override;
    void rollback() override;

    void insert_entries(const std::vector<LexiconEntry>& entries) override;
    bool update_code(const std::string& word, const std::string& old_code, const std::string& new_code) override;
    void insert_base_forms(const std::map<std::string, std::string>& base_forms) override;
    void insert_antonyms(const std::vector<AntonymPair>& pairs) override;
    void write_metadata(const std::string& key, const std::string& value) override;

    std::vector<LexiconEntry> load_entries() override;
    std::optional<std::string> load_metadata(const std::string& key) override;

private:
    using Destinations = std::map<std::string, Destination>;

    Destination& writable();
    const Destination& readable() const;

    Destinations committed_;
    std::optional<Destinations> working_;
    std::unordered_set<std::string> locked_;
    std::string current_;
};

} // namespace Lexicode
