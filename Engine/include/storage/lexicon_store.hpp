/**
 * @file lexicon_store.hpp
 * @brief Destination for a built lexicon: lexicon, lemma_base_form, antonym and build_info tables
 */

#pragma once

#include <lexicon/lexicon_snapshot.hpp>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace Lexicode {

/**
 * @brief The destination exists but cannot be dropped (locked, in use, not ours)
 */
class DestinationUnavailable : public std::runtime_error {
public:
    DestinationUnavailable(const std::string& destination, const std::string& reason)
        : std::runtime_error("Destination '" + destination + "' unavailable: " + reason),
          destination_(destination) {}

    const std::string& destination() const { return destination_; }

private:
    std::string destination_;
};

class LexiconStore {
public:
    virtual ~LexiconStore() = default;

    /**
     * @brief Drop the destination if it exists and create it empty; makes it current
     * @throws DestinationUnavailable if an existing destination cannot be dropped
     */
    virtual void reset_destination(const std::string& name) = 0;

    /**
     * @brief Make an existing destination current for reading
     * @throws std::runtime_error if it does not exist
     */
    virtual void open_destination(const std::string& name) = 0;

    virtual const std::string& destination() const = 0;

    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    /**
     * @brief Insert-or-ignore on (word, code)
     */
    virtual void insert_entries(const std::vector<LexiconEntry>& entries) = 0;

    /**
     * @brief Rewrite the row keyed (word, old_code) to new_code
     * @return true if a row changed
     */
    virtual bool update_code(const std::string& word, const std::string& old_code, const std::string& new_code) = 0;

    virtual void insert_base_forms(const std::map<std::string, std::string>& base_forms) = 0;
    virtual void insert_antonyms(const std::vector<AntonymPair>& pairs) = 0;
    virtual void write_metadata(const std::string& key, const std::string& value) = 0;

    virtual std::vector<LexiconEntry> load_entries() = 0;
    virtual std::optional<std::string> load_metadata(const std::string& key) = 0;
};

/**
 * @brief RAII transaction guard; rolls back unless committed
 */
class StoreTransaction {
public:
    explicit StoreTransaction(LexiconStore& store);
    ~StoreTransaction();

    StoreTransaction(const StoreTransaction&) = delete;
    StoreTransaction& operator=(const StoreTransaction&) = delete;

    void commit();
    void rollback();

    /**
     * @brief Roll back and open a fresh transaction
     */
    void restart();

private:
    LexiconStore& store_;
    bool active_ = false;
};

} // namespace Lexicode
