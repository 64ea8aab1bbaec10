/**
 * @file lexicon_snapshot.hpp
 * @brief Accumulating (word, code, priority) collection passed between build stages
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Lexicode {

struct LexiconEntry {
    std::string word;
    std::string code;
    uint32_t priority = 0;

    bool operator==(const LexiconEntry& o) const {
        return word == o.word && code == o.code && priority == o.priority;
    }
};

/**
 * @brief Point update of one stored row, addressed by its exact old code
 */
struct CodeUpdate {
    std::string word;
    std::string old_code;
    std::string new_code;
};

struct AntonymPair {
    std::string word;
    std::string antonym;

    bool operator<(const AntonymPair& o) const {
        return word != o.word ? word < o.word : antonym < o.antonym;
    }
    bool operator==(const AntonymPair& o) const { return word == o.word && antonym == o.antonym; }
};

/**
 * @brief Entries in insertion order with (word, code) uniqueness
 *
 * Copies are independent, so every stage can take a snapshot by const
 * reference and return a new one.
 */
class LexiconSnapshot {
public:
    /**
     * @brief Insert-or-ignore: the first row for a (word, code) key stays
     * @return true if the row was added
     */
    bool insert(LexiconEntry entry);

    /**
     * @brief Rewrite the code of the row keyed (word, old_code)
     * @return false if no such row exists
     * @throws std::runtime_error if (word, new_code) is already present
     */
    bool update_code(const std::string& word, const std::string& old_code, const std::string& new_code);

    bool contains(const std::string& word) const { return by_word_.count(word) > 0; }
    bool contains(const std::string& word, const std::string& code) const;

    /**
     * @brief Codes of a word in insertion order
     */
    std::vector<std::string> codes_for(const std::string& word) const;

    /**
     * @brief Highest-priority row of a word, first inserted on ties
     */
    std::optional<LexiconEntry> primary(const std::string& word) const;

    const std::vector<LexiconEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    size_t word_count() const { return by_word_.size(); }
    size_t code_count() const;

    /**
     * @brief Words in first-insertion order
     */
    const std::vector<std::string>& words() const { return word_order_; }

    /**
     * @brief BLAKE3 fingerprint of the sorted rows, see fingerprint_rows()
     */
    std::string fingerprint() const;

private:
    static std::string key_of(const std::string& word, const std::string& code);

    std::vector<LexiconEntry> entries_;
    std::vector<std::string> word_order_;
    std::unordered_map<std::string, std::vector<size_t>> by_word_;
    std::unordered_map<std::string, size_t> by_key_;
};

/**
 * @brief 128-bit hex BLAKE3 digest of rows sorted by (word, code, priority)
 *
 * Independent of insertion order; equal row sets give equal fingerprints.
 */
std::string fingerprint_rows(std::vector<LexiconEntry> rows);

} // namespace Lexicode
