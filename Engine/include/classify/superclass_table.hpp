/**
 * @file superclass_table.hpp
 * @brief Curated concept-name -> 4-digit superclass code table and POS fallbacks
 */

#pragma once

#include <lexicon/code.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace Lexicode {

/**
 * @brief Immutable superclass lookup keyed by concept name ("layoff.n.01")
 */
class SuperclassTable {
public:
    using Map = std::unordered_map<std::string, std::string>;

    SuperclassTable() = default;

    /**
     * @throws std::invalid_argument if a code is not exactly four digits
     */
    explicit SuperclassTable(Map entries);

    /**
     * @brief The curated default table (about 300 roots across the four POS ranges)
     */
    static SuperclassTable defaults();

    std::optional<std::string> lookup(const std::string& concept_name) const;

    bool contains(const std::string& concept_name) const { return entries_.count(concept_name) > 0; }
    size_t size() const { return entries_.size(); }
    const Map& entries() const { return entries_; }

private:
    Map entries_;
};

/**
 * @brief Superclass used when no ancestor is in the table
 */
struct PosFallbacks {
    std::string noun = "0999";
    std::string verb = "2999";
    std::string adjective = "3999";
    std::string adverb = "4999";

    const std::string& code_for(PartOfSpeech pos) const;
};

} // namespace Lexicode
