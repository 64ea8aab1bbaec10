/**
 * @file morphy.hpp
 * @brief WordNet morphy noun base-form lookup (exception list + detachment rules)
 */

#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Lexicode {

class Morphy {
public:
    using ExceptionMap = std::unordered_map<std::string, std::vector<std::string>>;

    Morphy() = default;
    Morphy(std::unordered_set<std::string> noun_lemmas, ExceptionMap exceptions);

    /**
     * @brief Read the noun lemma set from index.noun and the exception list from noun.exc
     * @throws std::runtime_error if index.noun cannot be opened (noun.exc is optional)
     */
    static Morphy load_nouns(const std::string& dict_dir);

    /**
     * @brief Known noun lemmas reachable from @p form, in morphy order
     */
    std::vector<std::string> candidates(const std::string& form) const;

    /**
     * @brief Shortest candidate (first on ties), or @p form itself when there is none
     */
    std::string base_form(const std::string& form) const;

    size_t lemma_count() const { return lemmas_.size(); }
    size_t exception_count() const { return exceptions_.size(); }

private:
    std::vector<std::string> filter(const std::vector<std::string>& forms) const;
    static std::vector<std::string> apply_rules(const std::vector<std::string>& forms);

    std::unordered_set<std::string> lemmas_;
    ExceptionMap exceptions_;
};

} // namespace Lexicode
