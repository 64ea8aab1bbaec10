/**
 * @file code_encoder.hpp
 * @brief Per-superclass local sequence allocation and sense priority
 */

#pragma once

#include <lexicon/code.hpp>
#include <cstdint>
#include <map>
#include <string>

namespace Lexicode {

/**
 * @brief Hands out local sequence numbers 1, 2, 3... per superclass in call order
 */
class CodeEncoder {
public:
    /**
     * @brief Next local sequence for @p superclass
     * @throws std::overflow_error past MAX_LOCAL_SEQUENCE
     */
    uint32_t allocate(const std::string& superclass);

    /**
     * @brief Allocate a sequence and build the code
     */
    Code encode(const std::string& superclass, PartOfSpeech pos, Abstractness abstractness, Valence valence);

    uint32_t current(const std::string& superclass) const;

    /**
     * @brief Concepts per superclass so far
     */
    const std::map<std::string, uint32_t>& counters() const { return counters_; }

    void reset() { counters_.clear(); }

private:
    std::map<std::string, uint32_t> counters_;
};

/**
 * @brief Tie-break score for picking a word's primary sense
 *
 * priority = frequency + 10000 * specific + max(0, 10 - ordinal)
 */
struct PriorityRanker {
    static constexpr uint32_t SPECIFIC_BONUS = 10000;
    static constexpr uint32_t ORDINAL_BONUS = 10;

    static uint32_t rank(uint32_t frequency, bool specific_superclass, uint32_t ordinal);
};

} // namespace Lexicode
