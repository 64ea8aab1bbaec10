/**
 * @file code.hpp
 * @brief Semantic classification code (HHHH-LLLLL-P-A-V) and its digit domains
 *
 * The canonical string form is the on-disk contract for every consumer:
 *   superclass (4 digits) - local sequence (5 digits) - pos [1-4] -
 *   abstractness [0-2] - valence [0-2]
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace Lexicode {

enum class PartOfSpeech : uint8_t {
    Noun = 1,
    Verb = 2,
    Adjective = 3,   // includes satellite adjectives
    Adverb = 4
};

enum class Abstractness : uint8_t {
    Concrete = 0,
    Mixed = 1,
    Abstract = 2
};

enum class Valence : uint8_t {
    Neutral = 0,
    Positive = 1,
    Negative = 2
};

/**
 * @brief 1 <-> 2, neutral stays neutral
 */
Valence opposite(Valence v);

/**
 * @brief Short label used in reports: neu / pos / neg
 */
const char* valence_label(Valence v);

/**
 * @brief WordNet file letter: n, v, a, r
 */
char pos_letter(PartOfSpeech pos);

const char* pos_name(PartOfSpeech pos);

/**
 * @brief Map a WordNet ss_type letter (n, v, a, s, r) to the pos enum
 */
std::optional<PartOfSpeech> pos_from_letter(char letter);

constexpr uint32_t MAX_LOCAL_SEQUENCE = 99999;

/**
 * @brief Regular expression every stored code must match
 */
inline constexpr const char* CODE_PATTERN = R"(^\d{4}-\d{5}-[1-4]-[0-2]-[0-2]$)";

/**
 * @brief True when @p text matches CODE_PATTERN
 */
bool is_valid_code(std::string_view text);

/**
 * @brief True for exactly four ASCII digits
 */
bool is_superclass_code(std::string_view text);

struct Code {
    std::string superclass;          // "0233"
    uint32_t local_seq = 0;          // 1..99999
    PartOfSpeech pos = PartOfSpeech::Noun;
    Abstractness abstractness = Abstractness::Mixed;
    Valence valence = Valence::Neutral;

    /**
     * @brief Canonical "HHHH-LLLLL-P-A-V" form
     * @throws std::invalid_argument if a field is outside its domain
     */
    std::string to_string() const;

    /**
     * @brief Parse a canonical code; nullopt for anything failing CODE_PATTERN
     */
    static std::optional<Code> parse(std::string_view text);

    /**
     * @brief Parse or throw std::invalid_argument
     */
    static Code from_string(std::string_view text);

    Code with_valence(Valence v) const {
        Code copy = *this;
        copy.valence = v;
        return copy;
    }

    bool operator==(const Code& o) const {
        return superclass == o.superclass && local_seq == o.local_seq && pos == o.pos &&
               abstractness == o.abstractness && valence == o.valence;
    }
    bool operator!=(const Code& o) const { return !(*this == o); }
};

/**
 * @brief Valence digit of a canonical code string (last field)
 * @throws std::invalid_argument for malformed codes
 */
Valence code_valence(std::string_view code);

/**
 * @brief Replace the valence digit of a canonical code string
 * @throws std::invalid_argument for malformed codes
 */
std::string recode_valence(std::string_view code, Valence v);

} // namespace Lexicode
