#include <lexicon/code.hpp>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace Lexicode {

Valence opposite(Valence v) {
    switch (v) {
        case Valence::Positive: return Valence::Negative;
        case Valence::Negative: return Valence::Positive;
        case Valence::Neutral:  return Valence::Neutral;
    }
    return Valence::Neutral;
}

const char* valence_label(Valence v) {
    switch (v) {
        case Valence::Positive: return "pos";
        case Valence::Negative: return "neg";
        case Valence::Neutral:  return "neu";
    }
    return "neu";
}

char pos_letter(PartOfSpeech pos) {
    switch (pos) {
        case PartOfSpeech::Noun:      return 'n';
        case PartOfSpeech::Verb:      return 'v';
        case PartOfSpeech::Adjective: return 'a';
        case PartOfSpeech::Adverb:    return 'r';
    }
    return 'n';
}

const char* pos_name(PartOfSpeech pos) {
    switch (pos) {
        case PartOfSpeech::Noun:      return "Nouns";
        case PartOfSpeech::Verb:      return "Verbs";
        case PartOfSpeech::Adjective: return "Adjectives";
        case PartOfSpeech::Adverb:    return "Adverbs";
    }
    return "Unknown";
}

std::optional<PartOfSpeech> pos_from_letter(char letter) {
    switch (letter) {
        case 'n': return PartOfSpeech::Noun;
        case 'v': return PartOfSpeech::Verb;
        case 'a':
        case 's': return PartOfSpeech::Adjective;
        case 'r': return PartOfSpeech::Adverb;
        default:  return std::nullopt;
    }
}

bool is_valid_code(std::string_view text) {
    static const std::regex pattern(CODE_PATTERN);
    return std::regex_match(text.begin(), text.end(), pattern);
}

bool is_superclass_code(std::string_view text) {
    if (text.size() != 4) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

std::string Code::to_string() const {
    if (!is_superclass_code(superclass)) {
        throw std::invalid_argument("Invalid superclass code: '" + superclass + "'");
    }
    if (local_seq > MAX_LOCAL_SEQUENCE) {
        throw std::invalid_argument("Local sequence out of range: " + std::to_string(local_seq));
    }

    std::ostringstream ss;
    ss << superclass << '-'
       << std::setw(5) << std::setfill('0') << local_seq << '-'
       << static_cast<int>(pos) << '-'
       << static_cast<int>(abstractness) << '-'
       << static_cast<int>(valence);

    std::string out = ss.str();
    if (!is_valid_code(out)) {
        throw std::invalid_argument("Code fields out of domain: " + out);
    }
    return out;
}

std::optional<Code> Code::parse(std::string_view text) {
    if (!is_valid_code(text)) return std::nullopt;

    // Layout is fixed once the pattern matched: 0..3, 5..9, 11, 13, 15
    Code code;
    code.superclass = std::string(text.substr(0, 4));
    code.local_seq = static_cast<uint32_t>(std::stoul(std::string(text.substr(5, 5))));
    code.pos = static_cast<PartOfSpeech>(text[11] - '0');
    code.abstractness = static_cast<Abstractness>(text[13] - '0');
    code.valence = static_cast<Valence>(text[15] - '0');
    return code;
}

Code Code::from_string(std::string_view text) {
    auto code = parse(text);
    if (!code) {
        throw std::invalid_argument("Malformed code: '" + std::string(text) + "'");
    }
    return *code;
}

Valence code_valence(std::string_view code) {
    if (!is_valid_code(code)) {
        throw std::invalid_argument("Malformed code: '" + std::string(code) + "'");
    }
    return static_cast<Valence>(code.back() - '0');
}

std::string recode_valence(std::string_view code, Valence v) {
    if (!is_valid_code(code)) {
        throw std::invalid_argument("Malformed code: '" + std::string(code) + "'");
    }
    std::string out(code);
    out.back() = static_cast<char>('0' + static_cast<int>(v));
    return out;
}

} // namespace Lexicode
