#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace Lexicode {

inline std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string trim(std::string_view s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    size_t e = s.find_last_not_of(ws);
    return std::string(s.substr(b, e - b + 1));
}

/**
 * @brief Lowercase a source lemma and turn '_' separators into spaces
 */
inline std::string surface_form(std::string_view lemma) {
    std::string out = to_lower_ascii(lemma);
    std::replace(out.begin(), out.end(), '_', ' ');
    return out;
}

/**
 * @brief A surface form is kept when, ignoring spaces and hyphens, it is a
 *        non-empty run of letters
 */
inline bool is_clean_surface(std::string_view word) {
    size_t letters = 0;
    for (char ch : word) {
        if (ch == ' ' || ch == '-') continue;
        if (!std::isalpha(static_cast<unsigned char>(ch))) return false;
        ++letters;
    }
    return letters > 0;
}

/**
 * @brief Single-token word: no space, no hyphen
 */
inline bool is_single_token(std::string_view word) {
    return word.find(' ') == std::string_view::npos && word.find('-') == std::string_view::npos;
}

} // namespace Lexicode
