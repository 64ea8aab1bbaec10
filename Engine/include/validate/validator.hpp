/**
 * @file validator.hpp
 * @brief Post-build consistency checks over stored lexicon rows
 */

#pragma once

#include <classify/valence_resolver.hpp>
#include <lexicon/lexicon_snapshot.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Lexicode {

enum class Severity {
    Hard,       // a failure makes the lexicon unfit for use
    Advisory    // informational, never fails
};

struct CheckResult {
    std::string name;
    Severity severity = Severity::Advisory;
    bool passed = true;
    std::vector<std::string> issues;
    std::vector<std::string> notes;
};

struct ValidationInput {
    std::vector<LexiconEntry> rows;
    std::optional<std::vector<LexiconEntry>> reference;   // rows of an independent rebuild
    std::optional<std::string> recorded_fingerprint;      // build_info.fingerprint
    const OverrideTable* overrides = nullptr;
};

struct ValidationReport {
    size_t words = 0;
    size_t mappings = 0;
    std::vector<CheckResult> checks;

    /**
     * @brief AND over the hard checks
     */
    bool passed() const;

    size_t issue_count() const;
};

class Validator {
public:
    static constexpr size_t MAX_LOGGED_ISSUES = 10;
    static constexpr size_t TOP_SUPERCLASSES = 15;
    static constexpr size_t TOP_POLYSEMOUS = 10;

    static const std::vector<std::string>& sample_words();

    static CheckResult check_determinism(const std::vector<LexiconEntry>& rows,
                                         const std::optional<std::vector<LexiconEntry>>& reference,
                                         const std::optional<std::string>& recorded_fingerprint);
    static CheckResult check_format(const std::vector<LexiconEntry>& rows);
    static CheckResult check_key_uniqueness(const std::vector<LexiconEntry>& rows);
    static CheckResult check_override_precedence(const std::vector<LexiconEntry>& rows, const OverrideTable& overrides);

    static CheckResult pos_distribution(const std::vector<LexiconEntry>& rows);
    static CheckResult superclass_distribution(const std::vector<LexiconEntry>& rows);
    static CheckResult polysemy(const std::vector<LexiconEntry>& rows);
    static CheckResult sample_lookups(const std::vector<LexiconEntry>& rows,
                                      const std::vector<std::string>& words = sample_words());

    /**
     * @brief Every check; override precedence only when overrides are given
     */
    static ValidationReport run(const ValidationInput& input);

    /**
     * @brief Print each check's notes and a pass/fail summary with at most MAX_LOGGED_ISSUES issues
     */
    static void log(const ValidationReport& report);
};

} // namespace Lexicode
