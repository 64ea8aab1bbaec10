#include <validate/validator.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <cstdio>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace Lexicode {

namespace {

using CodeSets = std::map<std::string, std::set<std::string>>;

CodeSets codes_by_word(const std::vector<LexiconEntry>& rows) {
    CodeSets out;
    for (const auto& r : rows) out[r.word].insert(r.code);
    return out;
}

std::string percent(size_t part, size_t whole) {
    if (whole == 0) return "0.0%";
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.1f%%", 100.0 * static_cast<double>(part) / static_cast<double>(whole));
    return buf;
}

} // namespace

bool ValidationReport::passed() const {
    for (const auto& c : checks) {
        if (c.severity == Severity::Hard && !c.passed) return false;
    }
    return true;
}

size_t ValidationReport::issue_count() const {
    size_t n = 0;
    for (const auto& c : checks) {
        if (c.severity == Severity::Hard && !c.passed) n += c.issues.size();
    }
    return n;
}

const std::vector<std::string>& Validator::sample_words() {
    static const std::vector<std::string> words = {
        "run", "happy", "tree", "think", "beautiful", "love",
        "computer", "music", "quickly", "dog", "house", "idea",
    };
    return words;
}

CheckResult Validator::check_determinism(const std::vector<LexiconEntry>& rows,
                                         const std::optional<std::vector<LexiconEntry>>& reference,
                                         const std::optional<std::string>& recorded_fingerprint) {
    CheckResult result{"determinism", Severity::Hard};

    if (reference) {
        CodeSets stored = codes_by_word(rows);
        CodeSets rebuilt = codes_by_word(*reference);
        for (const auto& [word, codes] : stored) {
            auto it = rebuilt.find(word);
            if (it == rebuilt.end()) result.issues.push_back("Non-deterministic: '" + word + "' missing from rebuild");
            else if (it->second != codes) result.issues.push_back("Non-deterministic: '" + word + "' has different codes");
        }
        for (const auto& [word, codes] : rebuilt) {
            if (!stored.count(word)) result.issues.push_back("Non-deterministic: '" + word + "' only in rebuild");
        }
        result.passed = result.issues.empty();
        result.notes.push_back(std::to_string(stored.size()) + " words compared against a rebuild");
        return result;
    }

    if (recorded_fingerprint) {
        std::string actual = fingerprint_rows(rows);
        if (actual != *recorded_fingerprint) {
            result.passed = false;
            result.issues.push_back("Fingerprint mismatch: recorded " + *recorded_fingerprint + ", stored rows " + actual);
        } else {
            result.notes.push_back("Fingerprint " + actual + " matches build_info");
        }
        return result;
    }

    result.notes.push_back("No rebuild or recorded fingerprint; determinism not verified");
    return result;
}

CheckResult Validator::check_format(const std::vector<LexiconEntry>& rows) {
    CheckResult result{"code format", Severity::Hard};
    std::set<std::string> distinct;
    for (const auto& r : rows) distinct.insert(r.code);

    size_t valid = 0;
    for (const auto& code : distinct) {
        if (is_valid_code(code)) ++valid;
        else result.issues.push_back("Invalid format: " + code);
    }
    result.passed = result.issues.empty();
    result.notes.push_back(std::to_string(valid) + " of " + std::to_string(distinct.size()) + " codes valid");
    return result;
}

CheckResult Validator::check_key_uniqueness(const std::vector<LexiconEntry>& rows) {
    CheckResult result{"key uniqueness", Severity::Hard};
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& r : rows) {
        if (!seen.emplace(r.word, r.code).second) {
            result.issues.push_back("Duplicate key: (" + r.word + ", " + r.code + ")");
        }
    }
    result.passed = result.issues.empty();
    return result;
}

CheckResult Validator::check_override_precedence(const std::vector<LexiconEntry>& rows, const OverrideTable& overrides) {
    CheckResult result{"override precedence", Severity::Hard};
    size_t checked = 0;
    for (const auto& r : rows) {
        auto forced = overrides.find(r.word);
        if (!forced) continue;
        ++checked;
        auto code = Code::parse(r.code);
        if (!code || code->valence != *forced) {
            result.issues.push_back("Override ignored: '" + r.word + "' " + r.code + " should carry valence " +
                                    std::to_string(static_cast<int>(*forced)));
        }
    }
    result.passed = result.issues.empty();
    result.notes.push_back(std::to_string(checked) + " override rows checked");
    return result;
}

CheckResult Validator::pos_distribution(const std::vector<LexiconEntry>& rows) {
    CheckResult result{"POS distribution", Severity::Advisory};
    std::map<int, size_t> counts;
    for (const auto& r : rows) {
        if (auto code = Code::parse(r.code)) ++counts[static_cast<int>(code->pos)];
    }
    std::vector<std::pair<int, size_t>> sorted(counts.begin(), counts.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    for (const auto& [pos, count] : sorted) {
        result.notes.push_back(std::string(pos_name(static_cast<PartOfSpeech>(pos))) + ": " +
                               std::to_string(count) + " (" + percent(count, rows.size()) + ")");
    }
    return result;
}

CheckResult Validator::superclass_distribution(const std::vector<LexiconEntry>& rows) {
    CheckResult result{"superclass distribution", Severity::Advisory};
    std::map<std::string, size_t> counts;
    for (const auto& r : rows) ++counts[r.code.substr(0, 4)];

    std::vector<std::pair<std::string, size_t>> sorted(counts.begin(), counts.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    for (size_t i = 0; i < sorted.size() && i < TOP_SUPERCLASSES; ++i) {
        result.notes.push_back(sorted[i].first + ": " + std::to_string(sorted[i].second));
    }
    result.notes.push_back("Total superclasses: " + std::to_string(counts.size()));
    return result;
}

CheckResult Validator::polysemy(const std::vector<LexiconEntry>& rows) {
    CheckResult result{"polysemy", Severity::Advisory};
    std::map<std::string, size_t> senses;
    for (const auto& r : rows) ++senses[r.word];

    std::vector<std::pair<std::string, size_t>> sorted(senses.begin(), senses.end());
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
    for (size_t i = 0; i < sorted.size() && i < TOP_POLYSEMOUS; ++i) {
        result.notes.push_back("'" + sorted[i].first + "': " + std::to_string(sorted[i].second) + " senses");
    }

    std::map<size_t, size_t> histogram;
    for (const auto& [word, count] : senses) ++histogram[count];
    size_t shown = 0;
    for (const auto& [count, words] : histogram) {
        if (shown++ == TOP_POLYSEMOUS) break;
        result.notes.push_back(std::to_string(count) + " sense(s): " + std::to_string(words) + " words");
    }
    return result;
}

CheckResult Validator::sample_lookups(const std::vector<LexiconEntry>& rows, const std::vector<std::string>& words) {
    CheckResult result{"sample lookups", Severity::Advisory};
    std::unordered_set<std::string> wanted(words.begin(), words.end());
    std::unordered_map<std::string, std::vector<const LexiconEntry*>> hits;
    for (const auto& r : rows) {
        if (wanted.count(r.word)) hits[r.word].push_back(&r);
    }

    for (const auto& word : words) {
        auto it = hits.find(word);
        if (it == hits.end()) {
            result.issues.push_back("Word not found: " + word);
            result.notes.push_back("'" + word + "': NOT FOUND");
            continue;
        }
        const LexiconEntry* best = it->second.front();
        for (const auto* e : it->second) {
            if (e->priority > best->priority) best = e;
        }
        result.notes.push_back("'" + word + "': " + std::to_string(it->second.size()) + " code(s) - " + best->code);
    }
    return result;
}

ValidationReport Validator::run(const ValidationInput& input) {
    ValidationReport report;
    report.mappings = input.rows.size();
    std::unordered_set<std::string> words;
    for (const auto& r : input.rows) words.insert(r.word);
    report.words = words.size();

    report.checks.push_back(check_determinism(input.rows, input.reference, input.recorded_fingerprint));
    report.checks.push_back(check_format(input.rows));
    report.checks.push_back(check_key_uniqueness(input.rows));
    if (input.overrides) {
        report.checks.push_back(check_override_precedence(input.rows, *input.overrides));
    }
    report.checks.push_back(pos_distribution(input.rows));
    report.checks.push_back(superclass_distribution(input.rows));
    report.checks.push_back(polysemy(input.rows));
    report.checks.push_back(sample_lookups(input.rows));
    return report;
}

void Validator::log(const ValidationReport& report) {
    Logger::info("Lexicon validation");
    Logger::stat("Words: " + std::to_string(report.words));
    Logger::stat("Mappings: " + std::to_string(report.mappings));

    size_t index = 0;
    for (const auto& check : report.checks) {
        Logger::step("[" + std::to_string(++index) + "] " + check.name);
        for (const auto& note : check.notes) Logger::stat(note);
        if (check.severity == Severity::Hard && !check.passed) {
            Logger::error("FAILED: " + std::to_string(check.issues.size()) + " issues");
        } else if (!check.issues.empty()) {
            Logger::warn(std::to_string(check.issues.size()) + " advisory issues");
        } else {
            Logger::success("PASSED");
        }
    }

    if (report.passed()) {
        Logger::success("VALIDATION PASSED");
        return;
    }

    Logger::error("VALIDATION FAILED");
    Logger::error("Issues found: " + std::to_string(report.issue_count()));
    size_t logged = 0;
    for (const auto& check : report.checks) {
        if (check.severity != Severity::Hard || check.passed) continue;
        for (const auto& issue : check.issues) {
            if (logged++ == MAX_LOGGED_ISSUES) return;
            Logger::error("  - " + issue);
        }
    }
}

} // namespace Lexicode
