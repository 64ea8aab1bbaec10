#include <report/build_report.hpp>
#include <utils/logger.hpp>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace Lexicode {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

std::string pad_right(const std::string& s, size_t width) {
    return s.size() >= width ? s : s + std::string(width - s.size(), ' ');
}

std::string bar(double pct) {
    std::string out;
    for (int i = 0; i < static_cast<int>(pct / 2); ++i) out += "█";
    return out;
}

} // namespace

const std::vector<std::string>& BuildReport::sample_words() {
    static const std::vector<std::string> words = {
        "layoff", "fired", "happy", "sad", "worried", "fear", "angry",
        "manager", "salary", "stress", "anxiety", "love", "hate",
    };
    return words;
}

void BuildReport::log_summary(const BuildResult& result, const WriteOutcome* outcome) {
    const BuildStats& s = result.stats;

    Logger::info("BUILD SUMMARY");
    Logger::stat("Output: " + (outcome ? outcome->destination : std::string("(in memory)")) +
                 (outcome && outcome->redirected ? " [redirected]" : ""));
    Logger::stat("Unique words: " + std::to_string(s.unique_words));
    Logger::stat("Unique codes: " + std::to_string(s.unique_codes));
    Logger::stat("Total mappings: " + std::to_string(s.entries));
    Logger::stat("Lemma mappings: " + std::to_string(s.lemma_mappings));
    Logger::stat("Antonym pairs: " + std::to_string(s.antonym_pairs));
    if (s.unique_words > 0) {
        Logger::stat("Avg codes/word: " + fixed(static_cast<double>(s.entries) / s.unique_words, 2));
    }
    Logger::stat("Antonym flips: " + std::to_string(s.antonym_flips) + " codes in " +
                 std::to_string(s.antonym_words) + " words");
    Logger::stat("Override hits: " + std::to_string(s.override_hits) + ", terminal rewrites: " +
                 std::to_string(s.override_rewrites));
    Logger::stat("Fallbacks: hierarchy " + std::to_string(s.hierarchy_fallbacks) + ", sentiment misses " +
                 std::to_string(s.sentiment_misses) + ", dropped forms " + std::to_string(s.dropped_surface_forms));

    Logger::info("Valence distribution (per concept)");
    size_t total = s.valence.total();
    const std::pair<const char*, size_t> rows[] = {
        {"positive", s.valence.positive},
        {"negative", s.valence.negative},
        {"neutral", s.valence.neutral},
    };
    for (const auto& [label, count] : rows) {
        double pct = total ? 100.0 * static_cast<double>(count) / static_cast<double>(total) : 0.0;
        Logger::stat(pad_right(label, 10) + " " + std::to_string(count) + " (" + fixed(pct, 1) + "%) " + bar(pct));
    }
    Logger::stat("signal: strong " + std::to_string(s.valence.strong) + ", weak " + std::to_string(s.valence.weak) +
                 ", faint " + std::to_string(s.valence.faint));

    Logger::info("Top 15 superclasses");
    for (const auto& [code, count] : s.top_superclasses(15)) {
        Logger::stat(code + ": " + std::to_string(count));
    }

    Logger::info("Sample entries");
    for (const auto& word : sample_words()) {
        auto entry = result.final_snapshot.primary(word);
        if (!entry) {
            Logger::stat(pad_right(word, 12) + " NOT FOUND");
            continue;
        }
        Logger::stat(pad_right(word, 12) + " " + entry->code + " [" + valence_label(code_valence(entry->code)) + "]");
    }

    for (const auto& [phase, ms] : s.phases) {
        Logger::stat("Phase " + phase + ": " + fixed(ms, 1) + " ms");
    }
}

nlohmann::json BuildReport::to_json(const BuildResult& result, const WriteOutcome* outcome) {
    const BuildStats& s = result.stats;
    nlohmann::json doc;

    doc["fingerprint"] = result.final_snapshot.fingerprint();
    if (outcome) {
        doc["destination"] = outcome->destination;
        doc["redirected"] = outcome->redirected;
    }

    doc["totals"] = {
        {"concepts", s.concepts},
        {"entries", s.entries},
        {"unique_words", s.unique_words},
        {"unique_codes", s.unique_codes},
        {"lemma_mappings", s.lemma_mappings},
        {"antonym_pairs", s.antonym_pairs},
    };
    doc["valence"] = {
        {"positive", s.valence.positive},
        {"negative", s.valence.negative},
        {"neutral", s.valence.neutral},
        {"strong", s.valence.strong},
        {"weak", s.valence.weak},
        {"faint", s.valence.faint},
    };
    doc["stages"] = {
        {"antonym_flips", s.antonym_flips},
        {"antonym_words", s.antonym_words},
        {"antonym_conflicts", s.antonym_conflicts},
        {"override_hits", s.override_hits},
        {"override_rewrites", s.override_rewrites},
    };
    doc["fallbacks"] = {
        {"hierarchy_fallbacks", s.hierarchy_fallbacks},
        {"sentiment_misses", s.sentiment_misses},
        {"dropped_surface_forms", s.dropped_surface_forms},
        {"duplicate_rows", s.duplicate_rows},
    };

    nlohmann::json top = nlohmann::json::array();
    for (const auto& [code, count] : s.top_superclasses(15)) {
        top.push_back({{"superclass", code}, {"concepts", count}});
    }
    doc["top_superclasses"] = top;

    nlohmann::json phases = nlohmann::json::object();
    for (const auto& [phase, ms] : s.phases) phases[phase] = ms;
    doc["phases_ms"] = phases;

    nlohmann::json samples = nlohmann::json::object();
    for (const auto& word : sample_words()) {
        auto entry = result.final_snapshot.primary(word);
        samples[word] = entry ? nlohmann::json(entry->code) : nlohmann::json(nullptr);
    }
    doc["samples"] = samples;
    return doc;
}

nlohmann::json BuildReport::to_json(const ValidationReport& report) {
    nlohmann::json doc;
    doc["passed"] = report.passed();
    doc["words"] = report.words;
    doc["mappings"] = report.mappings;

    nlohmann::json checks = nlohmann::json::array();
    for (const auto& c : report.checks) {
        checks.push_back({
            {"name", c.name},
            {"severity", c.severity == Severity::Hard ? "hard" : "advisory"},
            {"passed", c.passed},
            {"issues", c.issues},
            {"notes", c.notes},
        });
    }
    doc["checks"] = checks;
    return doc;
}

void BuildReport::write(const std::string& path, const nlohmann::json& doc) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write report: " + path);
    }
    out << doc.dump(2) << '\n';
    if (!out) {
        throw std::runtime_error("Failed writing report: " + path);
    }
    Logger::success("Report written to " + path);
}

} // namespace Lexicode
