#include <knowledge/morphy.hpp>
#include <utils/logger.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace Lexicode {

namespace {

struct Detachment {
    const char* suffix;
    const char* ending;
};

constexpr Detachment NOUN_RULES[] = {
    {"s",    ""},
    {"ses",  "s"},
    {"ves",  "f"},
    {"xes",  "x"},
    {"zes",  "z"},
    {"ches", "ch"},
    {"shes", "sh"},
    {"men",  "man"},
    {"ies",  "y"},
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Morphy::Morphy(std::unordered_set<std::string> noun_lemmas, ExceptionMap exceptions)
    : lemmas_(std::move(noun_lemmas)), exceptions_(std::move(exceptions)) {}

Morphy Morphy::load_nouns(const std::string& dict_dir) {
    namespace fs = std::filesystem;

    std::string index_file = (fs::path(dict_dir) / "index.noun").string();
    std::ifstream index(index_file);
    if (!index) throw std::runtime_error("Cannot open WordNet index file: " + index_file);

    std::unordered_set<std::string> lemmas;
    std::string line;
    while (std::getline(index, line)) {
        if (line.empty() || line[0] == ' ') continue;
        lemmas.insert(line.substr(0, line.find(' ')));
    }

    ExceptionMap exceptions;
    std::ifstream exc((fs::path(dict_dir) / "noun.exc").string());
    if (exc) {
        while (std::getline(exc, line)) {
            std::istringstream iss(line);
            std::string inflected, base;
            if (!(iss >> inflected)) continue;
            auto& bases = exceptions[inflected];
            while (iss >> base) bases.push_back(base);
        }
    } else {
        Logger::warn("Morphy: noun.exc not found, irregular plurals are not mapped");
    }

    return Morphy(std::move(lemmas), std::move(exceptions));
}

std::vector<std::string> Morphy::filter(const std::vector<std::string>& forms) const {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    for (const auto& f : forms) {
        if (lemmas_.count(f) && seen.insert(f).second) result.push_back(f);
    }
    return result;
}

std::vector<std::string> Morphy::apply_rules(const std::vector<std::string>& forms) {
    std::vector<std::string> out;
    for (const auto& f : forms) {
        for (const auto& rule : NOUN_RULES) {
            std::string suffix(rule.suffix);
            if (ends_with(f, suffix)) {
                out.push_back(f.substr(0, f.size() - suffix.size()) + rule.ending);
            }
        }
    }
    return out;
}

std::vector<std::string> Morphy::candidates(const std::string& form) const {
    auto exc = exceptions_.find(form);
    if (exc != exceptions_.end()) {
        std::vector<std::string> forms{form};
        forms.insert(forms.end(), exc->second.begin(), exc->second.end());
        return filter(forms);
    }

    std::vector<std::string> forms = apply_rules({form});
    std::vector<std::string> first{form};
    first.insert(first.end(), forms.begin(), forms.end());
    auto results = filter(first);
    if (!results.empty()) return results;

    // Every rule shortens the form or removes its own suffix, so this terminates
    while (!forms.empty()) {
        forms = apply_rules(forms);
        results = filter(forms);
        if (!results.empty()) return results;
    }
    return {};
}

std::string Morphy::base_form(const std::string& form) const {
    auto found = candidates(form);
    if (found.empty()) return form;
    const std::string* best = &found.front();
    for (const auto& c : found) {
        if (c.size() < best->size()) best = &c;
    }
    return *best;
}

} // namespace Lexicode
