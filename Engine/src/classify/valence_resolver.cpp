#include <classify/valence_resolver.hpp>
#include <utils/text.hpp>
#include <stdexcept>
#include <unordered_set>

namespace Lexicode {

void OverrideTable::set(const std::string& word, Valence valence) {
    if (valence == Valence::Neutral) {
        throw std::invalid_argument("Override for '" + word + "' must be positive or negative");
    }
    std::string key = to_lower_ascii(trim(word));
    if (key.empty()) {
        throw std::invalid_argument("Override word must not be empty");
    }
    entries_[key] = valence;
}

std::optional<Valence> OverrideTable::find(const std::string& word) const {
    auto it = entries_.find(to_lower_ascii(word));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

OverrideTable OverrideTable::defaults() {
    OverrideTable table;
    for (const char* w : {"fired", "layoff", "laid off", "downsizing", "redundancy", "unemployed",
                          "unemployment", "terminated", "dismissed", "sacked"}) {
        table.set(w, Valence::Negative);
    }
    for (const char* w : {"hired", "promoted", "promotion", "bonus"}) {
        table.set(w, Valence::Positive);
    }
    return table;
}

const char* strength_label(SignalStrength s) {
    switch (s) {
        case SignalStrength::Strong: return "strong";
        case SignalStrength::Weak:   return "weak";
        case SignalStrength::Faint:  return "faint";
        case SignalStrength::None:   return "none";
    }
    return "none";
}

LexicalValence ValenceResolver::lexical(const SentimentScore& score) {
    LexicalValence result;
    double winning = 0.0;
    if (score.pos > score.neg) {
        result.valence = Valence::Positive;
        winning = score.pos;
    } else if (score.neg > score.pos) {
        result.valence = Valence::Negative;
        winning = score.neg;
    } else {
        return result;
    }

    if (winning >= STRONG_THRESHOLD) result.strength = SignalStrength::Strong;
    else if (winning >= WEAK_THRESHOLD) result.strength = SignalStrength::Weak;
    else result.strength = SignalStrength::Faint;
    return result;
}

Valence ValenceResolver::apply_override(const std::string& word, Valence lexical_valence) const {
    if (auto forced = overrides_.find(word)) return *forced;
    return lexical_valence;
}

Valence ValenceResolver::word_valence(const LexiconSnapshot& snapshot, const std::string& word) const {
    auto entry = snapshot.primary(word);
    if (!entry) return Valence::Neutral;
    return code_valence(entry->code);
}

StageResult ValenceResolver::propagate_antonyms(const LexiconSnapshot& input,
                                                const std::vector<AntonymPair>& pairs,
                                                PropagationStats* stats) const {
    PropagationStats local;
    std::unordered_map<std::string, Valence> pull;
    std::unordered_set<std::string> conflicted;
    std::vector<std::string> order;

    auto note = [&](const std::string& word, Valence target) {
        if (conflicted.count(word)) return;
        auto it = pull.find(word);
        if (it == pull.end()) {
            pull.emplace(word, target);
            order.push_back(word);
        } else if (it->second != target) {
            conflicted.insert(word);
            ++local.conflicts;
        }
    };

    for (const auto& pair : pairs) {
        if (pair.word == pair.antonym) continue;
        if (!input.contains(pair.word) || !input.contains(pair.antonym)) continue;
        ++local.pairs_considered;
        if (is_protected(pair.word) || is_protected(pair.antonym)) {
            ++local.protected_pairs;
            continue;
        }

        Valence a = word_valence(input, pair.word);
        Valence b = word_valence(input, pair.antonym);
        if (a == Valence::Neutral && b != Valence::Neutral) {
            note(pair.word, opposite(b));
        } else if (b == Valence::Neutral && a != Valence::Neutral) {
            note(pair.antonym, opposite(a));
        }
    }

    StageResult result{input, {}};
    for (const auto& word : order) {
        if (conflicted.count(word)) continue;
        Valence target = pull.at(word);
        bool flipped = false;
        for (const auto& code : input.codes_for(word)) {
            if (code_valence(code) != Valence::Neutral) continue;
            std::string recoded = recode_valence(code, target);
            result.snapshot.update_code(word, code, recoded);
            result.updates.push_back({word, code, std::move(recoded)});
            ++local.flipped_entries;
            flipped = true;
        }
        if (flipped) ++local.flipped_words;
    }

    if (stats) *stats = local;
    return result;
}

StageResult ValenceResolver::apply_overrides(const LexiconSnapshot& input) const {
    StageResult result{input, {}};
    for (const auto& entry : input.entries()) {
        auto forced = overrides_.find(entry.word);
        if (!forced || code_valence(entry.code) == *forced) continue;
        std::string recoded = recode_valence(entry.code, *forced);
        result.snapshot.update_code(entry.word, entry.code, recoded);
        result.updates.push_back({entry.word, entry.code, std::move(recoded)});
    }
    return result;
}

} // namespace Lexicode
