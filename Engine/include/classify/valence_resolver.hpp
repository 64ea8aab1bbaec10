/**
 * @file valence_resolver.hpp
 * @brief Polarity digit: lexical scores, manual overrides and antonym propagation
 *
 * Stage order is lexical (with overrides) -> antonym propagation -> override
 * terminal pass. Propagation never touches override words and only turns
 * neutral codes polar; the terminal pass makes every override word carry its
 * override digit whatever happened before.
 */

#pragma once

#include <knowledge/sentiment_index.hpp>
#include <lexicon/code.hpp>
#include <lexicon/lexicon_snapshot.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lexicode {

/**
 * @brief Lowercase surface word -> forced polarity (Positive or Negative)
 */
class OverrideTable {
public:
    OverrideTable() = default;

    /**
     * @throws std::invalid_argument for Neutral or an empty word
     */
    void set(const std::string& word, Valence valence);

    std::optional<Valence> find(const std::string& word) const;

    bool contains(const std::string& word) const { return find(word).has_value(); }
    size_t size() const { return entries_.size(); }
    const std::unordered_map<std::string, Valence>& entries() const { return entries_; }

    /**
     * @brief Curated employment vocabulary
     */
    static OverrideTable defaults();

private:
    std::unordered_map<std::string, Valence> entries_;
};

/**
 * @brief Reporting tier of the winning score: strong >= 0.25, weak >= 0.1
 */
enum class SignalStrength {
    None,
    Faint,
    Weak,
    Strong
};

const char* strength_label(SignalStrength s);

struct LexicalValence {
    Valence valence = Valence::Neutral;
    SignalStrength strength = SignalStrength::None;
};

/**
 * @brief Output of a snapshot stage: the new state and the point updates that produced it
 */
struct StageResult {
    LexiconSnapshot snapshot;
    std::vector<CodeUpdate> updates;
};

struct PropagationStats {
    size_t pairs_considered = 0;
    size_t protected_pairs = 0;
    size_t conflicts = 0;        // neutral words pulled both ways
    size_t flipped_words = 0;
    size_t flipped_entries = 0;
};

class ValenceResolver {
public:
    static constexpr double STRONG_THRESHOLD = 0.25;
    static constexpr double WEAK_THRESHOLD = 0.1;

    explicit ValenceResolver(const OverrideTable& overrides) : overrides_(overrides) {}

    /**
     * @brief Strictly larger score wins; a tie (including 0 vs 0) is neutral
     */
    static LexicalValence lexical(const SentimentScore& score);

    /**
     * @brief Override value of @p word if any, else @p lexical_valence
     */
    Valence apply_override(const std::string& word, Valence lexical_valence) const;

    bool is_protected(const std::string& word) const { return overrides_.contains(word); }

    /**
     * @brief Antonym propagation over the assembled snapshot
     *
     * A word's valence is the valence of its primary (highest-priority) code.
     * For a pair where exactly one side is neutral, the neutral side is
     * pulled to the opposite of the other side. A neutral word whose pairs
     * disagree is left alone. Every neutral code of a pulled word is
     * rewritten. All decisions read @p input, so the result does not depend
     * on pair order.
     */
    StageResult propagate_antonyms(const LexiconSnapshot& input,
                                   const std::vector<AntonymPair>& pairs,
                                   PropagationStats* stats = nullptr) const;

    /**
     * @brief Terminal pass: every code of every override word gets the override digit
     */
    StageResult apply_overrides(const LexiconSnapshot& input) const;

private:
    Valence word_valence(const LexiconSnapshot& snapshot, const std::string& word) const;

    const OverrideTable& overrides_;
};

} // namespace Lexicode
