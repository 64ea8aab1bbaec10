#include <lexicon/lexicon_builder.hpp>
#include <lexicon/code_encoder.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <set>

namespace Lexicode {

void ValenceTally::add(const LexicalValence& v) {
    switch (v.valence) {
        case Valence::Positive: ++positive; break;
        case Valence::Negative: ++negative; break;
        case Valence::Neutral:  ++neutral;  break;
    }
    switch (v.strength) {
        case SignalStrength::Strong: ++strong; break;
        case SignalStrength::Weak:   ++weak;   break;
        case SignalStrength::Faint:  ++faint;  break;
        case SignalStrength::None:   break;
    }
}

std::vector<std::pair<std::string, size_t>> BuildStats::top_superclasses(size_t n) const {
    std::vector<std::pair<std::string, size_t>> sorted(superclass_histogram.begin(), superclass_histogram.end());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (sorted.size() > n) sorted.resize(n);
    return sorted;
}

LexiconBuilder::LexiconBuilder(const ResolverTables& tables)
    : tables_(tables),
      hierarchy_(tables.superclasses, tables.fallbacks),
      attributes_(tables.references),
      valence_(tables.overrides) {}

LexiconSnapshot LexiconBuilder::assemble(const ConceptGraph& graph, const SentimentIndex& sentiment,
                                         BuildStats& stats) const {
    LexiconSnapshot snapshot;
    CodeEncoder encoder;

    for (ConceptIndex c = 0; c < graph.size(); ++c) {
        const Concept& concept_ref = graph.at(c);
        ++stats.concepts;

        SuperclassMatch superclass = hierarchy_.resolve(graph, c);
        if (!superclass.specific) ++stats.hierarchy_fallbacks;
        ++stats.superclass_histogram[superclass.code];

        Abstractness abstractness = attributes_.classify(graph, c);

        if (!sentiment.contains(concept_ref.key)) ++stats.sentiment_misses;
        LexicalValence lexical = ValenceResolver::lexical(sentiment.scores(concept_ref.key));
        stats.valence.add(lexical);

        // The sequence is consumed even if every lemma is filtered out
        Code code = encoder.encode(superclass.code, concept_ref.pos, abstractness, lexical.valence);

        for (const auto& lemma : concept_ref.lemmas) {
            std::string word = surface_form(lemma.form);
            if (!is_clean_surface(word)) {
                ++stats.dropped_surface_forms;
                continue;
            }

            Valence valence = valence_.apply_override(word, lexical.valence);
            if (valence != lexical.valence) ++stats.override_hits;

            LexiconEntry entry;
            entry.code = code.with_valence(valence).to_string();
            entry.priority = PriorityRanker::rank(lemma.frequency, superclass.specific, lemma.ordinal);
            entry.word = std::move(word);
            if (!snapshot.insert(std::move(entry))) ++stats.duplicate_rows;
        }
    }
    return snapshot;
}

std::vector<AntonymPair> LexiconBuilder::collect_antonyms(const ConceptGraph& graph) {
    std::set<AntonymPair> pairs;
    for (const auto& concept_ref : graph.concepts()) {
        for (const auto& lemma : concept_ref.lemmas) {
            if (lemma.antonyms.empty()) continue;
            std::string word = surface_form(lemma.form);
            if (!is_clean_surface(word)) continue;
            for (const auto& ref : lemma.antonyms) {
                std::string other = surface_form(graph.lemma(ref).form);
                if (!is_clean_surface(other) || other == word) continue;
                pairs.insert({word, other});
                pairs.insert({other, word});
            }
        }
    }
    return {pairs.begin(), pairs.end()};
}

std::map<std::string, std::string> LexiconBuilder::collect_base_forms(const ConceptGraph& graph, const Morphy& morphy) {
    std::map<std::string, std::string> base_forms;
    for (const auto& concept_ref : graph.concepts()) {
        for (const auto& lemma : concept_ref.lemmas) {
            std::string word = surface_form(lemma.form);
            if (!is_clean_surface(word) || !is_single_token(word) || base_forms.count(word)) continue;
            std::string base = morphy.base_form(word);
            if (base != word) base_forms.emplace(std::move(word), std::move(base));
        }
    }
    return base_forms;
}

BuildResult LexiconBuilder::build(const ConceptGraph& graph, const SentimentIndex& sentiment,
                                  const Morphy& morphy) const {
    BuildResult result;
    BuildStats& stats = result.stats;
    PhaseTimer timer;

    Logger::step("Assigning codes to " + std::to_string(graph.size()) + " concepts");
    result.assembled = assemble(graph, sentiment, stats);
    timer.lap("assemble");

    result.antonyms = collect_antonyms(graph);
    PropagationStats propagation;
    StageResult propagated = valence_.propagate_antonyms(result.assembled, result.antonyms, &propagation);
    result.antonym_updates = std::move(propagated.updates);
    stats.antonym_pairs = result.antonyms.size() / 2;
    stats.antonym_flips = propagation.flipped_entries;
    stats.antonym_words = propagation.flipped_words;
    stats.antonym_conflicts = propagation.conflicts;
    Logger::stat("Antonym propagation: " + std::to_string(propagation.flipped_words) + " words, " +
                 std::to_string(propagation.flipped_entries) + " codes, " +
                 std::to_string(propagation.conflicts) + " conflicting words skipped");
    timer.lap("antonyms");

    StageResult overridden = valence_.apply_overrides(propagated.snapshot);
    result.override_updates = std::move(overridden.updates);
    result.final_snapshot = std::move(overridden.snapshot);
    stats.override_rewrites = result.override_updates.size();
    timer.lap("overrides");

    result.base_forms = collect_base_forms(graph, morphy);
    stats.lemma_mappings = result.base_forms.size();
    timer.lap("base forms");

    stats.entries = result.final_snapshot.size();
    stats.unique_words = result.final_snapshot.word_count();
    stats.unique_codes = result.final_snapshot.code_count();
    stats.phases = timer.phases();
    return result;
}

} // namespace Lexicode
