/**
 * @file lexicon_builder.hpp
 * @brief Runs the code-assignment pipeline over a concept graph
 *
 * Stages:
 *   1. assemble            - one code per concept, one row per clean lemma
 *   2. propagate_antonyms  - neutral words pulled opposite to their antonyms
 *   3. apply_overrides     - override words forced to their digit (terminal)
 * Each stage takes the previous snapshot and returns a new one together with
 * the point updates that turn the old rows into the new ones.
 */

#pragma once

#include <classify/attribute_classifier.hpp>
#include <classify/hierarchy_resolver.hpp>
#include <classify/resolver_tables.hpp>
#include <classify/valence_resolver.hpp>
#include <knowledge/concept_graph.hpp>
#include <knowledge/morphy.hpp>
#include <knowledge/sentiment_index.hpp>
#include <lexicon/lexicon_snapshot.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Lexicode {

/**
 * @brief Per-concept lexical valence tally (reporting only)
 */
struct ValenceTally {
    size_t positive = 0;
    size_t negative = 0;
    size_t neutral = 0;
    size_t strong = 0;
    size_t weak = 0;
    size_t faint = 0;

    void add(const LexicalValence& v);
    size_t total() const { return positive + negative + neutral; }
};

struct BuildStats {
    size_t concepts = 0;
    size_t entries = 0;
    size_t unique_words = 0;
    size_t unique_codes = 0;
    size_t lemma_mappings = 0;
    size_t antonym_pairs = 0;
    size_t antonym_flips = 0;        // rows turned polar by propagation
    size_t antonym_words = 0;
    size_t antonym_conflicts = 0;
    size_t override_hits = 0;        // lemmas whose lexical digit was replaced at assembly
    size_t override_rewrites = 0;    // rows rewritten by the terminal pass
    size_t hierarchy_fallbacks = 0;
    size_t sentiment_misses = 0;
    size_t dropped_surface_forms = 0;
    size_t duplicate_rows = 0;       // (word, code) already present
    ValenceTally valence;
    std::map<std::string, size_t> superclass_histogram;
    std::vector<std::pair<std::string, double>> phases;

    /**
     * @brief Largest superclasses, ties by code
     */
    std::vector<std::pair<std::string, size_t>> top_superclasses(size_t n = 15) const;
};

struct BuildResult {
    LexiconSnapshot assembled;
    std::vector<CodeUpdate> antonym_updates;
    std::vector<CodeUpdate> override_updates;
    LexiconSnapshot final_snapshot;
    std::map<std::string, std::string> base_forms;   // word -> lemma, only where they differ
    std::vector<AntonymPair> antonyms;                // symmetric, sorted
    BuildStats stats;
};

class LexiconBuilder {
public:
    explicit LexiconBuilder(const ResolverTables& tables);

    /**
     * @brief Stage 1: visit concepts in graph order and emit rows
     */
    LexiconSnapshot assemble(const ConceptGraph& graph, const SentimentIndex& sentiment, BuildStats& stats) const;

    /**
     * @brief Symmetric, de-duplicated antonym pairs over clean surface forms
     */
    static std::vector<AntonymPair> collect_antonyms(const ConceptGraph& graph);

    /**
     * @brief Noun base forms of clean single-token words, where different from the word
     */
    static std::map<std::string, std::string> collect_base_forms(const ConceptGraph& graph, const Morphy& morphy);

    /**
     * @brief All stages plus base forms and statistics
     */
    BuildResult build(const ConceptGraph& graph, const SentimentIndex& sentiment, const Morphy& morphy) const;

    const ResolverTables& tables() const { return tables_; }

private:
    const ResolverTables& tables_;
    HierarchyResolver hierarchy_;
    AttributeClassifier attributes_;
    ValenceResolver valence_;
};

} // namespace Lexicode
