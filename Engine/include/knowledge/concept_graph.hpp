/**
 * @file concept_graph.hpp
 * @brief Arena-indexed concept (synset) graph consumed by the lexicon builder
 *
 * Concepts live in one vector and refer to each other by index, so the
 * multiple-inheritance hypernym DAG carries no ownership between nodes.
 */

#pragma once

#include <lexicon/code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Lexicode {

using ConceptIndex = uint32_t;

/**
 * @brief Reference to one lemma of one concept
 */
struct LemmaRef {
    ConceptIndex concept_index;
    uint32_t lemma_ordinal;

    bool operator==(const LemmaRef& o) const {
        return concept_index == o.concept_index && lemma_ordinal == o.lemma_ordinal;
    }
};

struct Lemma {
    std::string form;                 // surface form as stored in the source ("laid_off")
    uint32_t frequency = 0;           // corpus tag count
    uint32_t ordinal = 0;             // 0-based position in the concept's lemma list
    std::vector<LemmaRef> antonyms;
};

struct Concept {
    std::string key;                  // stable source identifier, e.g. "00002137-n"
    std::string name;                 // superclass-table key, e.g. "abstraction.n.06"
    PartOfSpeech pos = PartOfSpeech::Noun;
    std::vector<ConceptIndex> hypernyms;   // direct parents, in source order
    std::vector<Lemma> lemmas;
};

/**
 * @brief One chain from a concept (front) out to a root (back)
 */
using HypernymPath = std::vector<ConceptIndex>;

/**
 * @brief Source key "<offset>-<file letter>"; satellites ('s') share the adjective file
 */
inline std::string make_concept_key(const std::string& offset, char ss_type) {
    return offset + "-" + static_cast<char>(ss_type == 's' ? 'a' : ss_type);
}

class ConceptGraph {
public:
    /**
     * @brief Append a concept; visitation order is insertion order
     * @throws std::invalid_argument on a duplicate key
     */
    ConceptIndex add_concept(std::string key, std::string name, PartOfSpeech pos);

    /**
     * @brief Append a direct hypernym edge; repeated edges are ignored
     */
    void add_hypernym(ConceptIndex child, ConceptIndex parent);

    /**
     * @brief Append a lemma and return its ordinal
     */
    uint32_t add_lemma(ConceptIndex concept_index, std::string form, uint32_t frequency = 0);

    void set_frequency(LemmaRef ref, uint32_t frequency);

    /**
     * @brief Record a one-directional antonym reference between two lemmas
     */
    void link_antonym(LemmaRef from, LemmaRef to);

    const Concept& at(ConceptIndex index) const;
    const Lemma& lemma(LemmaRef ref) const;

    std::optional<ConceptIndex> find(const std::string& key) const;
    std::optional<ConceptIndex> find_by_name(const std::string& name) const;

    /**
     * @brief Enumerate every hypernym path of a concept
     *
     * Paths start at the concept and end at a root. They are produced parent
     * by parent in edge order, depth first. A concept without hypernyms has
     * the single path [concept]. An ancestor already on the current path is
     * not revisited, which cuts cycles in malformed input.
     */
    std::vector<HypernymPath> hypernym_paths(ConceptIndex index) const;

    /**
     * @brief Names of the concept and every transitive hypernym
     */
    std::unordered_set<std::string> ancestor_union(ConceptIndex index) const;

    size_t size() const { return concepts_.size(); }
    bool empty() const { return concepts_.empty(); }
    const std::vector<Concept>& concepts() const { return concepts_; }

private:
    void collect_paths(ConceptIndex index, std::vector<ConceptIndex>& on_path,
                       std::vector<HypernymPath>& out) const;
    void check_index(ConceptIndex index) const;

    std::vector<Concept> concepts_;
    std::unordered_map<std::string, ConceptIndex> by_key_;
    std::unordered_map<std::string, ConceptIndex> by_name_;
};

} // namespace Lexicode
