#include <knowledge/concept_graph.hpp>
#include <algorithm>
#include <stdexcept>

namespace Lexicode {

ConceptIndex ConceptGraph::add_concept(std::string key, std::string name, PartOfSpeech pos) {
    if (by_key_.count(key)) {
        throw std::invalid_argument("Duplicate concept key: " + key);
    }
    auto index = static_cast<ConceptIndex>(concepts_.size());
    by_key_.emplace(key, index);
    by_name_.emplace(name, index);   // first concept keeps a repeated name

    Concept c;
    c.key = std::move(key);
    c.name = std::move(name);
    c.pos = pos;
    concepts_.push_back(std::move(c));
    return index;
}

void ConceptGraph::check_index(ConceptIndex index) const {
    if (index >= concepts_.size()) {
        throw std::out_of_range("Concept index out of range: " + std::to_string(index));
    }
}

void ConceptGraph::add_hypernym(ConceptIndex child, ConceptIndex parent) {
    check_index(child);
    check_index(parent);
    auto& parents = concepts_[child].hypernyms;
    if (std::find(parents.begin(), parents.end(), parent) == parents.end()) {
        parents.push_back(parent);
    }
}

uint32_t ConceptGraph::add_lemma(ConceptIndex concept_index, std::string form, uint32_t frequency) {
    check_index(concept_index);
    auto& lemmas = concepts_[concept_index].lemmas;
    Lemma l;
    l.form = std::move(form);
    l.frequency = frequency;
    l.ordinal = static_cast<uint32_t>(lemmas.size());
    lemmas.push_back(std::move(l));
    return lemmas.back().ordinal;
}

void ConceptGraph::set_frequency(LemmaRef ref, uint32_t frequency) {
    check_index(ref.concept_index);
    auto& lemmas = concepts_[ref.concept_index].lemmas;
    if (ref.lemma_ordinal >= lemmas.size()) {
        throw std::out_of_range("Lemma ordinal out of range");
    }
    lemmas[ref.lemma_ordinal].frequency = frequency;
}

void ConceptGraph::link_antonym(LemmaRef from, LemmaRef to) {
    lemma(to);   // validates the target
    check_index(from.concept_index);
    auto& lemmas = concepts_[from.concept_index].lemmas;
    if (from.lemma_ordinal >= lemmas.size()) {
        throw std::out_of_range("Lemma ordinal out of range");
    }
    auto& refs = lemmas[from.lemma_ordinal].antonyms;
    if (std::find(refs.begin(), refs.end(), to) == refs.end()) {
        refs.push_back(to);
    }
}

const Concept& ConceptGraph::at(ConceptIndex index) const {
    check_index(index);
    return concepts_[index];
}

const Lemma& ConceptGraph::lemma(LemmaRef ref) const {
    const auto& c = at(ref.concept_index);
    if (ref.lemma_ordinal >= c.lemmas.size()) {
        throw std::out_of_range("Lemma ordinal out of range for " + c.key);
    }
    return c.lemmas[ref.lemma_ordinal];
}

std::optional<ConceptIndex> ConceptGraph::find(const std::string& key) const {
    auto it = by_key_.find(key);
    if (it == by_key_.end()) return std::nullopt;
    return it->second;
}

std::optional<ConceptIndex> ConceptGraph::find_by_name(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return std::nullopt;
    return it->second;
}

std::vector<HypernymPath> ConceptGraph::hypernym_paths(ConceptIndex index) const {
    check_index(index);
    std::vector<HypernymPath> paths;
    std::vector<ConceptIndex> on_path;
    collect_paths(index, on_path, paths);
    return paths;
}

void ConceptGraph::collect_paths(ConceptIndex index, std::vector<ConceptIndex>& on_path,
                                 std::vector<HypernymPath>& out) const {
    on_path.push_back(index);
    bool extended = false;

    for (ConceptIndex parent : concepts_[index].hypernyms) {
        if (std::find(on_path.begin(), on_path.end(), parent) != on_path.end()) continue;
        std::vector<HypernymPath> parent_paths;
        collect_paths(parent, on_path, parent_paths);
        for (auto& tail : parent_paths) {
            HypernymPath path;
            path.reserve(tail.size() + 1);
            path.push_back(index);
            path.insert(path.end(), tail.begin(), tail.end());
            out.push_back(std::move(path));
        }
        extended = true;
    }

    if (!extended) {
        out.push_back({index});
    }
    on_path.pop_back();
}

std::unordered_set<std::string> ConceptGraph::ancestor_union(ConceptIndex index) const {
    check_index(index);
    std::unordered_set<std::string> names;
    std::unordered_set<ConceptIndex> seen{index};
    std::vector<ConceptIndex> stack{index};

    while (!stack.empty()) {
        ConceptIndex cur = stack.back();
        stack.pop_back();
        names.insert(concepts_[cur].name);
        for (ConceptIndex parent : concepts_[cur].hypernyms) {
            if (seen.insert(parent).second) {
                stack.push_back(parent);
            }
        }
    }
    return names;
}

} // namespace Lexicode
