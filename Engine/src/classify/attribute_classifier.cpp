#include <classify/attribute_classifier.hpp>
#include <stdexcept>

namespace Lexicode {

ReferenceSets ReferenceSets::defaults() {
    ReferenceSets sets;
    sets.abstract_ancestors = {
        "abstraction.n.06", "psychological_feature.n.01", "cognition.n.01",
        "attribute.n.02", "relation.n.01", "communication.n.02", "measure.n.02",
        "state.n.02", "event.n.01", "group.n.01", "feeling.n.01", "emotion.n.01",
    };
    sets.concrete_ancestors = {
        "physical_entity.n.01", "object.n.01", "artifact.n.01", "organism.n.01",
        "substance.n.01", "body_part.n.01", "natural_object.n.01", "food.n.01",
        "location.n.01", "structure.n.01", "person.n.01", "animal.n.01",
    };
    return sets;
}

namespace {

bool intersects(const std::unordered_set<std::string>& names, const std::unordered_set<std::string>& reference) {
    const auto& small = names.size() <= reference.size() ? names : reference;
    const auto& large = names.size() <= reference.size() ? reference : names;
    for (const auto& n : small) {
        if (large.count(n)) return true;
    }
    return false;
}

} // namespace

Abstractness AttributeClassifier::classify(const std::unordered_set<std::string>& ancestors) const {
    bool is_abstract = intersects(ancestors, sets_.abstract_ancestors);
    bool is_concrete = intersects(ancestors, sets_.concrete_ancestors);

    if (is_abstract && !is_concrete) return Abstractness::Abstract;
    if (is_concrete && !is_abstract) return Abstractness::Concrete;
    return Abstractness::Mixed;
}

Abstractness AttributeClassifier::classify(const ConceptGraph& graph, ConceptIndex index) const {
    try {
        return classify(graph.ancestor_union(index));
    } catch (const std::exception&) {
        return Abstractness::Mixed;
    }
}

} // namespace Lexicode
