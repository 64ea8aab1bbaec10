/**
 * @file attribute_classifier.hpp
 * @brief Abstractness digit from the union of a concept's ancestors
 */

#pragma once

#include <knowledge/concept_graph.hpp>
#include <string>
#include <unordered_set>

namespace Lexicode {

/**
 * @brief Disjoint ancestor sets marking abstract and concrete concepts
 */
struct ReferenceSets {
    std::unordered_set<std::string> abstract_ancestors;
    std::unordered_set<std::string> concrete_ancestors;

    static ReferenceSets defaults();
};

class AttributeClassifier {
public:
    explicit AttributeClassifier(const ReferenceSets& sets) : sets_(sets) {}

    /**
     * @brief Concrete if only the concrete set is hit, abstract if only the
     *        abstract set is hit, mixed otherwise
     */
    Abstractness classify(const std::unordered_set<std::string>& ancestors) const;

    /**
     * @brief Classify a graph concept; traversal failure yields Mixed
     */
    Abstractness classify(const ConceptGraph& graph, ConceptIndex index) const;

private:
    const ReferenceSets& sets_;
};

} // namespace Lexicode
