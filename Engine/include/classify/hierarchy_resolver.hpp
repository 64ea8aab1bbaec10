/**
 * @file hierarchy_resolver.hpp
 * @brief Concept -> 4-digit superclass code by walking hypernym paths
 */

#pragma once

#include <classify/superclass_table.hpp>
#include <knowledge/concept_graph.hpp>
#include <string>
#include <vector>

namespace Lexicode {

struct SuperclassMatch {
    std::string code;
    bool specific = false;   // false when the POS fallback was used
};

/**
 * @brief First-path-wins superclass resolution
 *
 * Paths are visited in the order given. Inside a path the scan runs from
 * the concept outward and stops at the first ancestor present in the table.
 * The first path that yields a match decides, even if a later path holds a
 * closer match. No match, no paths, or any lookup failure yields the
 * POS fallback.
 */
class HierarchyResolver {
public:
    HierarchyResolver(const SuperclassTable& table, const PosFallbacks& fallbacks)
        : table_(table), fallbacks_(fallbacks) {}

    /**
     * @param paths Concept names per path, concept first, root last
     */
    SuperclassMatch resolve(const std::vector<std::vector<std::string>>& paths, PartOfSpeech pos) const;

    SuperclassMatch resolve(const ConceptGraph& graph, ConceptIndex index) const;

    SuperclassMatch fallback(PartOfSpeech pos) const { return {fallbacks_.code_for(pos), false}; }

private:
    const SuperclassTable& table_;
    const PosFallbacks& fallbacks_;
};

} // namespace Lexicode
