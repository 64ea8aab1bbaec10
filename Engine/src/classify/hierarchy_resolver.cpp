#include <classify/hierarchy_resolver.hpp>
#include <stdexcept>

namespace Lexicode {

SuperclassMatch HierarchyResolver::resolve(const std::vector<std::vector<std::string>>& paths,
                                           PartOfSpeech pos) const {
    for (const auto& path : paths) {
        for (const auto& name : path) {
            if (auto code = table_.lookup(name)) {
                return {*code, true};
            }
        }
    }
    return fallback(pos);
}

SuperclassMatch HierarchyResolver::resolve(const ConceptGraph& graph, ConceptIndex index) const {
    PartOfSpeech pos = PartOfSpeech::Noun;
    try {
        const auto& c = graph.at(index);
        pos = c.pos;
        for (const auto& path : graph.hypernym_paths(index)) {
            for (ConceptIndex ancestor : path) {
                if (auto code = table_.lookup(graph.at(ancestor).name)) {
                    return {*code, true};
                }
            }
        }
    } catch (const std::exception&) {
        // Traversal failures degrade to the fallback like a miss
        return fallback(pos);
    }
    return fallback(pos);
}

} // namespace Lexicode
