/**
 * @file knowledge_base.hpp
 * @brief The three knowledge-base inputs of a build, loaded together
 */

#pragma once

#include <knowledge/concept_graph.hpp>
#include <knowledge/morphy.hpp>
#include <knowledge/sentiment_index.hpp>
#include <string>

namespace Lexicode {

struct KnowledgeBase {
    ConceptGraph graph;
    SentimentIndex sentiment;
    Morphy morphy;

    /**
     * @brief Load WordNet, SentiWordNet and the noun lemmatizer, logging counts per source
     * @throws std::runtime_error if a required file is missing
     */
    static KnowledgeBase load(const std::string& wordnet_dir, const std::string& sentiwordnet_path);
};

} // namespace Lexicode
