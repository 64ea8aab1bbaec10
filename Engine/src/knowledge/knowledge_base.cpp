#include <knowledge/knowledge_base.hpp>
#include <knowledge/wordnet_reader.hpp>
#include <utils/logger.hpp>

namespace Lexicode {

KnowledgeBase KnowledgeBase::load(const std::string& wordnet_dir, const std::string& sentiwordnet_path) {
    KnowledgeBase kb;

    Logger::step("Loading WordNet from " + wordnet_dir);
    WordNetReader reader(wordnet_dir);
    kb.graph = reader.load();
    const WordNetStats& wn = reader.stats();
    Logger::stat("Concepts: " + std::to_string(wn.concepts) + ", lemmas: " + std::to_string(wn.lemmas));
    Logger::stat("Hypernym edges: " + std::to_string(wn.hypernym_edges) +
                 ", antonym links: " + std::to_string(wn.antonym_links));
    Logger::stat("Tagged senses: " + std::to_string(wn.tagged_senses));

    Logger::step("Loading SentiWordNet from " + sentiwordnet_path);
    SentiWordNetStats swn;
    kb.sentiment = SentiWordNetReader::load(sentiwordnet_path, &swn);
    Logger::stat("Scored concepts: " + std::to_string(kb.sentiment.size()));
    if (swn.skipped > 0) {
        Logger::warn("Skipped " + std::to_string(swn.skipped) + " malformed SentiWordNet lines");
    }

    kb.morphy = Morphy::load_nouns(wordnet_dir);
    Logger::stat("Noun lemmas: " + std::to_string(kb.morphy.lemma_count()) +
                 ", exceptions: " + std::to_string(kb.morphy.exception_count()));
    return kb;
}

} // namespace Lexicode
