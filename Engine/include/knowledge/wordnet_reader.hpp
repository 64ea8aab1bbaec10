/**
 * @file wordnet_reader.hpp
 * @brief Loads a Princeton WordNet 3.0 dict/ directory into a ConceptGraph
 */

#pragma once

#include <knowledge/concept_graph.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lexicode {

struct WordNetStats {
    size_t concepts = 0;
    size_t lemmas = 0;
    size_t hypernym_edges = 0;
    size_t antonym_links = 0;
    size_t tagged_senses = 0;
    size_t skipped_lines = 0;
    size_t unresolved_pointers = 0;
    size_t unnamed_senses = 0;   // first lemma missing from the index file
};

/**
 * @brief Reader for the WordNet database files
 *
 * Reads index.{noun,verb,adj,adv} for sense numbering, data.{noun,verb,adj,adv}
 * for synsets (this order is the concept visitation order), and index.sense
 * for lemma tag counts. Concept names follow the "<lemma>.<pos>.<NN>"
 * convention, where NN is the rank of the synset among the senses of its
 * first lemma.
 */
class WordNetReader {
public:
    explicit WordNetReader(std::string dict_dir);

    /**
     * @brief Parse all files and build the graph
     * @throws std::runtime_error if an index or data file is missing
     */
    ConceptGraph load();

    const WordNetStats& stats() const { return stats_; }

    /**
     * @brief Strip an adjective syntactic marker: "galore(ip)" -> "galore"
     */
    static std::string strip_marker(const std::string& word);

private:
    struct Pointer {
        std::string symbol;
        std::string target_offset;
        char target_pos;
        int source_word;   // 1-based, 0 for semantic pointers
        int target_word;
    };

    struct RawSynset {
        std::string offset;
        char ss_type;
        std::vector<std::string> words;
        std::vector<Pointer> pointers;
    };

    void parse_index_file(const std::string& file, char file_letter);
    void parse_data_file(const std::string& file, char expected_pos, std::vector<RawSynset>& out);
    void parse_sense_index(const std::string& file);
    std::string sense_name(const RawSynset& syn);
    void link(ConceptGraph& graph, const std::vector<RawSynset>& synsets);
    void apply_frequencies(ConceptGraph& graph);

    std::string dir_;
    WordNetStats stats_;

    // "<file letter>|<lemma>" -> synset offsets in sense order
    std::unordered_map<std::string, std::vector<std::string>> sense_offsets_;
    // "<lemma>|<concept key>" -> tag count
    std::unordered_map<std::string, uint32_t> tag_counts_;
};

} // namespace Lexicode
