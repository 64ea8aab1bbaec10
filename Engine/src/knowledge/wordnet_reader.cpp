#include <knowledge/wordnet_reader.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Lexicode {

namespace fs = std::filesystem;

namespace {

struct PosFile {
    const char* suffix;
    char letter;
};

constexpr PosFile POS_FILES[] = {
    {"noun", 'n'},
    {"verb", 'v'},
    {"adj",  'a'},
    {"adv",  'r'},
};

char file_letter(char ss_type) {
    return ss_type == 's' ? 'a' : ss_type;
}

// index.sense ss_type digits: 1 noun, 2 verb, 3 adjective, 4 adverb, 5 satellite
char letter_from_ss_digit(char digit) {
    switch (digit) {
        case '1': return 'n';
        case '2': return 'v';
        case '3':
        case '5': return 'a';
        case '4': return 'r';
        default:  return '\0';
    }
}

} // namespace

WordNetReader::WordNetReader(std::string dict_dir) : dir_(std::move(dict_dir)) {}

std::string WordNetReader::strip_marker(const std::string& word) {
    size_t paren = word.find('(');
    if (paren == std::string::npos || word.back() != ')') return word;
    return word.substr(0, paren);
}

ConceptGraph WordNetReader::load() {
    stats_ = WordNetStats{};
    sense_offsets_.clear();
    tag_counts_.clear();

    for (const auto& pf : POS_FILES) {
        parse_index_file((fs::path(dir_) / (std::string("index.") + pf.suffix)).string(), pf.letter);
    }

    std::vector<RawSynset> synsets;
    for (const auto& pf : POS_FILES) {
        parse_data_file((fs::path(dir_) / (std::string("data.") + pf.suffix)).string(), pf.letter, synsets);
    }

    ConceptGraph graph;
    for (const auto& syn : synsets) {
        auto pos = pos_from_letter(syn.ss_type);
        ConceptIndex idx = graph.add_concept(make_concept_key(syn.offset, syn.ss_type), sense_name(syn), *pos);
        for (const auto& word : syn.words) {
            graph.add_lemma(idx, strip_marker(word));
            ++stats_.lemmas;
        }
    }
    stats_.concepts = graph.size();

    link(graph, synsets);

    std::string sense_file = (fs::path(dir_) / "index.sense").string();
    if (fs::exists(sense_file)) {
        parse_sense_index(sense_file);
        apply_frequencies(graph);
    } else {
        Logger::warn("WordNet: index.sense not found, corpus frequencies default to 0");
    }

    if (stats_.skipped_lines > 0) {
        Logger::warn("WordNet: skipped " + std::to_string(stats_.skipped_lines) + " malformed lines");
    }
    return graph;
}

void WordNetReader::parse_index_file(const std::string& file, char letter) {
    std::ifstream in(file);
    if (!in) throw std::runtime_error("Cannot open WordNet index file: " + file);

    std::string line;
    while (std::getline(in, line)) {
        // License header lines start with two spaces
        if (line.empty() || line[0] == ' ') continue;
        std::istringstream iss(line);
        std::string lemma, pos;
        int synset_cnt = 0, p_cnt = 0, sense_cnt = 0, tagsense_cnt = 0;
        if (!(iss >> lemma >> pos >> synset_cnt >> p_cnt)) { ++stats_.skipped_lines; continue; }
        std::string symbol;
        for (int i = 0; i < p_cnt; ++i) iss >> symbol;
        if (!(iss >> sense_cnt >> tagsense_cnt)) { ++stats_.skipped_lines; continue; }

        std::vector<std::string> offsets;
        offsets.reserve(synset_cnt);
        std::string offset;
        for (int i = 0; i < synset_cnt && (iss >> offset); ++i) offsets.push_back(offset);

        sense_offsets_[std::string(1, letter) + "|" + to_lower_ascii(lemma)] = std::move(offsets);
    }
}

void WordNetReader::parse_data_file(const std::string& file, char expected_pos, std::vector<RawSynset>& out) {
    std::ifstream in(file);
    if (!in) throw std::runtime_error("Cannot open WordNet data file: " + file);

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() || line[0] == ' ' || line[0] == '#') continue;
        size_t pipe_pos = line.find('|');
        std::string synset_part = (pipe_pos == std::string::npos) ? line : line.substr(0, pipe_pos);
        std::istringstream iss(synset_part);

        RawSynset syn;
        std::string lex_filenum, word_count_hex;
        if (!(iss >> syn.offset >> lex_filenum >> syn.ss_type >> word_count_hex)) { ++stats_.skipped_lines; continue; }
        if (syn.ss_type != expected_pos && !(syn.ss_type == 's' && expected_pos == 'a')) { ++stats_.skipped_lines; continue; }

        int word_count = 0;
        try {
            word_count = std::stoi(word_count_hex, nullptr, 16);
        } catch (const std::exception&) {
            ++stats_.skipped_lines;
            continue;
        }

        bool ok = word_count > 0;
        syn.words.reserve(word_count);
        for (int i = 0; ok && i < word_count; ++i) {
            std::string word, lex_id_hex;
            if (!(iss >> word >> lex_id_hex)) ok = false;
            else syn.words.push_back(std::move(word));
        }

        int pointer_count = 0;
        if (ok && !(iss >> pointer_count)) ok = false;
        syn.pointers.reserve(pointer_count);
        for (int i = 0; ok && i < pointer_count; ++i) {
            Pointer ptr;
            std::string src_trg;
            if (!(iss >> ptr.symbol >> ptr.target_offset >> ptr.target_pos >> src_trg) || src_trg.size() != 4) {
                ok = false;
                break;
            }
            try {
                ptr.source_word = std::stoi(src_trg.substr(0, 2), nullptr, 16);
                ptr.target_word = std::stoi(src_trg.substr(2, 2), nullptr, 16);
            } catch (const std::exception&) {
                ok = false;
                break;
            }
            syn.pointers.push_back(std::move(ptr));
        }

        if (!ok) { ++stats_.skipped_lines; continue; }
        out.push_back(std::move(syn));
    }
}

void WordNetReader::parse_sense_index(const std::string& file) {
    std::ifstream in(file);
    if (!in) throw std::runtime_error("Cannot open WordNet sense index: " + file);

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string sense_key, offset;
        int sense_number = 0;
        uint32_t tag_cnt = 0;
        if (!(iss >> sense_key >> offset >> sense_number >> tag_cnt)) { ++stats_.skipped_lines; continue; }

        // lemma%ss_type:lex_filenum:lex_id:head_word:head_id
        size_t pct = sense_key.find('%');
        if (pct == std::string::npos || pct + 1 >= sense_key.size()) { ++stats_.skipped_lines; continue; }
        char letter = letter_from_ss_digit(sense_key[pct + 1]);
        if (letter == '\0') { ++stats_.skipped_lines; continue; }

        tag_counts_[to_lower_ascii(sense_key.substr(0, pct)) + "|" + make_concept_key(offset, letter)] = tag_cnt;
    }
}

std::string WordNetReader::sense_name(const RawSynset& syn) {
    std::string lemma = to_lower_ascii(strip_marker(syn.words.front()));
    int sense_number = 1;

    auto it = sense_offsets_.find(std::string(1, file_letter(syn.ss_type)) + "|" + lemma);
    bool found = false;
    if (it != sense_offsets_.end()) {
        for (size_t i = 0; i < it->second.size(); ++i) {
            if (it->second[i] == syn.offset) {
                sense_number = static_cast<int>(i) + 1;
                found = true;
                break;
            }
        }
    }
    if (!found) ++stats_.unnamed_senses;

    std::ostringstream name;
    name << lemma << '.' << syn.ss_type << '.' << std::setw(2) << std::setfill('0') << sense_number;
    return name.str();
}

void WordNetReader::link(ConceptGraph& graph, const std::vector<RawSynset>& synsets) {
    for (size_t i = 0; i < synsets.size(); ++i) {
        const auto& syn = synsets[i];
        auto child = static_cast<ConceptIndex>(i);

        // Class hypernyms come before instance hypernyms
        for (const char* symbol : {"@", "@i"}) {
            for (const auto& ptr : syn.pointers) {
                if (ptr.symbol != symbol) continue;
                auto parent = graph.find(make_concept_key(ptr.target_offset, ptr.target_pos));
                if (!parent) { ++stats_.unresolved_pointers; continue; }
                graph.add_hypernym(child, *parent);
                ++stats_.hypernym_edges;
            }
        }

        for (const auto& ptr : syn.pointers) {
            if (ptr.symbol != "!") continue;
            auto target = graph.find(make_concept_key(ptr.target_offset, ptr.target_pos));
            if (!target || ptr.source_word < 1 || ptr.target_word < 1 ||
                static_cast<size_t>(ptr.source_word) > syn.words.size() ||
                static_cast<size_t>(ptr.target_word) > graph.at(*target).lemmas.size()) {
                ++stats_.unresolved_pointers;
                continue;
            }
            graph.link_antonym({child, static_cast<uint32_t>(ptr.source_word - 1)},
                               {*target, static_cast<uint32_t>(ptr.target_word - 1)});
            ++stats_.antonym_links;
        }
    }
}

void WordNetReader::apply_frequencies(ConceptGraph& graph) {
    for (ConceptIndex c = 0; c < graph.size(); ++c) {
        const auto& concept_ref = graph.at(c);
        for (const auto& lemma : concept_ref.lemmas) {
            auto it = tag_counts_.find(to_lower_ascii(lemma.form) + "|" + concept_ref.key);
            if (it == tag_counts_.end()) continue;
            graph.set_frequency({c, lemma.ordinal}, it->second);
            ++stats_.tagged_senses;
        }
    }
}

} // namespace Lexicode
