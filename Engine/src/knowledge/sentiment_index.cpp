#include <knowledge/sentiment_index.hpp>
#include <knowledge/concept_graph.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace Lexicode {

void SentimentIndex::set(const std::string& key, SentimentScore score) {
    score.pos = std::clamp(score.pos, 0.0, 1.0);
    score.neg = std::clamp(score.neg, 0.0, 1.0);
    scores_[key] = score;
}

SentimentScore SentimentIndex::scores(const std::string& key) const {
    auto it = scores_.find(key);
    if (it == scores_.end()) return {};
    return it->second;
}

SentimentIndex SentiWordNetReader::load(const std::string& path, SentiWordNetStats* stats) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open SentiWordNet file: " + path);
    }
    return parse(in, stats);
}

SentimentIndex SentiWordNetReader::parse(std::istream& in, SentiWordNetStats* stats) {
    SentimentIndex index;
    SentiWordNetStats local;

    std::string line;
    std::vector<std::string> fields;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        fields.clear();
        std::istringstream iss(line);
        std::string field;
        while (std::getline(iss, field, '\t')) fields.push_back(field);

        // The distributed file ends with a line of empty columns
        if (fields.size() < 4 || fields[0].empty() || fields[1].empty()) {
            ++local.skipped;
            continue;
        }

        const std::string& pos = fields[0];
        if (pos.size() != 1 || std::string("nvasr").find(pos[0]) == std::string::npos) {
            ++local.skipped;
            continue;
        }

        SentimentScore score;
        try {
            score.pos = std::stod(fields[2]);
            score.neg = std::stod(fields[3]);
        } catch (const std::exception&) {
            ++local.skipped;
            continue;
        }

        index.set(make_concept_key(fields[1], pos[0]), score);
        ++local.records;
    }

    if (local.skipped > 0) {
        Logger::warn("SentiWordNet: skipped " + std::to_string(local.skipped) + " malformed lines");
    }
    if (stats) *stats = local;
    return index;
}

} // namespace Lexicode
