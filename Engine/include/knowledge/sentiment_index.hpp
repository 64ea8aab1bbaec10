/**
 * @file sentiment_index.hpp
 * @brief Per-concept (positive, negative) sentiment scores and the SentiWordNet 3.0 reader
 */

#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <unordered_map>

namespace Lexicode {

struct SentimentScore {
    double pos = 0.0;
    double neg = 0.0;
};

/**
 * @brief Sentiment scores keyed by concept key; a missing key reads as (0, 0)
 */
class SentimentIndex {
public:
    void set(const std::string& key, SentimentScore score);

    SentimentScore scores(const std::string& key) const;

    bool contains(const std::string& key) const { return scores_.count(key) > 0; }
    size_t size() const { return scores_.size(); }

private:
    std::unordered_map<std::string, SentimentScore> scores_;
};

struct SentiWordNetStats {
    size_t records = 0;
    size_t skipped = 0;
};

/**
 * @brief Reader for SentiWordNet_3.0.0.txt
 *
 * Line format: POS \t ID \t PosScore \t NegScore \t SynsetTerms \t Gloss
 * e.g. "a\t00002956\t0\t0\tabducting#1 abducent#1\tespecially of muscles; ..."
 */
class SentiWordNetReader {
public:
    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    static SentimentIndex load(const std::string& path, SentiWordNetStats* stats = nullptr);

    static SentimentIndex parse(std::istream& in, SentiWordNetStats* stats = nullptr);
};

} // namespace Lexicode
