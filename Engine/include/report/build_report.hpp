/**
 * @file build_report.hpp
 * @brief Human-readable build summary and the JSON report
 */

#pragma once

#include <lexicon/lexicon_builder.hpp>
#include <storage/lexicon_writer.hpp>
#include <validate/validator.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Lexicode {

class BuildReport {
public:
    /**
     * @brief Words whose primary code is printed after a build
     */
    static const std::vector<std::string>& sample_words();

    /**
     * @brief Log totals, valence distribution, top superclasses and sample words
     * @param outcome May be null for an unwritten build
     */
    static void log_summary(const BuildResult& result, const WriteOutcome* outcome);

    static nlohmann::json to_json(const BuildResult& result, const WriteOutcome* outcome);
    static nlohmann::json to_json(const ValidationReport& report);

    /**
     * @throws std::runtime_error if the file cannot be written
     */
    static void write(const std::string& path, const nlohmann::json& doc);
};

} // namespace Lexicode
