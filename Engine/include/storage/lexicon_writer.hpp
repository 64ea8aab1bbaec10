/**
 * @file lexicon_writer.hpp
 * @brief Persists a BuildResult in three ordered phases inside one transaction
 */

#pragma once

#include <lexicon/lexicon_builder.hpp>
#include <storage/lexicon_store.hpp>
#include <string>

namespace Lexicode {

struct WriteOutcome {
    std::string destination;
    bool redirected = false;
    size_t entries_written = 0;
    size_t antonym_rows = 0;
    size_t override_rows = 0;
};

/**
 * @brief Writes lexicon rows, then antonym updates, then override updates
 *
 * If the requested destination cannot be dropped the transaction is
 * restarted against an alternate destination "<base>_<yyyymmddHHMMSS>_<pid>",
 * with the base shortened so the name fits a PostgreSQL identifier.
 * Any other failure rolls everything back.
 */
class LexiconWriter {
public:
    static constexpr const char* CODE_FORMAT = "HHHH-LLLLL-P-A-V";
    static constexpr size_t MAX_IDENTIFIER_LENGTH = 63;

    explicit LexiconWriter(LexiconStore& store) : store_(store) {}

    /**
     * @throws std::runtime_error if a point update misses its row
     */
    WriteOutcome write(const BuildResult& result, const std::string& destination);

    static std::string alternate_destination(const std::string& base);

private:
    size_t apply_updates(const std::vector<CodeUpdate>& updates, const char* phase);

    LexiconStore& store_;
};

} // namespace Lexicode
