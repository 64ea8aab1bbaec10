#include <storage/lexicon_writer.hpp>
#include <utils/logger.hpp>
#include <ctime>
#include <unistd.h>

namespace Lexicode {

std::string LexiconWriter::alternate_destination(const std::string& base) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &local);
    std::string suffix = std::string("_") + stamp + "_" + std::to_string(static_cast<long>(::getpid()));
    if (base.size() + suffix.size() <= MAX_IDENTIFIER_LENGTH) return base + suffix;
    return base.substr(0, MAX_IDENTIFIER_LENGTH - suffix.size()) + suffix;
}

size_t LexiconWriter::apply_updates(const std::vector<CodeUpdate>& updates, const char* phase) {
    size_t changed = 0;
    for (const auto& u : updates) {
        if (!store_.update_code(u.word, u.old_code, u.new_code)) {
            throw std::runtime_error(std::string(phase) + " update missed row (" + u.word + ", " + u.old_code + ")");
        }
        ++changed;
    }
    return changed;
}

WriteOutcome LexiconWriter::write(const BuildResult& result, const std::string& destination) {
    WriteOutcome outcome;
    outcome.destination = destination;

    StoreTransaction txn(store_);
    try {
        store_.reset_destination(destination);
    } catch (const DestinationUnavailable& e) {
        Logger::warn(e.what());
        txn.restart();
        outcome.destination = alternate_destination(destination);
        outcome.redirected = true;
        Logger::warn("Redirecting output to " + outcome.destination);
        store_.reset_destination(outcome.destination);
    }

    Logger::step("[1/3] Inserting " + std::to_string(result.assembled.size()) + " entries");
    store_.insert_entries(result.assembled.entries());
    outcome.entries_written = result.assembled.size();

    Logger::step("[2/3] Applying " + std::to_string(result.antonym_updates.size()) + " antonym updates");
    outcome.antonym_rows = apply_updates(result.antonym_updates, "Antonym");

    Logger::step("[3/3] Applying " + std::to_string(result.override_updates.size()) + " override updates");
    outcome.override_rows = apply_updates(result.override_updates, "Override");

    store_.insert_base_forms(result.base_forms);
    store_.insert_antonyms(result.antonyms);

    store_.write_metadata("fingerprint", result.final_snapshot.fingerprint());
    store_.write_metadata("entries", std::to_string(result.final_snapshot.size()));
    store_.write_metadata("words", std::to_string(result.final_snapshot.word_count()));
    store_.write_metadata("codes", std::to_string(result.final_snapshot.code_count()));
    store_.write_metadata("format", CODE_FORMAT);

    txn.commit();
    return outcome;
}

} // namespace Lexicode
