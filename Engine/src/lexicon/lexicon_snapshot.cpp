#include <lexicon/lexicon_snapshot.hpp>
#include <hashing/blake3_digest.hpp>
#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace Lexicode {

std::string LexiconSnapshot::key_of(const std::string& word, const std::string& code) {
    return word + '\x1F' + code;
}

bool LexiconSnapshot::insert(LexiconEntry entry) {
    std::string key = key_of(entry.word, entry.code);
    if (by_key_.count(key)) return false;

    size_t row = entries_.size();
    auto& rows = by_word_[entry.word];
    if (rows.empty()) word_order_.push_back(entry.word);
    rows.push_back(row);
    by_key_.emplace(std::move(key), row);
    entries_.push_back(std::move(entry));
    return true;
}

bool LexiconSnapshot::update_code(const std::string& word, const std::string& old_code, const std::string& new_code) {
    auto it = by_key_.find(key_of(word, old_code));
    if (it == by_key_.end()) return false;
    if (old_code == new_code) return true;

    std::string new_key = key_of(word, new_code);
    if (by_key_.count(new_key)) {
        throw std::runtime_error("Duplicate lexicon key (" + word + ", " + new_code + ")");
    }
    size_t row = it->second;
    by_key_.erase(it);
    by_key_.emplace(std::move(new_key), row);
    entries_[row].code = new_code;
    return true;
}

bool LexiconSnapshot::contains(const std::string& word, const std::string& code) const {
    return by_key_.count(key_of(word, code)) > 0;
}

std::vector<std::string> LexiconSnapshot::codes_for(const std::string& word) const {
    std::vector<std::string> codes;
    auto it = by_word_.find(word);
    if (it == by_word_.end()) return codes;
    codes.reserve(it->second.size());
    for (size_t row : it->second) codes.push_back(entries_[row].code);
    return codes;
}

std::optional<LexiconEntry> LexiconSnapshot::primary(const std::string& word) const {
    auto it = by_word_.find(word);
    if (it == by_word_.end()) return std::nullopt;
    const LexiconEntry* best = nullptr;
    for (size_t row : it->second) {
        if (!best || entries_[row].priority > best->priority) best = &entries_[row];
    }
    return *best;
}

size_t LexiconSnapshot::code_count() const {
    std::unordered_set<std::string> codes;
    for (const auto& e : entries_) codes.insert(e.code);
    return codes.size();
}

std::string LexiconSnapshot::fingerprint() const {
    return fingerprint_rows(entries_);
}

std::string fingerprint_rows(std::vector<LexiconEntry> rows) {
    std::sort(rows.begin(), rows.end(), [](const LexiconEntry& a, const LexiconEntry& b) {
        return std::tie(a.word, a.code, a.priority) < std::tie(b.word, b.code, b.priority);
    });

    Blake3Digest digest;
    for (const auto& row : rows) {
        digest.add_field(row.word);
        digest.add_field(row.code);
        digest.add_field(std::to_string(row.priority));
        digest.end_record();
    }
    return digest.finalize_hex();
}

} // namespace Lexicode
