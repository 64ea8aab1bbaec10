#include <storage/memory_lexicon_store.hpp>

namespace Lexicode {

void MemoryLexiconStore::lock_destination(const std::string& name) {
    committed_.try_emplace(name);
    if (working_) working_->try_emplace(name);
    locked_.insert(name);
}

void MemoryLexiconStore::unlock_destination(const std::string& name) {
    locked_.erase(name);
}

MemoryLexiconStore::Destination& MemoryLexiconStore::writable() {
    if (!working_) {
        throw std::runtime_error("MemoryLexiconStore: write outside a transaction");
    }
    auto it = working_->find(current_);
    if (current_.empty() || it == working_->end()) {
        throw std::runtime_error("MemoryLexiconStore: no destination selected");
    }
    return it->second;
}

const MemoryLexiconStore::Destination& MemoryLexiconStore::readable() const {
    const Destinations& view = working_ ? *working_ : committed_;
    auto it = view.find(current_);
    if (current_.empty() || it == view.end()) {
        throw std::runtime_error("MemoryLexiconStore: no destination selected");
    }
    return it->second;
}

void MemoryLexiconStore::reset_destination(const std::string& name) {
    if (!working_) {
        throw std::runtime_error("MemoryLexiconStore: reset_destination outside a transaction");
    }
    if (locked_.count(name) && working_->count(name)) {
        throw DestinationUnavailable(name, "locked by another session");
    }
    (*working_)[name] = Destination{};
    current_ = name;
}

void MemoryLexiconStore::open_destination(const std::string& name) {
    const Destinations& view = working_ ? *working_ : committed_;
    if (!view.count(name)) {
        throw std::runtime_error("Destination '" + name + "' does not exist");
    }
    current_ = name;
}

void MemoryLexiconStore::begin() {
    if (working_) {
        throw std::runtime_error("MemoryLexiconStore: transaction already open");
    }
    working_ = committed_;
}

void MemoryLexiconStore::commit() {
    if (!working_) {
        throw std::runtime_error("MemoryLexiconStore: commit without a transaction");
    }
    committed_ = std::move(*working_);
    working_.reset();
}

void MemoryLexiconStore::rollback() {
    working_.reset();
}

void MemoryLexiconStore::insert_entries(const std::vector<LexiconEntry>& entries) {
    Destination& dest = writable();
    for (const auto& e : entries) dest.lexicon.insert(e);
}

bool MemoryLexiconStore::update_code(const std::string& word, const std::string& old_code,
                                     const std::string& new_code) {
    return writable().lexicon.update_code(word, old_code, new_code);
}

void MemoryLexiconStore::insert_base_forms(const std::map<std::string, std::string>& base_forms) {
    Destination& dest = writable();
    for (const auto& [word, lemma] : base_forms) dest.base_forms.emplace(word, lemma);
}

void MemoryLexiconStore::insert_antonyms(const std::vector<AntonymPair>& pairs) {
    Destination& dest = writable();
    dest.antonyms.insert(pairs.begin(), pairs.end());
}

void MemoryLexiconStore::write_metadata(const std::string& key, const std::string& value) {
    writable().metadata[key] = value;
}

std::vector<LexiconEntry> MemoryLexiconStore::load_entries() {
    return readable().lexicon.entries();
}

std::optional<std::string> MemoryLexiconStore::load_metadata(const std::string& key) {
    const auto& metadata = readable().metadata;
    auto it = metadata.find(key);
    if (it == metadata.end()) return std::nullopt;
    return it->second;
}

} // namespace Lexicode
