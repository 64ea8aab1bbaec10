#include <storage/lexicon_store.hpp>
#include <utils/logger.hpp>

namespace Lexicode {

StoreTransaction::StoreTransaction(LexiconStore& store) : store_(store) {
    store_.begin();
    active_ = true;
}

StoreTransaction::~StoreTransaction() {
    if (!active_) return;
    try {
        store_.rollback();
    } catch (const std::exception& e) {
        Logger::warn(std::string("Rollback failed: ") + e.what());
    }
}

void StoreTransaction::commit() {
    store_.commit();
    active_ = false;
}

void StoreTransaction::rollback() {
    active_ = false;
    store_.rollback();
}

void StoreTransaction::restart() {
    rollback();
    store_.begin();
    active_ = true;
}

} // namespace Lexicode
