#include <lexicon/code_encoder.hpp>
#include <stdexcept>

namespace Lexicode {

uint32_t CodeEncoder::allocate(const std::string& superclass) {
    uint32_t& counter = counters_[superclass];
    if (counter >= MAX_LOCAL_SEQUENCE) {
        throw std::overflow_error("Local sequence exhausted for superclass " + superclass);
    }
    return ++counter;
}

Code CodeEncoder::encode(const std::string& superclass, PartOfSpeech pos, Abstractness abstractness, Valence valence) {
    Code code;
    code.superclass = superclass;
    code.local_seq = allocate(superclass);
    code.pos = pos;
    code.abstractness = abstractness;
    code.valence = valence;
    return code;
}

uint32_t CodeEncoder::current(const std::string& superclass) const {
    auto it = counters_.find(superclass);
    return it == counters_.end() ? 0 : it->second;
}

uint32_t PriorityRanker::rank(uint32_t frequency, bool specific_superclass, uint32_t ordinal) {
    uint32_t priority = frequency;
    if (specific_superclass) priority += SPECIFIC_BONUS;
    if (ordinal < ORDINAL_BONUS) priority += ORDINAL_BONUS - ordinal;
    return priority;
}

} // namespace Lexicode
