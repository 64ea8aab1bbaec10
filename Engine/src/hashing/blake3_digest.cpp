/**
 * @file blake3_digest.cpp
 * @brief BLAKE3 digest implementation
 */

#include <hashing/blake3_digest.hpp>

namespace Lexicode {

namespace {
constexpr char k_hex_lut[] = "0123456789abcdef";
constexpr uint8_t FIELD_SEPARATOR = 0x1F;
constexpr uint8_t RECORD_SEPARATOR = 0x1E;
}

Blake3Digest::Blake3Digest() {
    blake3_hasher_init(&hasher_);
}

void Blake3Digest::update(const void* data, size_t len) {
    blake3_hasher_update(&hasher_, data, len);
}

void Blake3Digest::add_field(std::string_view field) {
    update(field.data(), field.size());
    update(&FIELD_SEPARATOR, 1);
}

void Blake3Digest::end_record() {
    update(&RECORD_SEPARATOR, 1);
}

Blake3Digest::Hash Blake3Digest::finalize() const {
    Hash result;
    // finalize does not consume the hasher state, so the digest can keep growing
    blake3_hasher_finalize(&hasher_, result.data(), HASH_SIZE);
    return result;
}

Blake3Digest::Hash Blake3Digest::hash(std::string_view str) {
    Blake3Digest digest;
    digest.update(str);
    return digest.finalize();
}

std::string Blake3Digest::to_hex(const Hash& hash) {
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t byte : hash) {
        out.push_back(k_hex_lut[(byte >> 4) & 0xF]);
        out.push_back(k_hex_lut[byte & 0xF]);
    }
    return out;
}

} // namespace Lexicode
