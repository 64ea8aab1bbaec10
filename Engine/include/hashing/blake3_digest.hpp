/**
 * @file blake3_digest.hpp
 * @brief Incremental BLAKE3 digest used for lexicon build fingerprints
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

extern "C" {
#include <blake3.h>
}

namespace Lexicode {

/**
 * @brief Streaming BLAKE3 hasher.
 *
 * Fields are fed one by one; each field is terminated with a unit separator
 * so that ("ab","c") and ("a","bc") produce different digests.
 */
class Blake3Digest {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    Blake3Digest();

    void update(const void* data, size_t len);

    void update(std::string_view str) {
        update(str.data(), str.size());
    }

    /**
     * @brief Append one field followed by the 0x1F separator
     */
    void add_field(std::string_view field);

    /**
     * @brief Close the current record (0x1E separator)
     */
    void end_record();

    Hash finalize() const;

    std::string finalize_hex() const {
        return to_hex(finalize());
    }

    static Hash hash(std::string_view str);

    static std::string to_hex(const Hash& hash);

private:
    blake3_hasher hasher_;
};

} // namespace Lexicode
