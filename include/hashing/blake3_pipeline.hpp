/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 hashing for entity ids and content fingerprints
 */

#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace Databrain {

/**
 * @brief BLAKE3 hashing.
 *
 * Same content = same hash. Used to derive node/link ids and the
 * content fingerprint of a replay export batch.
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    /**
     * @brief Hash string
     */
    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief Hash a sequence of fields. Each field is length-prefixed so
     * ("ab","c") and ("a","bc") never collide.
     */
    static Hash hash_fields(std::initializer_list<std::string_view> fields);
    static Hash hash_fields(const std::vector<std::string>& fields);

    /**
     * @brief Convert hash to hex string
     */
    static std::string to_hex(const Hash& hash);

    /**
     * @brief Convert hex string to hash
     */
    static Hash from_hex(const std::string& hex);
};

} // namespace Databrain
