#pragma once

#include <hashing/blake3_pipeline.hpp>
#include <utils/time.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace Databrain {

inline constexpr char k_hex_lut[] = "0123456789abcdef";

// Format a BLAKE3 hash as a UUID string (xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx)
inline std::string hash_to_uuid(const BLAKE3Pipeline::Hash& hash) {
    char buf[37];
    char* p = buf;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) *p++ = '-';
        *p++ = k_hex_lut[(hash[i] >> 4) & 0xF];
        *p++ = k_hex_lut[hash[i] & 0xF];
    }
    *p = '\0';
    return std::string(buf, 36);
}

/**
 * @brief Derives globally unique ids for new nodes and links.
 *
 * id = prefix + uuid(BLAKE3(content, instant, process nonce, counter)).
 * The nonce keeps two processes that start at the same instant apart.
 */
class EntityIdGenerator {
public:
    EntityIdGenerator();

    std::string node_id(std::string_view label, std::string_view type, SystemTimePoint at);
    std::string link_id(std::string_view source_id, std::string_view target_id, SystemTimePoint at);

private:
    std::string next(std::string_view prefix, std::string_view a, std::string_view b, SystemTimePoint at);

    std::string nonce_;
    std::atomic<uint64_t> counter_{0};
};

} // namespace Databrain
