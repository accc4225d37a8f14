/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Databrain {

namespace {

void update_field(blake3_hasher& hasher, std::string_view field) {
    uint8_t len[8];
    uint64_t n = field.size();
    for (int i = 0; i < 8; ++i) {
        len[i] = static_cast<uint8_t>((n >> (i * 8)) & 0xFF);
    }
    blake3_hasher_update(&hasher, len, sizeof(len));
    blake3_hasher_update(&hasher, field.data(), field.size());
}

} // namespace

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_fields(std::initializer_list<std::string_view> fields) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    for (std::string_view field : fields) {
        update_field(hasher, field);
    }
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash_fields(const std::vector<std::string>& fields) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    for (const auto& field : fields) {
        update_field(hasher, field);
    }
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (uint8_t byte : hash) {
        oss << std::setw(2) << (int)byte;
    }

    return oss.str();
}

BLAKE3Pipeline::Hash BLAKE3Pipeline::from_hex(const std::string& hex) {
    Hash result = {0};
    std::string clean = hex;
    // Remove hyphens if present (UUID format)
    clean.erase(std::remove(clean.begin(), clean.end(), '-'), clean.end());

    if (clean.size() != HASH_SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length: " + std::to_string(clean.size()) + ". Expected 32 (128-bit).");
    }

    for (size_t i = 0; i < HASH_SIZE; ++i) {
        std::string byte_str = clean.substr(i * 2, 2);
        result[i] = (uint8_t)std::stoul(byte_str, nullptr, 16);
    }

    return result;
}

} // namespace Databrain
