#include <hashing/entity_id.hpp>
#include <chrono>
#include <random>
#include <thread>
#include <unistd.h>

namespace Databrain {

EntityIdGenerator::EntityIdGenerator() {
    std::random_device rd;
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    nonce_ = std::to_string(rd()) + ":" + std::to_string(::getpid()) + ":" +
             std::to_string(tid) + ":" + std::to_string(now);
}

std::string EntityIdGenerator::node_id(std::string_view label, std::string_view type, SystemTimePoint at) {
    return next("n_", label, type, at);
}

std::string EntityIdGenerator::link_id(std::string_view source_id, std::string_view target_id, SystemTimePoint at) {
    return next("l_", source_id, target_id, at);
}

std::string EntityIdGenerator::next(std::string_view prefix, std::string_view a, std::string_view b,
                                    SystemTimePoint at) {
    uint64_t seq = counter_.fetch_add(1, std::memory_order_relaxed);
    std::string micros = std::to_string(to_epoch_micros(at));
    std::string count = std::to_string(seq);

    auto hash = BLAKE3Pipeline::hash_fields({a, b, micros, nonce_, count});
    return std::string(prefix) + hash_to_uuid(hash);
}

} // namespace Databrain
