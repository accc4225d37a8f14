#include <database/connection_pool.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>

namespace Databrain {

ConnectionPool::ConnectionPool(DatabaseConfig config) : config_(std::move(config)) {}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.acquire_timeout_ms);

    while (idle_.empty() && open_ >= config_.pool_size) {
        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
            idle_.empty() && open_ >= config_.pool_size) {
            throw StoreUnavailableError("Timed out waiting for a database connection");
        }
    }

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Lease(*this, std::move(conn));
    }

    // Open outside the lock; the slot is reserved first
    ++open_;
    lock.unlock();

    try {
        auto conn = std::make_unique<PostgresConnection>(config_);
        return Lease(*this, std::move(conn));
    } catch (...) {
        lock.lock();
        --open_;
        lock.unlock();
        cv_.notify_one();
        throw;
    }
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn->is_connected()) {
            idle_.push_back(std::move(conn));
        } else {
            Logger::warn("Discarding broken database connection");
            --open_;
        }
    }
    cv_.notify_one();
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return idle_.size();
}

size_t ConnectionPool::open_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

} // namespace Databrain
