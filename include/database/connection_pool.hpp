#pragma once

#include <database/postgres_connection.hpp>
#include <config/brain_config.hpp>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace Databrain {

/**
 * @brief Bounded pool of PostgreSQL connections.
 *
 * Connections are opened lazily up to pool_size. A caller that cannot get a
 * connection within acquire_timeout_ms gets StoreUnavailableError. A lease
 * whose connection broke is discarded on release instead of being reused.
 */
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> conn)
            : pool_(&pool), conn_(std::move(conn)) {}

        ~Lease() {
            if (pool_ && conn_) pool_->release(std::move(conn_));
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& other) noexcept : pool_(other.pool_), conn_(std::move(other.conn_)) {
            other.pool_ = nullptr;
        }

        PostgresConnection& operator*() { return *conn_; }
        PostgresConnection* operator->() { return conn_.get(); }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<PostgresConnection> conn_;
    };

    explicit ConnectionPool(DatabaseConfig config);

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    Lease acquire();

    size_t idle_count() const;
    size_t open_count() const;

private:
    void release(std::unique_ptr<PostgresConnection> conn);

    DatabaseConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::unique_ptr<PostgresConnection>> idle_;
    size_t open_ = 0;
};

} // namespace Databrain
