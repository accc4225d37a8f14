/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <config/brain_config.hpp>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace Databrain {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Failures are classified into engine errors: lost connections and
 * statement timeouts become StoreUnavailableError; serialization failures,
 * deadlocks, lock timeouts and unique violations become ConflictError.
 * Not thread-safe: one connection per thread (see ConnectionPool).
 */
class PostgresConnection {
public:
    using Row = std::vector<std::string>;

    /**
     * @brief Connect and apply session timeouts from config
     * @throws StoreUnavailableError when the server cannot be reached
     */
    explicit PostgresConnection(const DatabaseConfig& config);

    ~PostgresConnection();

    // Owned by one pool slot for its whole life
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    /**
     * @brief Check if connected
     */
    bool is_connected() const;

    /**
     * @brief Execute query (no results expected)
     * @return Number of affected rows
     */
    size_t execute(const std::string& sql);

    /**
     * @brief Execute query with parameters (no results)
     * @return Number of affected rows
     */
    size_t execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief First column of the first row, nullopt for no row or NULL
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query and iterate rows
     * @param callback Called for each row: callback(row_data)
     */
    void query(const std::string& sql, std::function<void(const Row&)> callback);

    /**
     * @brief Execute query with params and iterate rows
     */
    void query(const std::string& sql, const std::vector<std::string>& params,
               std::function<void(const Row&)> callback);

    /**
     * @brief Begin transaction
     */
    void begin();

    /**
     * @brief Commit transaction
     */
    void commit();

    /**
     * @brief Rollback transaction
     */
    void rollback();

    /**
     * @brief RAII transaction guard. Rolls back unless committed.
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

private:
    void connect(const std::string& conninfo);
    void disconnect();
    bool reset();
    void ensure_connected();
    PGresult* exec(const std::string& sql, const std::vector<std::string>* params);
    void check_result(PGresult* result);
    void for_each_row(PGresult* result, const std::function<void(const Row&)>& callback);
    static size_t affected_rows(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace Databrain
