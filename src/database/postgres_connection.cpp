/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cstdlib>

namespace Databrain {

namespace {

// SQLSTATE classes that mean "the store could not serve the request"
bool is_unavailable_state(const std::string& state) {
    if (state.rfind("08", 0) == 0) return true;     // connection exception
    if (state == "57014") return true;              // query_canceled (statement_timeout)
    if (state.rfind("57P", 0) == 0) return true;    // admin/crash shutdown
    if (state == "53300") return true;              // too_many_connections
    return false;
}

bool is_conflict_state(const std::string& state) {
    return state == "40001"     // serialization_failure
        || state == "40P01"     // deadlock_detected
        || state == "55P03"     // lock_not_available (lock_timeout)
        || state == "23505";    // unique_violation
}

bool is_validation_state(const std::string& state) {
    return state == "23503"     // foreign_key_violation
        || state == "23514"     // check_violation
        || state == "22P02";    // invalid_text_representation
}

} // namespace

PostgresConnection::PostgresConnection(const DatabaseConfig& config) {
    connect(config.connection_string());

    // Every round trip is bounded: a timed-out statement aborts its transaction
    try {
        execute("SET statement_timeout = " + std::to_string(config.statement_timeout_ms));
        execute("SET lock_timeout = " + std::to_string(config.lock_timeout_ms));
    } catch (...) {
        disconnect();
        throw;
    }
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StoreUnavailableError("PostgreSQL connection failed: " + last_error_);
    }

    // Timestamps are exchanged as epoch microseconds; keep the session in UTC anyway
    PGresult* res = PQexec(conn_, "SET TIME ZONE 'UTC'");
    try {
        check_result(res);
    } catch (...) {
        disconnect();
        throw;
    }
    PQclear(res);
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PostgresConnection::reset() {
    if (!conn_) return false;
    PQreset(conn_);
    return PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::ensure_connected() {
    if (is_connected()) return;
    if (reset()) {
        Logger::warn("PostgreSQL connection re-established");
        return;
    }
    throw StoreUnavailableError("Not connected to database");
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
        return;
    }

    last_error_ = conn_ ? PQerrorMessage(conn_) : "no connection";
    const char* raw_state = result ? PQresultErrorField(result, PG_DIAG_SQLSTATE) : nullptr;
    std::string state = raw_state ? raw_state : "";
    PQclear(result);

    std::string message = "PostgreSQL query failed";
    if (!state.empty()) message += " [" + state + "]";
    message += ": " + last_error_;

    if (state.empty() || is_unavailable_state(state)) {
        throw StoreUnavailableError(message);
    }
    if (is_conflict_state(state)) {
        throw ConflictError(message);
    }
    if (is_validation_state(state)) {
        throw ValidationError(message);
    }
    throw StoreUnavailableError(message);
}

PGresult* PostgresConnection::exec(const std::string& sql, const std::vector<std::string>* params) {
    ensure_connected();

    if (!params) {
        return PQexec(conn_, sql.c_str());
    }

    std::vector<const char*> param_values;
    param_values.reserve(params->size());
    for (const auto& p : *params) {
        param_values.push_back(p.c_str());
    }

    return PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params->size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );
}

size_t PostgresConnection::affected_rows(PGresult* result) {
    const char* tuples = PQcmdTuples(result);
    return (tuples && *tuples) ? std::strtoull(tuples, nullptr, 10) : 0;
}

void PostgresConnection::for_each_row(PGresult* result, const std::function<void(const Row&)>& callback) {
    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    for (int i = 0; i < nrows; ++i) {
        Row row;
        row.reserve(nfields);

        for (int j = 0; j < nfields; ++j) {
            row.push_back(PQgetvalue(result, i, j));
        }

        try {
            callback(row);
        } catch (...) {
            PQclear(result);
            throw;
        }
    }

    PQclear(result);
}

size_t PostgresConnection::execute(const std::string& sql) {
    PGresult* result = exec(sql, nullptr);
    check_result(result);

    size_t affected = affected_rows(result);
    PQclear(result);
    return affected;
}

size_t PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec(sql, &params);
    check_result(result);

    size_t affected = affected_rows(result);
    PQclear(result);
    return affected;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec(sql, &params);
    check_result(result);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, std::function<void(const Row&)> callback) {
    PGresult* result = exec(sql, nullptr);
    check_result(result);
    for_each_row(result, callback);
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               std::function<void(const Row&)> callback) {
    PGresult* result = exec(sql, &params);
    check_result(result);
    for_each_row(result, callback);
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_ && !rolled_back_) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    rolled_back_ = true;
}

} // namespace Databrain
