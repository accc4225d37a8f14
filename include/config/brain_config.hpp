/**
 * @file brain_config.hpp
 * @brief Engine configuration from environment variables and JSON files
 */

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Databrain {

struct DatabaseConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "databrain";
    std::string user = "postgres";
    std::string password;
    std::string conninfo;            // overrides the fields above when set

    size_t pool_size = 4;
    int connect_timeout_sec = 5;
    int statement_timeout_ms = 5000;
    int lock_timeout_ms = 1000;
    int acquire_timeout_ms = 5000;   // waiting for a pooled connection

    /**
     * @brief libpq connection string
     */
    std::string connection_string() const;
};

struct RetryConfig {
    int max_attempts = 5;
    std::chrono::milliseconds base_backoff{5};
    std::chrono::milliseconds max_backoff{200};
};

struct RetrievalConfig {
    double min_score = 0.2;
    size_t default_max_neighbors = 5;
    size_t candidate_scan_limit = 0;     // 0 = score every live node
};

struct DecayConfig {
    double inactivity_days = 7.0;
    double half_life_days = 30.0;
    double min_mass = 1.0;
};

struct ReplayConfig {
    double min_mass = 50.0;
    int64_t min_access_count = 5;
    size_t max_nodes = 100;
    size_t max_neighbors = 8;
    std::string output_dir = "./replay_out";
};

struct BrainConfig {
    DatabaseConfig database;
    RetryConfig retry;
    RetrievalConfig retrieval;
    DecayConfig decay;
    ReplayConfig replay;
    std::string log_level = "info";
    std::string triggered_by = "databrain";

    /**
     * @brief Load from environment.
     *
     * Database: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD, DATABRAIN_DB_URL
     * Engine:   DATABRAIN_POOL_SIZE, DATABRAIN_STATEMENT_TIMEOUT_MS,
     *           DATABRAIN_LOCK_TIMEOUT_MS, DATABRAIN_RETRY_ATTEMPTS,
     *           DATABRAIN_MIN_SCORE, DATABRAIN_DECAY_INACTIVITY_DAYS,
     *           DATABRAIN_DECAY_HALF_LIFE_DAYS, DATABRAIN_REPLAY_DIR,
     *           DATABRAIN_LOG_LEVEL, DATABRAIN_CONFIG (JSON file overlay)
     */
    static BrainConfig from_env();

    /**
     * @brief Overlay values present in a JSON document onto this config.
     * Unknown keys are ignored; wrongly typed values throw ValidationError.
     */
    void apply_json(const nlohmann::json& j);

    /**
     * @brief Overlay from a JSON file on disk.
     */
    void apply_file(const std::string& path);

    /**
     * @brief Apply log_level to the global Logger.
     */
    void apply_logging() const;
};

} // namespace Databrain
