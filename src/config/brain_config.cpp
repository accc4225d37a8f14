#include <config/brain_config.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace Databrain {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

template <typename T>
T parse_number(const char* name, const char* text) {
    try {
        if constexpr (std::is_floating_point_v<T>) {
            return static_cast<T>(std::stod(text));
        } else {
            return static_cast<T>(std::stoll(text));
        }
    } catch (const std::exception&) {
        throw ValidationError(std::string("invalid numeric value for ") + name + ": " + text);
    }
}

template <typename T>
void read_env(const char* name, T& target) {
    if (const char* value = env(name)) {
        target = parse_number<T>(name, value);
    }
}

template <typename T>
void read_json(const nlohmann::json& j, const char* key, T& target) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("config key '") + key + "': " + e.what());
    }
}

void read_json_ms(const nlohmann::json& j, const char* key, std::chrono::milliseconds& target) {
    int64_t ms = target.count();
    read_json(j, key, ms);
    target = std::chrono::milliseconds(ms);
}

} // namespace

std::string DatabaseConfig::connection_string() const {
    if (!conninfo.empty()) return conninfo;

    std::ostringstream out;
    out << "host=" << host << " ";
    out << "port=" << port << " ";
    out << "dbname=" << dbname << " ";
    out << "user=" << user << " ";
    if (!password.empty()) {
        out << "password=" << password << " ";
    }
    out << "connect_timeout=" << connect_timeout_sec;
    return out.str();
}

BrainConfig BrainConfig::from_env() {
    BrainConfig config;

    if (const char* v = env("PGHOST"))     config.database.host = v;
    if (const char* v = env("PGPORT"))     config.database.port = v;
    if (const char* v = env("PGDATABASE")) config.database.dbname = v;
    if (const char* v = env("PGUSER"))     config.database.user = v;
    if (const char* v = env("PGPASSWORD")) config.database.password = v;
    if (const char* v = env("DATABRAIN_DB_URL")) config.database.conninfo = v;

    read_env("DATABRAIN_POOL_SIZE", config.database.pool_size);
    read_env("DATABRAIN_STATEMENT_TIMEOUT_MS", config.database.statement_timeout_ms);
    read_env("DATABRAIN_LOCK_TIMEOUT_MS", config.database.lock_timeout_ms);
    read_env("DATABRAIN_RETRY_ATTEMPTS", config.retry.max_attempts);
    read_env("DATABRAIN_MIN_SCORE", config.retrieval.min_score);
    read_env("DATABRAIN_DECAY_INACTIVITY_DAYS", config.decay.inactivity_days);
    read_env("DATABRAIN_DECAY_HALF_LIFE_DAYS", config.decay.half_life_days);

    if (const char* v = env("DATABRAIN_REPLAY_DIR")) config.replay.output_dir = v;
    if (const char* v = env("DATABRAIN_LOG_LEVEL"))  config.log_level = v;
    if (const char* v = env("DATABRAIN_CONFIG"))     config.apply_file(v);

    return config;
}

void BrainConfig::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("config document must be a JSON object");
    }

    if (auto it = j.find("database"); it != j.end() && it->is_object()) {
        const auto& d = *it;
        read_json(d, "host", database.host);
        read_json(d, "port", database.port);
        read_json(d, "dbname", database.dbname);
        read_json(d, "user", database.user);
        read_json(d, "password", database.password);
        read_json(d, "conninfo", database.conninfo);
        read_json(d, "pool_size", database.pool_size);
        read_json(d, "connect_timeout_sec", database.connect_timeout_sec);
        read_json(d, "statement_timeout_ms", database.statement_timeout_ms);
        read_json(d, "lock_timeout_ms", database.lock_timeout_ms);
        read_json(d, "acquire_timeout_ms", database.acquire_timeout_ms);
    }

    if (auto it = j.find("retry"); it != j.end() && it->is_object()) {
        read_json(*it, "max_attempts", retry.max_attempts);
        read_json_ms(*it, "base_backoff_ms", retry.base_backoff);
        read_json_ms(*it, "max_backoff_ms", retry.max_backoff);
    }

    if (auto it = j.find("retrieval"); it != j.end() && it->is_object()) {
        read_json(*it, "min_score", retrieval.min_score);
        read_json(*it, "default_max_neighbors", retrieval.default_max_neighbors);
        read_json(*it, "candidate_scan_limit", retrieval.candidate_scan_limit);
    }

    if (auto it = j.find("decay"); it != j.end() && it->is_object()) {
        read_json(*it, "inactivity_days", decay.inactivity_days);
        read_json(*it, "half_life_days", decay.half_life_days);
        read_json(*it, "min_mass", decay.min_mass);
    }

    if (auto it = j.find("replay"); it != j.end() && it->is_object()) {
        read_json(*it, "min_mass", replay.min_mass);
        read_json(*it, "min_access_count", replay.min_access_count);
        read_json(*it, "max_nodes", replay.max_nodes);
        read_json(*it, "max_neighbors", replay.max_neighbors);
        read_json(*it, "output_dir", replay.output_dir);
    }

    read_json(j, "log_level", log_level);
    read_json(j, "triggered_by", triggered_by);

    if (retry.max_attempts < 1) {
        throw ValidationError("retry.max_attempts must be at least 1");
    }
    if (decay.half_life_days <= 0.0) {
        throw ValidationError("decay.half_life_days must be positive");
    }
    if (database.pool_size == 0) {
        throw ValidationError("database.pool_size must be at least 1");
    }
}

void BrainConfig::apply_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ValidationError("cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("config file " + path + " is not valid JSON: " + e.what());
    }
    apply_json(j);
}

void BrainConfig::apply_logging() const {
    auto level = Logger::parse_level(log_level);
    if (!level) {
        Logger::warn("Unknown log level '" + log_level + "', keeping current level");
        return;
    }
    Logger::set_level(*level);
}

} // namespace Databrain
