/**
 * @file test_config.cpp
 * @brief Unit tests for BrainConfig loading
 */

#include <gtest/gtest.h>
#include <config/brain_config.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace Databrain;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(ConfigTest, Defaults) {
    BrainConfig config;
    EXPECT_EQ(config.retry.max_attempts, 5);
    EXPECT_EQ(config.retry.base_backoff.count(), 5);
    EXPECT_EQ(config.retry.max_backoff.count(), 200);
    EXPECT_DOUBLE_EQ(config.retrieval.min_score, 0.2);
    EXPECT_DOUBLE_EQ(config.decay.inactivity_days, 7.0);
    EXPECT_DOUBLE_EQ(config.decay.half_life_days, 30.0);
    EXPECT_DOUBLE_EQ(config.decay.min_mass, 1.0);
    EXPECT_DOUBLE_EQ(config.replay.min_mass, 50.0);
    EXPECT_EQ(config.replay.min_access_count, 5);
    EXPECT_EQ(config.replay.max_nodes, 100u);
}

TEST(ConfigTest, ConnectionString) {
    DatabaseConfig db;
    db.host = "db.internal";
    db.dbname = "brain";
    db.password = "secret";

    std::string conn = db.connection_string();
    EXPECT_NE(conn.find("host=db.internal"), std::string::npos);
    EXPECT_NE(conn.find("dbname=brain"), std::string::npos);
    EXPECT_NE(conn.find("password=secret"), std::string::npos);

    db.conninfo = "postgresql://u@h/d";
    EXPECT_EQ(db.connection_string(), "postgresql://u@h/d");
}

TEST(ConfigTest, EnvironmentOverrides) {
    ScopedEnv host("PGHOST", "pg.example");
    ScopedEnv score("DATABRAIN_MIN_SCORE", "0.35");
    ScopedEnv attempts("DATABRAIN_RETRY_ATTEMPTS", "9");
    ScopedEnv dir("DATABRAIN_REPLAY_DIR", "/tmp/replay");

    BrainConfig config = BrainConfig::from_env();
    EXPECT_EQ(config.database.host, "pg.example");
    EXPECT_DOUBLE_EQ(config.retrieval.min_score, 0.35);
    EXPECT_EQ(config.retry.max_attempts, 9);
    EXPECT_EQ(config.replay.output_dir, "/tmp/replay");
}

TEST(ConfigTest, BadNumericEnvIsValidationError) {
    ScopedEnv attempts("DATABRAIN_RETRY_ATTEMPTS", "lots");
    EXPECT_THROW(BrainConfig::from_env(), ValidationError);
}

TEST(ConfigTest, JsonOverlay) {
    BrainConfig config;
    config.apply_json({
        {"retry", {{"max_attempts", 3}, {"base_backoff_ms", 1}}},
        {"decay", {{"half_life_days", 14.0}}},
        {"replay", {{"max_neighbors", 4}}},
        {"log_level", "debug"},
        {"unknown_section", {{"ignored", true}}}
    });

    EXPECT_EQ(config.retry.max_attempts, 3);
    EXPECT_EQ(config.retry.base_backoff.count(), 1);
    EXPECT_EQ(config.retry.max_backoff.count(), 200);
    EXPECT_DOUBLE_EQ(config.decay.half_life_days, 14.0);
    EXPECT_DOUBLE_EQ(config.decay.inactivity_days, 7.0);
    EXPECT_EQ(config.replay.max_neighbors, 4u);
    EXPECT_EQ(config.log_level, "debug");
}

TEST(ConfigTest, JsonOverlayRejectsBadValues) {
    BrainConfig config;
    EXPECT_THROW(config.apply_json({{"retry", {{"max_attempts", "three"}}}}), ValidationError);
    EXPECT_THROW(config.apply_json({{"decay", {{"half_life_days", 0.0}}}}), ValidationError);
    EXPECT_THROW(config.apply_json(nlohmann::json::array()), ValidationError);
}

TEST(ConfigTest, FileOverlay) {
    auto path = std::filesystem::temp_directory_path() / "databrain_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"retrieval": {"min_score": 0.5, "default_max_neighbors": 2}})";
    }

    BrainConfig config;
    config.apply_file(path.string());
    EXPECT_DOUBLE_EQ(config.retrieval.min_score, 0.5);
    EXPECT_EQ(config.retrieval.default_max_neighbors, 2u);

    std::filesystem::remove(path);
    EXPECT_THROW(config.apply_file(path.string()), ValidationError);
}

TEST(ConfigTest, ApplyLogging) {
    auto previous = Logger::level();

    BrainConfig config;
    config.log_level = "error";
    config.apply_logging();
    EXPECT_EQ(Logger::level(), Logger::Level::Error);

    config.log_level = "chatty";
    config.apply_logging();
    EXPECT_EQ(Logger::level(), Logger::Level::Error);

    Logger::set_level(previous);
}
