/**
 * @file databrain_replay.cpp
 * @brief Export replay samples as per-profile JSONL
 *
 * Usage: databrain_replay [--stdout] [profile...]
 *
 * With no profiles, every built-in profile is exported. Files land in
 * DATABRAIN_REPLAY_DIR (default ./replay_out).
 */

#include <config/brain_config.hpp>
#include <replay/replay_exporter.hpp>
#include <store/postgres_graph_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace Databrain;

int main(int argc, char** argv) {
    bool to_stdout = false;
    std::vector<std::string> profiles;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--stdout") {
            to_stdout = true;
        } else if (arg == "-h" || arg == "--help") {
            std::cerr << "Usage: " << argv[0] << " [--stdout] [profile...]\n";
            return 0;
        } else {
            profiles.push_back(arg);
        }
    }

    try {
        BrainConfig config = BrainConfig::from_env();
        config.apply_logging();

        PostgresGraphStore store(config.database);
        ReplayExporter exporter(store, config.replay);
        if (profiles.empty()) profiles = exporter.profile_names();

        Timer timer;
        size_t samples = 0;
        size_t errors = 0;
        nlohmann::json reports = nlohmann::json::array();

        for (const auto& name : profiles) {
            ReplayRunReport report = to_stdout ? exporter.run(name, std::cout) : exporter.run(name);
            samples += report.samples_written;
            errors += report.errors;
            reports.push_back(report.to_json());
        }

        if (!to_stdout) {
            std::cout << reports.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        }
        Logger::info("Replay complete: " + std::to_string(samples) + " samples, " +
                     std::to_string(errors) + " errors in " + std::to_string(timer.elapsed_sec()) + "s");
        return errors == 0 ? 0 : 2;

    } catch (const std::exception& e) {
        Logger::error(std::string("Replay export failed: ") + e.what());
        return 1;
    }
}
