/**
 * @file databrain_decay.cpp
 * @brief Cron entrypoint for temporal decay
 *
 * Usage: databrain_decay [--status]
 *
 * Prints the run report (or, with --status, the decay status) as JSON on stdout.
 */

#include <config/brain_config.hpp>
#include <engine/brain.hpp>
#include <maintenance/decay_scheduler.hpp>
#include <store/postgres_graph_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <iostream>
#include <string>

using namespace Databrain;

int main(int argc, char** argv) {
    bool status_only = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--status") {
            status_only = true;
        } else {
            std::cerr << "Usage: " << argv[0] << " [--status]\n";
            return 1;
        }
    }

    try {
        BrainConfig config = BrainConfig::from_env();
        config.apply_logging();
        config.triggered_by = "decay_scheduler";

        PostgresGraphStore store(config.database);
        SystemClock clock;
        Brain brain(store, clock, config);
        DecayScheduler scheduler(store, brain.engine(), clock, config.decay);

        if (status_only) {
            std::cout << scheduler.status().to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            return 0;
        }

        DecayRunReport report = scheduler.run();
        std::cout << report.to_json().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return report.errors == 0 ? 0 : 2;

    } catch (const std::exception& e) {
        Logger::error(std::string("Decay run failed: ") + e.what());
        return 1;
    }
}
