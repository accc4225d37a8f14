/**
 * @file databrain_cli.cpp
 * @brief Command-line access to the shared brain
 *
 * Usage:
 *   databrain_cli context <query> [max_neighbors]
 *   databrain_cli mutate <actions.json | ->
 *   databrain_cli status
 *   databrain_cli init-schema
 */

#include <config/brain_config.hpp>
#include <engine/brain.hpp>
#include <layout/force_layout.hpp>
#include <maintenance/decay_scheduler.hpp>
#include <store/postgres_graph_store.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace Databrain;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " context <query> [max_neighbors]\n"
              << "  " << prog << " mutate <actions.json | ->\n"
              << "  " << prog << " status\n"
              << "  " << prog << " init-schema\n";
}

nlohmann::json read_actions(const std::string& source) {
    if (source == "-") {
        return nlohmann::json::parse(std::cin);
    }
    std::ifstream file(source);
    if (!file) {
        throw std::runtime_error("Cannot open " + source);
    }
    return nlohmann::json::parse(file);
}

nlohmann::json stats_json(const StoreStats& s) {
    return {
        {"nodes", s.nodes},
        {"redirected_nodes", s.redirected_nodes},
        {"links", s.links},
        {"force_fields", s.force_fields},
        {"log_entries", s.log_entries}
    };
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }
    std::string command = argv[1];

    try {
        BrainConfig config = BrainConfig::from_env();
        config.apply_logging();

        PostgresGraphStore store(config.database);
        SystemClock clock;

        if (command == "init-schema") {
            store.ensure_schema();
            for (const auto& field : ForceLayout::default_fields()) {
                store.upsert_force_field(field);
            }
            Logger::success("Schema ready, " + std::to_string(store.list_force_fields().size()) + " force fields");
            return 0;
        }

        Brain brain(store, clock, config);

        if (command == "context") {
            if (argc < 3) {
                usage(argv[0]);
                return 1;
            }
            std::optional<size_t> max_neighbors;
            if (argc > 3) max_neighbors = static_cast<size_t>(std::stoul(argv[3]));
            std::cout << brain.get_brain_context_json(argv[2], max_neighbors).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            return 0;
        }

        if (command == "mutate") {
            if (argc < 3) {
                usage(argv[0]);
                return 1;
            }
            nlohmann::json results = brain.mutate_brain(read_actions(argv[2]));
            std::cout << results.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            for (const auto& r : results) {
                if (!r.value("success", false)) return 2;
            }
            return 0;
        }

        if (command == "status") {
            DecayScheduler scheduler(store, brain.engine(), clock, config.decay);
            nlohmann::json out = {
                {"store", stats_json(store.stats())},
                {"decay", scheduler.status().to_json()}
            };
            std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
            return 0;
        }

        usage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        Logger::error(std::string(argv[1]) + " failed: " + e.what());
        return 1;
    }
}
