/**
 * @file decay_scheduler.hpp
 * @brief Periodic exponential decay of inactive nodes
 */

#pragma once

#include <engine/mutation_engine.hpp>
#include <store/graph_store.hpp>
#include <config/brain_config.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>

namespace Databrain {

struct DecayRunReport {
    size_t nodes_scanned = 0;
    size_t nodes_decayed = 0;
    size_t errors = 0;
    size_t nodes_at_minimum = 0;
    double total_mass_removed = 0.0;
    double elapsed_ms = 0.0;

    nlohmann::json to_json() const;
};

struct DecayStatus {
    size_t active_nodes = 0;
    double active_avg_mass = 0.0;
    size_t inactive_nodes = 0;
    double inactive_avg_mass = 0.0;
    size_t nodes_at_minimum = 0;

    // Mass distribution
    size_t mass_up_to_10 = 0;
    size_t mass_10_to_50 = 0;
    size_t mass_50_to_100 = 0;

    DecayConfig policy;

    nlohmann::json to_json() const;
};

/**
 * @brief Externally triggered (cron) decay pass.
 *
 * Scans live nodes whose last_accessed is older than the inactivity window,
 * oldest first, and hands each to MutationEngine::temporal_decay, so every
 * decayed node gets a TEMPORAL_DECAY log entry. Nodes already decayed on the
 * current UTC day are skipped, which makes a second run on the same day a
 * no-op. A failing node is counted in `errors` and the run goes on.
 */
class DecayScheduler {
public:
    DecayScheduler(GraphStore& store, MutationEngine& engine, const Clock& clock,
                   DecayConfig policy = DecayConfig());

    DecayRunReport run();
    DecayStatus status();

    const DecayConfig& policy() const { return policy_; }

private:
    SystemTimePoint cutoff(SystemTimePoint now) const;

    GraphStore& store_;
    MutationEngine& engine_;
    const Clock& clock_;
    DecayConfig policy_;
};

} // namespace Databrain
