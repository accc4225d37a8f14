#include <maintenance/decay_scheduler.hpp>
#include <utils/logger.hpp>

namespace Databrain {

nlohmann::json DecayRunReport::to_json() const {
    return {
        {"nodes_scanned", nodes_scanned},
        {"nodes_decayed", nodes_decayed},
        {"errors", errors},
        {"nodes_at_minimum", nodes_at_minimum},
        {"total_mass_removed", total_mass_removed},
        {"elapsed_ms", elapsed_ms}
    };
}

nlohmann::json DecayStatus::to_json() const {
    return {
        {"active_nodes", {{"count", active_nodes}, {"avg_mass", active_avg_mass}}},
        {"inactive_nodes", {{"count", inactive_nodes}, {"avg_mass", inactive_avg_mass}}},
        {"nodes_at_minimum", nodes_at_minimum},
        {"mass_distribution", {
            {"up_to_10", mass_up_to_10},
            {"10_to_50", mass_10_to_50},
            {"50_to_100", mass_50_to_100}
        }},
        {"policy", {
            {"inactivity_days", policy.inactivity_days},
            {"half_life_days", policy.half_life_days},
            {"min_mass", policy.min_mass}
        }}
    };
}

DecayScheduler::DecayScheduler(GraphStore& store, MutationEngine& engine, const Clock& clock, DecayConfig policy)
    : store_(store), engine_(engine), clock_(clock), policy_(policy) {
    if (!(policy_.half_life_days > 0.0)) {
        throw ValidationError("half_life_days must be positive");
    }
}

SystemTimePoint DecayScheduler::cutoff(SystemTimePoint now) const {
    using Days = std::chrono::duration<double, std::ratio<86400>>;
    return now - std::chrono::duration_cast<SystemTimePoint::duration>(Days(policy_.inactivity_days));
}

DecayRunReport DecayScheduler::run() {
    Timer timer;
    DecayRunReport report;

    SystemTimePoint now = clock_.now();
    int64_t today = utc_day_number(now);

    NodeScan scan;
    scan.order = NodeOrder::LastAccessedAsc;
    scan.accessed_before = cutoff(now);

    Logger::step("Temporal decay: scanning nodes inactive for more than " +
                 std::to_string(policy_.inactivity_days) + " days");

    MutationContext ctx;
    ctx.triggered_by = "decay_scheduler";
    ctx.reason = "temporal_decay";

    for (const auto& node : store_.scan_nodes(scan)) {
        ++report.nodes_scanned;

        if (node.last_decay_applied_at && utc_day_number(*node.last_decay_applied_at) == today) {
            continue;
        }
        if (node.mass <= policy_.min_mass) {
            ++report.nodes_at_minimum;
            continue;
        }

        try {
            MutationResult result = engine_.temporal_decay(TemporalDecayParams{node.id, policy_}, ctx);
            if (!result.detail.value("decayed", false)) continue;

            double old_mass = result.detail.value("old_mass", node.mass);
            ++report.nodes_decayed;
            report.total_mass_removed += old_mass - result.node->mass;
            if (result.node->mass <= policy_.min_mass) ++report.nodes_at_minimum;
        } catch (const BrainError& e) {
            ++report.errors;
            Logger::warn("Decay of " + node.id + " failed: " + e.what());
        }
    }

    report.elapsed_ms = timer.elapsed_ms();
    Logger::success("Temporal decay: " + std::to_string(report.nodes_decayed) + "/" +
                    std::to_string(report.nodes_scanned) + " nodes decayed, " +
                    std::to_string(report.errors) + " errors, " +
                    std::to_string(report.total_mass_removed) + " mass removed");
    return report;
}

DecayStatus DecayScheduler::status() {
    DecayStatus s;
    s.policy = policy_;

    SystemTimePoint threshold = cutoff(clock_.now());
    double active_mass = 0.0;
    double inactive_mass = 0.0;

    for (const auto& node : store_.scan_nodes(NodeScan())) {
        if (node.last_accessed < threshold) {
            ++s.inactive_nodes;
            inactive_mass += node.mass;
        } else {
            ++s.active_nodes;
            active_mass += node.mass;
        }

        if (node.mass <= policy_.min_mass) ++s.nodes_at_minimum;

        if (node.mass <= 10.0) {
            ++s.mass_up_to_10;
        } else if (node.mass <= 50.0) {
            ++s.mass_10_to_50;
        } else {
            ++s.mass_50_to_100;
        }
    }

    if (s.active_nodes) s.active_avg_mass = active_mass / static_cast<double>(s.active_nodes);
    if (s.inactive_nodes) s.inactive_avg_mass = inactive_mass / static_cast<double>(s.inactive_nodes);
    return s;
}

} // namespace Databrain
