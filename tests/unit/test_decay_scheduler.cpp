/**
 * @file test_decay_scheduler.cpp
 * @brief Unit tests for scheduled temporal decay
 */

#include <gtest/gtest.h>
#include <maintenance/decay_scheduler.hpp>
#include <engine/mutation_engine.hpp>
#include <store/memory_graph_store.hpp>
#include <similarity/similarity_scorer.hpp>
#include "../support/fault_injecting_store.hpp"
#include <algorithm>
#include <cmath>

using namespace Databrain;
using Databrain::testing::FaultInjectingStore;

namespace {

const SystemTimePoint T0 = make_utc_time(2026, 10, 1, 9);

constexpr std::chrono::hours kDay(24);

class DecaySchedulerTest : public ::testing::Test {
protected:
    DecaySchedulerTest()
        : clock(T0), engine(store, scorer, clock), scheduler(store, engine, clock) {}

    NodeId create(const std::string& label, double mass) {
        CreateNodeParams p;
        p.label = label;
        p.initial_mass = mass;
        return engine.create_node(p).node->id;
    }

    double mass(const NodeId& id) { return store.get_node(id)->mass; }

    MemoryGraphStore store;
    NGramSimilarityScorer scorer;
    ManualClock clock;
    MutationEngine engine;
    DecayScheduler scheduler;
};

} // namespace

TEST_F(DecaySchedulerTest, DecaysOnlyInactiveNodes) {
    NodeId stale = create("Legacy Report", 40.0);
    NodeId fresh = create("Live Dashboard", 40.0);

    clock.advance(37 * kDay);
    engine.update_mass(UpdateMassParams{fresh, 0.0});   // touch

    DecayRunReport report = scheduler.run();
    EXPECT_EQ(report.nodes_scanned, 1u);
    EXPECT_EQ(report.nodes_decayed, 1u);
    EXPECT_EQ(report.errors, 0u);

    double expected = 40.0 * std::pow(0.5, 37.0 / 30.0);
    EXPECT_NEAR(mass(stale), expected, 1e-9);
    EXPECT_NEAR(report.total_mass_removed, 40.0 - expected, 1e-9);
    EXPECT_DOUBLE_EQ(mass(fresh), 40.0);

    Node n = *store.get_node(stale);
    ASSERT_TRUE(n.last_decay_applied_at.has_value());
    EXPECT_EQ(*n.last_decay_applied_at, T0 + 37 * kDay);
    EXPECT_EQ(n.last_accessed, T0);
}

TEST_F(DecaySchedulerTest, SecondRunSameDayChangesNothing) {
    NodeId a = create("Legacy Report", 40.0);
    NodeId b = create("Old Forecast", 70.0);

    clock.advance(20 * kDay);
    scheduler.run();
    double mass_a = mass(a);
    double mass_b = mass(b);
    size_t log_size = store.list_log(LogFilter{}).size();

    clock.advance(std::chrono::hours(5));
    DecayRunReport again = scheduler.run();

    EXPECT_EQ(again.nodes_decayed, 0u);
    EXPECT_DOUBLE_EQ(mass(a), mass_a);
    EXPECT_DOUBLE_EQ(mass(b), mass_b);
    EXPECT_EQ(store.list_log(LogFilter{}).size(), log_size);
}

TEST_F(DecaySchedulerTest, DailyRunsCompoundToTheHalfLife) {
    NodeId a = create("Legacy Report", 80.0);

    clock.advance(8 * kDay);
    scheduler.run();
    double after_first = mass(a);
    EXPECT_NEAR(after_first, 80.0 * std::pow(0.5, 8.0 / 30.0), 1e-9);

    // One more day measures from the last decay, not from the last access
    clock.advance(kDay);
    scheduler.run();
    EXPECT_NEAR(mass(a), after_first * std::pow(0.5, 1.0 / 30.0), 1e-9);
}

TEST_F(DecaySchedulerTest, FloorsAtMinimumAndNeverDeletes) {
    NodeId a = create("Ancient Memo", 2.0);

    clock.advance(400 * kDay);
    DecayRunReport first = scheduler.run();
    EXPECT_DOUBLE_EQ(mass(a), 1.0);
    EXPECT_EQ(first.nodes_at_minimum, 1u);

    clock.advance(kDay);
    DecayRunReport second = scheduler.run();
    EXPECT_EQ(second.nodes_decayed, 0u);
    EXPECT_EQ(second.nodes_at_minimum, 1u);

    EXPECT_TRUE(store.get_node(a).has_value());
    EXPECT_FALSE(store.get_node(a)->is_redirected());
}

TEST_F(DecaySchedulerTest, EachDecayIsLogged) {
    NodeId a = create("Legacy Report", 40.0);
    clock.advance(10 * kDay);
    scheduler.run();

    LogFilter filter;
    filter.action = MutationAction::TemporalDecay;
    auto log = store.list_log(filter);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].target_id, a);
    EXPECT_TRUE(log[0].success);
    EXPECT_EQ(log[0].triggered_by, "decay_scheduler");
    EXPECT_EQ(log[0].reason, "temporal_decay");
    EXPECT_DOUBLE_EQ(log[0].params["old_mass"].get<double>(), 40.0);
}

TEST_F(DecaySchedulerTest, TemporalDecaySkipsActiveNodes) {
    NodeId a = create("Live Dashboard", 40.0);
    clock.advance(3 * kDay);

    MutationResult r = engine.temporal_decay(TemporalDecayParams{a, DecayConfig{}});
    EXPECT_FALSE(r.detail["decayed"].get<bool>());
    EXPECT_EQ(r.detail["skipped"], "active");
    EXPECT_DOUBLE_EQ(mass(a), 40.0);

    // The skip is still one logged invocation
    LogFilter filter;
    filter.action = MutationAction::TemporalDecay;
    EXPECT_EQ(store.list_log(filter).size(), 1u);
}

TEST_F(DecaySchedulerTest, Status) {
    create("Legacy Report", 5.0);
    create("Old Forecast", 30.0);
    clock.advance(10 * kDay);
    create("Live Dashboard", 90.0);

    DecayStatus status = scheduler.status();
    EXPECT_EQ(status.active_nodes, 1u);
    EXPECT_EQ(status.inactive_nodes, 2u);
    EXPECT_DOUBLE_EQ(status.active_avg_mass, 90.0);
    EXPECT_DOUBLE_EQ(status.inactive_avg_mass, 17.5);
    EXPECT_EQ(status.mass_up_to_10, 1u);
    EXPECT_EQ(status.mass_10_to_50, 1u);
    EXPECT_EQ(status.mass_50_to_100, 1u);

    nlohmann::json j = status.to_json();
    EXPECT_EQ(j["inactive_nodes"]["count"], 2);
    EXPECT_DOUBLE_EQ(j["policy"]["half_life_days"].get<double>(), 30.0);
}

TEST(DecaySchedulerConfigTest, RejectsNonPositiveHalfLife) {
    MemoryGraphStore store;
    NGramSimilarityScorer scorer;
    ManualClock clock(T0);
    MutationEngine engine(store, scorer, clock);

    DecayConfig policy;
    policy.half_life_days = 0.0;
    EXPECT_THROW((DecayScheduler{store, engine, clock, policy}), ValidationError);
}

TEST(DecaySchedulerFailureTest, PerNodeFailuresAreCountedAndRunContinues) {
    MemoryGraphStore inner;
    FaultInjectingStore store(inner);
    NGramSimilarityScorer scorer;
    ManualClock clock(T0);

    RetryConfig once;
    once.max_attempts = 1;
    MutationEngine engine(store, scorer, clock, once);
    DecayScheduler scheduler(store, engine, clock);

    for (const char* label : {"One", "Two", "Three"}) {
        CreateNodeParams p;
        p.label = label;
        p.initial_mass = 50.0;
        engine.create_node(p);
    }

    clock.advance(10 * kDay);
    store.conflicts_to_inject = 2;

    DecayRunReport report = scheduler.run();
    EXPECT_EQ(report.nodes_scanned, 3u);
    EXPECT_EQ(report.errors, 2u);
    EXPECT_EQ(report.nodes_decayed, 1u);

    LogFilter failures;
    failures.action = MutationAction::TemporalDecay;
    auto log = inner.list_log(failures);
    ASSERT_EQ(log.size(), 3u);
    EXPECT_EQ(std::count_if(log.begin(), log.end(), [](const MutationLogEntry& e) { return !e.success; }), 2);
}
