/**
 * @file test_postgres_store.cpp
 * @brief PostgresGraphStore against a live database.
 *
 * Uses DATABRAIN_TEST_DB_URL when set, otherwise the PG* environment with
 * dbname forced to databrain_test. Every table is cleared before each test,
 * so never point this at a database you care about. Skips when no server
 * is reachable.
 */

#include <gtest/gtest.h>
#include <engine/brain.hpp>
#include <maintenance/decay_scheduler.hpp>
#include <store/postgres_graph_store.hpp>
#include <cstdlib>
#include <memory>

using namespace Databrain;

namespace {

const SystemTimePoint T0 = make_utc_time(2026, 10, 1, 9);

DatabaseConfig test_database() {
    DatabaseConfig db = BrainConfig::from_env().database;
    if (const char* url = std::getenv("DATABRAIN_TEST_DB_URL")) {
        db.conninfo = url;
    } else {
        db.conninfo.clear();
        db.dbname = "databrain_test";
    }
    db.connect_timeout_sec = 2;
    return db;
}

Node seed_node(const std::string& id, const std::string& label, double mass) {
    Node node;
    node.id = id;
    node.label = label;
    node.mass = mass;
    node.created_at = T0;
    node.last_accessed = T0;
    return node;
}

class PostgresStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            store = std::make_unique<PostgresGraphStore>(test_database());
            store->ensure_schema();
            store->clear();
        } catch (const StoreUnavailableError& e) {
            GTEST_SKIP() << "PostgreSQL not available - skipping integration test: " << e.what();
        }
    }

    std::unique_ptr<PostgresGraphStore> store;
};

} // namespace

TEST_F(PostgresStoreTest, UpsertIsVersionGuarded) {
    Node created = store->upsert_node(seed_node("n1", "Pricing", 30.0), std::nullopt);
    EXPECT_EQ(created.version, 1u);

    Node changed = created;
    changed.mass = 35.0;
    Node updated = store->upsert_node(changed, created.version);
    EXPECT_EQ(updated.version, 2u);
    EXPECT_DOUBLE_EQ(updated.mass, 35.0);

    // Stale version
    changed.mass = 99.0;
    EXPECT_THROW(store->upsert_node(changed, created.version), ConflictError);
    EXPECT_DOUBLE_EQ(store->get_node("n1")->mass, 35.0);

    EXPECT_THROW(store->upsert_node(seed_node("n2", "Bad", 150.0), std::nullopt), ValidationError);
    EXPECT_FALSE(store->get_node("missing").has_value());
}

TEST_F(PostgresStoreTest, MassDeltaClampsAndTouches) {
    store->upsert_node(seed_node("n1", "Pricing", 95.0), std::nullopt);

    MassDelta change;
    change.delta = 20.0;
    change.touch_at = T0 + std::chrono::hours(2);
    Node after = store->apply_mass_delta("n1", change);

    EXPECT_DOUBLE_EQ(after.mass, 100.0);
    EXPECT_EQ(after.access_count, 2);
    EXPECT_EQ(after.last_accessed, T0 + std::chrono::hours(2));

    EXPECT_THROW(store->apply_mass_delta("missing", MassDelta{}), NotFoundError);
}

TEST_F(PostgresStoreTest, CommitIsAllOrNothing) {
    Node a = store->upsert_node(seed_node("a", "Alpha", 30.0), std::nullopt);
    Node b = store->upsert_node(seed_node("b", "Beta", 20.0), std::nullopt);

    Link link;
    link.id = "l1";
    link.source_id = "a";
    link.target_id = "b";
    link.strength = 0.7;
    link.created_at = T0;

    // The second node write is stale, so the link must not land either
    Node a2 = a;
    a2.mass = 31.0;
    Node b2 = b;
    b2.mass = 21.0;
    WriteBatch bad;
    bad.nodes.push_back({a2, a.version});
    bad.nodes.push_back({b2, b.version + 5});
    bad.upsert_links.push_back(link);
    EXPECT_THROW(store->commit(bad), ConflictError);
    EXPECT_FALSE(store->get_link("l1").has_value());
    EXPECT_DOUBLE_EQ(store->get_node("a")->mass, 30.0);

    WriteBatch good;
    good.nodes.push_back({a2, a.version});
    good.upsert_links.push_back(link);
    store->commit(good);

    ASSERT_TRUE(store->get_link("l1").has_value());
    EXPECT_DOUBLE_EQ(store->get_node("a")->mass, 31.0);

    auto neighbors = store->list_neighbors("b", 10);
    ASSERT_EQ(neighbors.size(), 1u);
    EXPECT_EQ(neighbors[0].node.id, "a");
    EXPECT_DOUBLE_EQ(neighbors[0].link.strength, 0.7);

    Link loop = link;
    loop.id = "l2";
    loop.target_id = "a";
    WriteBatch looped;
    looped.upsert_links.push_back(loop);
    EXPECT_THROW(store->commit(looped), ValidationError);
}

TEST_F(PostgresStoreTest, LogRoundTripsThroughTheEngine) {
    ManualClock clock(T0);
    Brain brain(*store, clock);

    auto reply = brain.mutate_brain(nlohmann::json::array({
        {{"action", "CREATE_NODE"}, {"params", {{"label", "Portfolio Optimization"}, {"mass", 25}}}},
        {{"action", "CREATE_NODE"}, {"params", {{"label", "Sentiment Analysis"}, {"mass", 20}}}}
    }));
    ASSERT_EQ(reply.size(), 2u);
    ASSERT_TRUE(reply[0]["success"].get<bool>());
    std::string a = reply[0]["result"]["node_id"];
    std::string b = reply[1]["result"]["node_id"];

    auto changes = brain.mutate_brain(nlohmann::json::array({
        {{"action", "CREATE_LINK"}, {"params", {{"source_id", a}, {"target_id", b}, {"weight", 0.8}}}},
        {{"action", "UPDATE_MASS"}, {"params", {{"target_id", a}, {"delta", 10}}}},
        {{"action", "DECAY_NODE"}, {"params", {{"target_id", a}}}}
    }));
    for (const auto& r : changes) EXPECT_TRUE(r["success"].get<bool>());

    EXPECT_DOUBLE_EQ(store->get_node(a)->mass, 28.0);
    EXPECT_EQ(store->list_log(LogFilter()).size(), 5u);

    nlohmann::json state = brain.get_brain_context_json("portfolio optimization");
    EXPECT_EQ(state["current_node_context"]["id"], a);
    ASSERT_EQ(state["connected_neighbors"].size(), 1u);
    EXPECT_EQ(state["connected_neighbors"][0]["id"], b);

    StoreStats stats = store->stats();
    EXPECT_EQ(stats.nodes, 2u);
    EXPECT_EQ(stats.log_entries, 5u);
}

TEST_F(PostgresStoreTest, DecaySchedulerRunsAgainstTheDatabase) {
    Node stale = seed_node("old", "Legacy Pricing", 40.0);
    stale.created_at = T0 - std::chrono::hours(24 * 30);
    stale.last_accessed = T0 - std::chrono::hours(24 * 30);
    store->upsert_node(stale, std::nullopt);
    store->upsert_node(seed_node("fresh", "Current Pricing", 40.0), std::nullopt);

    ManualClock clock(T0);
    NGramSimilarityScorer scorer;
    MutationEngine engine(*store, scorer, clock);
    DecayScheduler scheduler(*store, engine, clock);

    DecayRunReport first = scheduler.run();
    EXPECT_EQ(first.nodes_decayed, 1u);
    EXPECT_EQ(first.errors, 0u);
    EXPECT_LT(store->get_node("old")->mass, 40.0);
    EXPECT_DOUBLE_EQ(store->get_node("fresh")->mass, 40.0);
    ASSERT_TRUE(store->get_node("old")->last_decay_applied_at.has_value());

    DecayRunReport second = scheduler.run();
    EXPECT_EQ(second.nodes_decayed, 0u);

    LogFilter filter;
    filter.action = MutationAction::TemporalDecay;
    EXPECT_EQ(store->list_log(filter).size(), 1u);
}
