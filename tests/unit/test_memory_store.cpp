/**
 * @file test_memory_store.cpp
 * @brief Unit tests for MemoryGraphStore versioning, batches and queries
 */

#include <gtest/gtest.h>
#include <store/memory_graph_store.hpp>
#include <similarity/similarity_scorer.hpp>
#include <cmath>
#include <limits>

using namespace Databrain;

namespace {

const SystemTimePoint T0 = make_utc_time(2026, 10, 1);

Node make_node(const std::string& id, const std::string& label, double mass = 10.0) {
    Node node;
    node.id = id;
    node.label = label;
    node.mass = mass;
    node.created_at = T0;
    node.last_accessed = T0;
    return node;
}

Link make_link(const std::string& id, const std::string& src, const std::string& dst, double strength) {
    Link link;
    link.id = id;
    link.source_id = src;
    link.target_id = dst;
    link.strength = strength;
    link.created_at = T0;
    return link;
}

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.upsert_node(make_node("a", "Alpha", 30.0), std::nullopt);
        store.upsert_node(make_node("b", "Beta", 20.0), std::nullopt);
        store.upsert_node(make_node("c", "Gamma", 40.0), std::nullopt);
    }

    void link(const std::string& id, const std::string& src, const std::string& dst, double strength) {
        WriteBatch batch;
        batch.upsert_links.push_back(make_link(id, src, dst, strength));
        store.commit(batch);
    }

    MemoryGraphStore store;
};

} // namespace

TEST_F(MemoryStoreTest, InsertAssignsVersionOne) {
    auto a = store.get_node("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->version, 1u);
    EXPECT_FALSE(store.get_node("zzz").has_value());
}

TEST_F(MemoryStoreTest, DuplicateInsertConflicts) {
    EXPECT_THROW(store.upsert_node(make_node("a", "Again"), std::nullopt), ConflictError);
    EXPECT_EQ(store.get_node("a")->label, "Alpha");
}

TEST_F(MemoryStoreTest, CompareAndSet) {
    Node a = *store.get_node("a");
    a.description = "first";
    Node written = store.upsert_node(a, 1);
    EXPECT_EQ(written.version, 2u);

    // Stale writer
    a.description = "second";
    EXPECT_THROW(store.upsert_node(a, 1), ConflictError);
    EXPECT_EQ(store.get_node("a")->description, "first");

    EXPECT_THROW(store.upsert_node(make_node("nope", "x"), 1), NotFoundError);
}

TEST_F(MemoryStoreTest, RejectsOutOfRangeMass) {
    EXPECT_THROW(store.upsert_node(make_node("d", "Delta", 0.5), std::nullopt), ValidationError);
    EXPECT_THROW(store.upsert_node(make_node("d", "Delta", 100.5), std::nullopt), ValidationError);
    EXPECT_THROW(store.upsert_node(make_node("d", "Delta", std::nan("")), std::nullopt), ValidationError);
    EXPECT_FALSE(store.get_node("d").has_value());
}

TEST_F(MemoryStoreTest, MassDeltaClampsAndLogs) {
    MassDelta up;
    up.delta = 500.0;
    up.touch_at = T0 + std::chrono::hours(1);
    up.log = MutationLogEntry{};
    up.log->action = MutationAction::UpdateMass;
    up.log->target_id = "a";
    up.log->success = true;

    Node a = store.apply_mass_delta("a", up);
    EXPECT_DOUBLE_EQ(a.mass, kMaxMass);
    EXPECT_EQ(a.access_count, 2);
    EXPECT_EQ(a.last_accessed, T0 + std::chrono::hours(1));
    EXPECT_EQ(a.version, 2u);

    MassDelta down;
    down.delta = -1000.0;
    EXPECT_DOUBLE_EQ(store.apply_mass_delta("a", down).mass, kMinMass);

    EXPECT_EQ(store.list_log(LogFilter{}).size(), 1u);

    EXPECT_THROW(store.apply_mass_delta("missing", down), NotFoundError);
    down.delta = std::numeric_limits<double>::infinity();
    EXPECT_THROW(store.apply_mass_delta("a", down), ValidationError);
}

TEST_F(MemoryStoreTest, TouchBumpsRecencyAndVersion) {
    EXPECT_TRUE(store.touch_node("b", T0 + std::chrono::hours(2)));
    Node b = *store.get_node("b");
    EXPECT_EQ(b.access_count, 2);
    EXPECT_EQ(b.version, 2u);
    EXPECT_EQ(b.last_accessed, T0 + std::chrono::hours(2));

    EXPECT_FALSE(store.touch_node("missing", T0));
}

TEST_F(MemoryStoreTest, FindByLabelIsCaseInsensitive) {
    auto found = store.find_by_label("ALPHA");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, "a");
    EXPECT_TRUE(store.find_by_label("Alph").empty());
}

TEST_F(MemoryStoreTest, ScanOrdersAndFilters) {
    auto by_mass = store.scan_nodes(NodeScan{});
    ASSERT_EQ(by_mass.size(), 3u);
    EXPECT_EQ(by_mass[0].id, "c");
    EXPECT_EQ(by_mass[1].id, "a");
    EXPECT_EQ(by_mass[2].id, "b");

    store.touch_node("a", T0 + std::chrono::hours(5));
    NodeScan stale;
    stale.order = NodeOrder::LastAccessedAsc;
    stale.accessed_before = T0 + std::chrono::hours(1);
    auto old = store.scan_nodes(stale);
    ASSERT_EQ(old.size(), 2u);
    EXPECT_EQ(old[0].id, "b");
    EXPECT_EQ(old[1].id, "c");

    NodeScan heavy;
    heavy.min_mass = 25.0;
    heavy.limit = 1;
    auto top = store.scan_nodes(heavy);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].id, "c");
}

TEST_F(MemoryStoreTest, CommitRejectsSelfLoopAndDanglingLinks) {
    WriteBatch loop;
    loop.upsert_links.push_back(make_link("l1", "a", "a", 0.5));
    EXPECT_THROW(store.commit(loop), ValidationError);

    WriteBatch dangling;
    dangling.upsert_links.push_back(make_link("l2", "a", "ghost", 0.5));
    EXPECT_THROW(store.commit(dangling), ValidationError);

    WriteBatch strong;
    strong.upsert_links.push_back(make_link("l3", "a", "b", 1.5));
    EXPECT_THROW(store.commit(strong), ValidationError);

    EXPECT_EQ(store.stats().links, 0u);
}

TEST_F(MemoryStoreTest, FailedBatchLeavesNoTrace) {
    Node a = *store.get_node("a");
    a.description = "should not stick";

    WriteBatch batch;
    batch.nodes.push_back({a, a.version});
    batch.upsert_links.push_back(make_link("l1", "a", "ghost", 0.5));
    batch.log = MutationLogEntry{};

    EXPECT_THROW(store.commit(batch), ValidationError);
    EXPECT_TRUE(store.get_node("a")->description.empty());
    EXPECT_EQ(store.get_node("a")->version, 1u);
    EXPECT_EQ(store.stats().log_entries, 0u);
}

TEST_F(MemoryStoreTest, StaleGuardRejectsWholeBatch) {
    Node a = *store.get_node("a");
    store.touch_node("a", T0 + std::chrono::hours(1));

    WriteBatch batch;
    batch.nodes.push_back({a, a.version});
    batch.upsert_links.push_back(make_link("l1", "a", "b", 0.5));
    EXPECT_THROW(store.commit(batch), ConflictError);
    EXPECT_FALSE(store.get_link("l1").has_value());
}

TEST_F(MemoryStoreTest, DeletingUnknownLinkIsNotFound) {
    WriteBatch batch;
    batch.delete_links.push_back("l_missing");
    EXPECT_THROW(store.commit(batch), NotFoundError);
}

TEST_F(MemoryStoreTest, NeighborsBothDirectionsOrderedAndDistinct) {
    link("l1", "a", "b", 0.4);
    link("l2", "c", "a", 0.9);
    link("l3", "b", "a", 0.7);

    auto neighbors = store.list_neighbors("a", 10);
    ASSERT_EQ(neighbors.size(), 2u);
    EXPECT_EQ(neighbors[0].node.id, "c");
    EXPECT_DOUBLE_EQ(neighbors[0].link.strength, 0.9);
    EXPECT_EQ(neighbors[1].node.id, "b");
    EXPECT_DOUBLE_EQ(neighbors[1].link.strength, 0.7);

    EXPECT_EQ(store.list_neighbors("a", 1).size(), 1u);
    EXPECT_TRUE(store.list_neighbors("a", 0).empty());
    EXPECT_EQ(store.list_links("a").size(), 3u);
}

TEST_F(MemoryStoreTest, NeighborTieBreakOnMass) {
    link("l1", "a", "b", 0.5);
    link("l2", "a", "c", 0.5);

    auto neighbors = store.list_neighbors("a", 10);
    ASSERT_EQ(neighbors.size(), 2u);
    EXPECT_EQ(neighbors[0].node.id, "c");   // heavier
}

TEST_F(MemoryStoreTest, NeighborTieBreakOnLastTraversed) {
    store.upsert_node(make_node("d", "Delta", 20.0), std::nullopt);
    store.upsert_node(make_node("e", "Epsilon", 20.0), std::nullopt);

    // Same strength and neighbor mass; only traversal recency differs
    Link stale = make_link("l1", "a", "b", 0.5);
    stale.last_traversed = T0 + std::chrono::hours(1);
    stale.traversal_count = 1;
    Link fresh = make_link("l2", "a", "d", 0.5);
    fresh.last_traversed = T0 + std::chrono::hours(5);
    fresh.traversal_count = 3;
    Link never = make_link("l3", "a", "e", 0.5);

    WriteBatch batch;
    batch.upsert_links = {never, stale, fresh};
    store.commit(batch);

    auto neighbors = store.list_neighbors("a", 10);
    ASSERT_EQ(neighbors.size(), 3u);
    EXPECT_EQ(neighbors[0].node.id, "d");
    EXPECT_EQ(neighbors[1].node.id, "b");
    EXPECT_EQ(neighbors[2].node.id, "e");   // never traversed
}

TEST_F(MemoryStoreTest, RedirectedNodeCannotKeepLinks) {
    link("l1", "a", "b", 0.5);

    Node b = *store.get_node("b");
    b.redirected_to = "c";

    WriteBatch batch;
    batch.nodes.push_back({b, b.version});
    EXPECT_THROW(store.commit(batch), ValidationError);

    batch.delete_links.push_back("l1");
    store.commit(batch);
    EXPECT_TRUE(store.get_node("b")->is_redirected());
    EXPECT_EQ(store.stats().redirected_nodes, 1u);

    // Redirects are permanent
    Node cleared = *store.get_node("b");
    cleared.redirected_to.reset();
    EXPECT_THROW(store.upsert_node(cleared, cleared.version), ValidationError);
}

TEST_F(MemoryStoreTest, ResolveFollowsRedirects) {
    Node b = *store.get_node("b");
    b.redirected_to = "c";
    store.upsert_node(b, b.version);

    EXPECT_EQ(store.resolve_node("b").id, "c");
    EXPECT_EQ(store.resolve_node("a").id, "a");
    EXPECT_THROW(store.resolve_node("missing"), NotFoundError);

    // Redirected nodes drop out of live queries
    EXPECT_TRUE(store.find_by_label("beta").empty());
    EXPECT_EQ(store.scan_nodes(NodeScan{}).size(), 2u);
}

TEST_F(MemoryStoreTest, RedirectCycleIsNotFound) {
    Node a = *store.get_node("a");
    a.redirected_to = "b";
    store.upsert_node(a, a.version);
    Node b = *store.get_node("b");
    b.redirected_to = "a";
    store.upsert_node(b, b.version);

    EXPECT_THROW(store.resolve_node("a"), NotFoundError);
}

TEST_F(MemoryStoreTest, SimilarityTieBreaks) {
    NGramSimilarityScorer scorer;
    store.upsert_node(make_node("x1", "Risk Register", 50.0), std::nullopt);
    store.upsert_node(make_node("x2", "Risk Register", 60.0), std::nullopt);

    auto hits = store.find_by_similarity("risk register", 2, scorer, 0.2);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0].node.id, "x2");
    EXPECT_EQ(hits[1].node.id, "x1");
    EXPECT_DOUBLE_EQ(hits[0].score, hits[1].score);

    EXPECT_TRUE(store.find_by_similarity("photosynthesis", 5, scorer, 0.2).empty());
}

TEST_F(MemoryStoreTest, LogFilterAndLimit) {
    for (int i = 0; i < 5; ++i) {
        MutationLogEntry e;
        e.action = i % 2 ? MutationAction::UpdateMass : MutationAction::CreateNode;
        e.target_id = i < 3 ? "a" : "b";
        e.timestamp = T0 + std::chrono::seconds(i);
        store.append_log(e);
    }

    LogFilter for_a;
    for_a.node_id = "a";
    EXPECT_EQ(store.list_log(for_a).size(), 3u);

    LogFilter updates;
    updates.action = MutationAction::UpdateMass;
    EXPECT_EQ(store.list_log(updates).size(), 2u);

    LogFilter newest;
    newest.limit = 2;
    auto tail = store.list_log(newest);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].timestamp, T0 + std::chrono::seconds(3));
    EXPECT_EQ(tail[1].timestamp, T0 + std::chrono::seconds(4));
    EXPECT_LT(tail[0].sequence, tail[1].sequence);
}

TEST_F(MemoryStoreTest, ForceFields) {
    ForceField f;
    f.id = "ops";
    f.keywords = {"deploy"};
    store.upsert_force_field(f);
    f.radius = 99.0;
    store.upsert_force_field(f);

    auto fields = store.list_force_fields();
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_DOUBLE_EQ(fields[0].radius, 99.0);

    EXPECT_THROW(store.upsert_force_field(ForceField{}), ValidationError);
}
