/**
 * @file memory_graph_store.hpp
 * @brief In-process GraphStore with the same versioning semantics as PostgreSQL
 */

#pragma once

#include <store/graph_store.hpp>
#include <map>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace Databrain {

/**
 * @brief GraphStore held in memory.
 *
 * A reader/writer lock stands in for database transactions: every write
 * operation validates first, then applies, under the exclusive lock, so a
 * rejected batch leaves no trace. Used by tests, tools and embedders that
 * don't need durability.
 */
class MemoryGraphStore : public GraphStore {
public:
    MemoryGraphStore() = default;

    std::optional<Node> get_node(const NodeId& id) override;
    Node upsert_node(const Node& node, std::optional<uint64_t> expected_version) override;
    Node apply_mass_delta(const NodeId& id, const MassDelta& change) override;
    bool touch_node(const NodeId& id, SystemTimePoint at) override;
    std::vector<Node> find_by_label(const std::string& label) override;
    std::vector<Node> scan_nodes(const NodeScan& scan) override;
    std::optional<Link> get_link(const LinkId& id) override;
    std::vector<Link> list_links(const NodeId& node_id) override;
    std::vector<Neighbor> list_neighbors(const NodeId& node_id, size_t max_neighbors) override;
    void commit(const WriteBatch& batch) override;
    uint64_t append_log(const MutationLogEntry& entry) override;
    std::vector<MutationLogEntry> list_log(const LogFilter& filter) override;
    void upsert_force_field(const ForceField& field) override;
    std::vector<ForceField> list_force_fields() override;
    StoreStats stats() override;

private:
    // Caller holds the exclusive lock
    void check_node_write(const NodeWrite& write) const;
    void apply_node_write(const NodeWrite& write);
    void put_link(const Link& link);
    void erase_link(const LinkId& id);
    uint64_t push_log(const MutationLogEntry& entry);

    static std::string label_key(const std::string& label);

    mutable std::shared_mutex mutex_;
    std::unordered_map<NodeId, Node> nodes_;
    std::map<LinkId, Link> links_;
    std::unordered_map<NodeId, std::set<LinkId>> adjacency_;
    std::unordered_map<std::string, std::set<NodeId>> label_index_;
    std::map<std::string, ForceField> force_fields_;
    std::vector<MutationLogEntry> log_;
    uint64_t next_sequence_ = 1;
};

} // namespace Databrain
