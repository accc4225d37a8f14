/**
 * @file postgres_graph_store.hpp
 * @brief GraphStore over PostgreSQL (or the CockroachDB wire protocol) via libpq
 */

#pragma once

#include <store/graph_store.hpp>
#include <database/connection_pool.hpp>
#include <config/brain_config.hpp>

namespace Databrain {

/**
 * @brief Production GraphStore.
 *
 * Tables: graph_nodes, graph_links, force_fields, neuroplasticity_log.
 * Each node row carries a version column; guarded writes are
 * `UPDATE ... WHERE node_id = $1 AND version = $2` and a zero-row update is
 * a ConflictError. Every public call leases one pooled connection for the
 * duration of one transaction.
 */
class PostgresGraphStore : public GraphStore {
public:
    explicit PostgresGraphStore(const DatabaseConfig& config);

    /**
     * @brief Create tables and indexes if they do not exist
     */
    void ensure_schema();

    /**
     * @brief Delete every row from every table. For tests and tooling.
     */
    void clear();

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
    // Statements run on a connection the caller has inside a transaction
    std::optional<Node> select_node(PostgresConnection& conn, const NodeId& id);
    Node write_node(PostgresConnection& conn, const NodeWrite& write);
    void write_link(PostgresConnection& conn, const Link& link);
    uint64_t insert_log(PostgresConnection& conn, const MutationLogEntry& entry);

    ConnectionPool pool_;
};

} // namespace Databrain
