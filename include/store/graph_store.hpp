/**
 * @file graph_store.hpp
 * @brief Durable node/link storage with optimistic concurrency
 */

#pragma once

#include <core/types.hpp>
#include <core/errors.hpp>
#include <similarity/similarity_scorer.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Databrain {

/**
 * @brief Index-scoped scan orders supported by every store
 */
enum class NodeOrder {
    MassDesc,
    LastAccessedAsc,
    SignatureAsc
};

struct NodeScan {
    NodeOrder order = NodeOrder::MassDesc;
    size_t limit = 0;                                  // 0 = unbounded
    bool include_redirected = false;
    std::optional<SystemTimePoint> accessed_before;    // last_accessed < value
    std::optional<int> min_z_index;
    std::optional<double> min_mass;
};

/**
 * @brief A node write guarded by the version the writer read.
 *
 * expected_version == nullopt means "insert"; the write conflicts if a node
 * with that id already exists.
 */
struct NodeWrite {
    Node node;
    std::optional<uint64_t> expected_version;
};

/**
 * @brief Everything one mutation action changes, applied in one transaction.
 *
 * Node versions are bumped by the store. Link upserts replace by link id.
 */
struct WriteBatch {
    std::vector<NodeWrite> nodes;
    std::vector<Link> upsert_links;
    std::vector<LinkId> delete_links;
    std::optional<MutationLogEntry> log;
};

/**
 * @brief Options for the atomic mass update
 */
struct MassDelta {
    double delta = 0.0;
    std::optional<SystemTimePoint> touch_at;     // bump last_accessed/access_count
    std::optional<MutationLogEntry> log;         // written in the same transaction
};

struct Neighbor {
    Node node;
    Link link;
};

struct ScoredNode {
    Node node;
    double score = 0.0;
};

struct LogFilter {
    std::optional<std::string> node_id;          // matches target or source
    std::optional<MutationAction> action;
    size_t limit = 0;                            // 0 = unbounded, newest last
};

struct StoreStats {
    size_t nodes = 0;
    size_t redirected_nodes = 0;
    size_t links = 0;
    size_t force_fields = 0;
    size_t log_entries = 0;
};

/**
 * @brief Backing store contract.
 *
 * Implementations arbitrate concurrency themselves (row versions, SQL
 * transactions); callers never share locks. All operations are blocking
 * round trips that either complete or throw a BrainError, in which case
 * nothing was written.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    /**
     * @brief Raw read, no redirect resolution
     */
    virtual std::optional<Node> get_node(const NodeId& id) = 0;

    /**
     * @brief Read, following redirected_to to the surviving node
     * @throws NotFoundError if the id (or a redirect target) does not exist
     */
    Node resolve_node(const NodeId& id);

    /**
     * @brief Insert or compare-and-set a single node
     * @throws ConflictError if the stored version differs from expected_version
     */
    virtual Node upsert_node(const Node& node, std::optional<uint64_t> expected_version) = 0;

    /**
     * @brief Atomic read-clamp-write: mass = clamp(mass + delta, 1, 100)
     * @throws NotFoundError for unknown ids, ValidationError for redirected nodes
     */
    virtual Node apply_mass_delta(const NodeId& id, const MassDelta& change) = 0;

    /**
     * @brief Best-effort recency bump
     * @return false if the node was contended (or missing) and nothing was written
     */
    virtual bool touch_node(const NodeId& id, SystemTimePoint at) = 0;

    /**
     * @brief Case-insensitive exact label match, live nodes only, oldest first
     */
    virtual std::vector<Node> find_by_label(const std::string& label) = 0;

    virtual std::vector<Node> scan_nodes(const NodeScan& scan) = 0;

    virtual std::optional<Link> get_link(const LinkId& id) = 0;

    /**
     * @brief Links incident to a node in either direction, ordered by link id
     */
    virtual std::vector<Link> list_links(const NodeId& node_id) = 0;

    /**
     * @brief Distinct live neighbors in either direction, ordered by link
     * strength desc, neighbor mass desc, last_traversed desc, id asc.
     */
    virtual std::vector<Neighbor> list_neighbors(const NodeId& node_id, size_t max_neighbors) = 0;

    /**
     * @brief Score live nodes against a query and keep the best top_k whose
     * score is at least min_score. Ties: mass desc, last_accessed desc, id asc.
     *
     * Candidates come from the signature-ordered scan. scan_limit > 0 caps
     * how many are scored and trades recall for latency; 0 scores them all.
     */
    std::vector<ScoredNode> find_by_similarity(const std::string& query, size_t top_k,
                                               const SimilarityScorer& scorer,
                                               double min_score, size_t scan_limit = 0);

    /**
     * @brief Apply a write batch atomically
     * @throws ConflictError on a version mismatch, ValidationError on a
     *         link that would dangle or self-loop
     */
    virtual void commit(const WriteBatch& batch) = 0;

    /**
     * @brief Append a standalone audit entry
     * @return Assigned sequence number
     */
    virtual uint64_t append_log(const MutationLogEntry& entry) = 0;

    /**
     * @brief Audit entries ordered by (timestamp, sequence)
     */
    virtual std::vector<MutationLogEntry> list_log(const LogFilter& filter) = 0;

    virtual void upsert_force_field(const ForceField& field) = 0;
    virtual std::vector<ForceField> list_force_fields() = 0;

    virtual StoreStats stats() = 0;
};

/**
 * @brief Neighbor ordering shared by store implementations.
 */
bool neighbor_before(const Neighbor& a, const Neighbor& b);

} // namespace Databrain
