#include <store/graph_store.hpp>
#include <algorithm>
#include <unordered_set>

namespace Databrain {

namespace {

constexpr int k_max_redirect_depth = 32;

} // namespace

Node GraphStore::resolve_node(const NodeId& id) {
    std::unordered_set<NodeId> visited;
    NodeId current = id;

    for (int depth = 0; depth < k_max_redirect_depth; ++depth) {
        auto node = get_node(current);
        if (!node) {
            throw NotFoundError("node not found: " + current);
        }
        if (!node->redirected_to) {
            return *node;
        }
        if (!visited.insert(current).second) {
            break;
        }
        current = *node->redirected_to;
    }

    throw NotFoundError("redirect chain from " + id + " does not end in a live node");
}

std::vector<ScoredNode> GraphStore::find_by_similarity(const std::string& query, size_t top_k,
                                                       const SimilarityScorer& scorer,
                                                       double min_score, size_t scan_limit) {
    std::vector<ScoredNode> results;
    if (top_k == 0) return results;

    // Walk the signature index, not the mass ranking: a light node can be the best match
    NodeScan scan;
    scan.order = NodeOrder::SignatureAsc;
    scan.limit = scan_limit;

    for (auto& node : scan_nodes(scan)) {
        double s = scorer.score(query, node);
        // Below-threshold candidates are excluded, not ranked last
        if (s <= 0.0 || s < min_score) continue;
        results.push_back({std::move(node), s});
    }

    std::sort(results.begin(), results.end(), [](const ScoredNode& a, const ScoredNode& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.node.mass != b.node.mass) return a.node.mass > b.node.mass;
        if (a.node.last_accessed != b.node.last_accessed) return a.node.last_accessed > b.node.last_accessed;
        return a.node.id < b.node.id;
    });

    if (results.size() > top_k) results.resize(top_k);
    return results;
}

bool neighbor_before(const Neighbor& a, const Neighbor& b) {
    if (a.link.strength != b.link.strength) return a.link.strength > b.link.strength;
    if (a.node.mass != b.node.mass) return a.node.mass > b.node.mass;

    // Never-traversed links sort after traversed ones
    const auto& ta = a.link.last_traversed;
    const auto& tb = b.link.last_traversed;
    if (ta.has_value() != tb.has_value()) return ta.has_value();
    if (ta && tb && *ta != *tb) return *ta > *tb;

    return a.node.id < b.node.id;
}

} // namespace Databrain
