/**
 * @file context_retriever.hpp
 * @brief Read path: best-matching node plus ranked neighbors for an agent
 */

#pragma once

#include <store/graph_store.hpp>
#include <similarity/similarity_scorer.hpp>
#include <config/brain_config.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Databrain {

struct BrainContext {
    std::string query;
    std::optional<Node> primary;
    double score = 0.0;
    std::vector<Neighbor> neighbors;

    bool empty() const { return !primary.has_value(); }

    /**
     * @brief GRAPH_STATE shape handed to agents:
     * {current_node_context, connected_neighbors, query}
     */
    nlohmann::json to_graph_state() const;
};

/**
 * @brief Resolves a query against the graph.
 *
 * A query with no candidate at or above min_score yields an empty context,
 * never a low-confidence guess. A hit bumps the primary node's recency
 * through GraphStore::touch_node, which gives up rather than wait on a
 * writer; a skipped bump is not an error.
 */
class ContextRetriever {
public:
    ContextRetriever(GraphStore& store, const SimilarityScorer& scorer, const Clock& clock,
                     RetrievalConfig config = RetrievalConfig());

    BrainContext get_brain_context(const std::string& query, std::optional<size_t> max_neighbors = std::nullopt);

    const RetrievalConfig& config() const { return config_; }

private:
    void touch(const Node& node);

    GraphStore& store_;
    const SimilarityScorer& scorer_;
    const Clock& clock_;
    RetrievalConfig config_;
};

} // namespace Databrain
