#include <query/context_retriever.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

namespace Databrain {

nlohmann::json BrainContext::to_graph_state() const {
    nlohmann::json state;
    state["query"] = query;

    if (!primary) {
        state["current_node_context"] = nullptr;
        state["connected_neighbors"] = nlohmann::json::array();
        return state;
    }

    state["current_node_context"] = {
        {"id", primary->id},
        {"label", primary->label},
        {"mass", primary->mass},
        {"z_layer", to_string(primary->layer())},
        {"description", primary->description},
        {"match_score", score}
    };

    nlohmann::json neighbors_json = nlohmann::json::array();
    for (const auto& n : neighbors) {
        neighbors_json.push_back({
            {"id", n.node.id},
            {"label", n.node.label},
            {"link_strength", n.link.strength},
            {"z_layer", to_string(n.node.layer())}
        });
    }
    state["connected_neighbors"] = std::move(neighbors_json);
    return state;
}

ContextRetriever::ContextRetriever(GraphStore& store, const SimilarityScorer& scorer, const Clock& clock,
                                   RetrievalConfig config)
    : store_(store), scorer_(scorer), clock_(clock), config_(config) {}

BrainContext ContextRetriever::get_brain_context(const std::string& query, std::optional<size_t> max_neighbors) {
    if (!is_valid_utf8(query)) {
        throw ValidationError("query is not valid UTF-8");
    }

    BrainContext context;
    context.query = query;

    auto matches = store_.find_by_similarity(query, 1, scorer_, config_.min_score, config_.candidate_scan_limit);
    if (matches.empty()) {
        Logger::debug("No node clears min_score " + std::to_string(config_.min_score) + " for '" + query + "'");
        return context;
    }

    context.primary = std::move(matches.front().node);
    context.score = matches.front().score;

    size_t limit = max_neighbors.value_or(config_.default_max_neighbors);
    if (limit > 0) {
        context.neighbors = store_.list_neighbors(context.primary->id, limit);
    }

    touch(*context.primary);
    return context;
}

void ContextRetriever::touch(const Node& node) {
    try {
        if (!store_.touch_node(node.id, clock_.now())) {
            Logger::debug("Recency bump skipped for contended node " + node.id);
        }
    } catch (const ConflictError& e) {
        Logger::debug("Recency bump skipped for " + node.id + ": " + e.what());
    } catch (const StoreUnavailableError& e) {
        Logger::warn("Recency bump skipped for " + node.id + ": " + e.what());
    }
}

} // namespace Databrain
