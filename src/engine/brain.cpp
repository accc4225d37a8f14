#include <engine/brain.hpp>

namespace Databrain {

namespace {

std::unique_ptr<SimilarityScorer> default_scorer(std::unique_ptr<SimilarityScorer> scorer) {
    if (scorer) return scorer;
    return std::make_unique<NGramSimilarityScorer>();
}

} // namespace

Brain::Brain(GraphStore& store, const Clock& clock, const BrainConfig& config,
             std::unique_ptr<SimilarityScorer> scorer)
    : store_(store),
      scorer_(default_scorer(std::move(scorer))),
      engine_(store, *scorer_, clock, config.retry, ForceLayout(), config.triggered_by),
      retriever_(store, *scorer_, clock, config.retrieval) {
    engine_.set_decay_defaults(config.decay);
}

BrainContext Brain::get_brain_context(const std::string& query, std::optional<size_t> max_neighbors) {
    return retriever_.get_brain_context(query, max_neighbors);
}

nlohmann::json Brain::get_brain_context_json(const std::string& query, std::optional<size_t> max_neighbors) {
    return retriever_.get_brain_context(query, max_neighbors).to_graph_state();
}

nlohmann::json Brain::mutate_brain(const nlohmann::json& actions, const MutationContext& ctx) {
    return engine_.mutate_brain(actions, ctx);
}

} // namespace Databrain
