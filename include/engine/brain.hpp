/**
 * @file brain.hpp
 * @brief The shared brain: one injected service exposing the read and write calls
 */

#pragma once

#include <engine/mutation_engine.hpp>
#include <query/context_retriever.hpp>
#include <similarity/similarity_scorer.hpp>
#include <config/brain_config.hpp>
#include <nlohmann/json.hpp>
#include <memory>

namespace Databrain {

/**
 * @brief Wires a store, a scorer and a clock into the two inbound calls.
 *
 * Callers share one instance; it holds no state besides the wiring, and
 * every concurrency decision is left to the store.
 */
class Brain {
public:
    Brain(GraphStore& store, const Clock& clock, const BrainConfig& config = BrainConfig(),
          std::unique_ptr<SimilarityScorer> scorer = nullptr);

    BrainContext get_brain_context(const std::string& query, std::optional<size_t> max_neighbors = std::nullopt);

    /**
     * @brief `get_brain_context` in GRAPH_STATE form
     */
    nlohmann::json get_brain_context_json(const std::string& query,
                                          std::optional<size_t> max_neighbors = std::nullopt);

    nlohmann::json mutate_brain(const nlohmann::json& actions, const MutationContext& ctx = {});

    GraphStore& store() { return store_; }
    MutationEngine& engine() { return engine_; }
    ContextRetriever& retriever() { return retriever_; }
    const SimilarityScorer& scorer() const { return *scorer_; }

private:
    GraphStore& store_;
    std::unique_ptr<SimilarityScorer> scorer_;
    MutationEngine engine_;
    ContextRetriever retriever_;
};

} // namespace Databrain
