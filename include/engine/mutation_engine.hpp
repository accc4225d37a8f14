/**
 * @file mutation_engine.hpp
 * @brief The only writer of graph state: validated, atomic, audit-logged actions
 */

#pragma once

#include <engine/action_params.hpp>
#include <store/graph_store.hpp>
#include <similarity/similarity_scorer.hpp>
#include <layout/force_layout.hpp>
#include <hashing/entity_id.hpp>
#include <config/brain_config.hpp>
#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <optional>

namespace Databrain {

/**
 * @brief Typed outcome of one successful action
 */
struct MutationResult {
    MutationAction action = MutationAction::CreateNode;
    std::optional<Node> node;       // created / updated / surviving node
    std::optional<Link> link;       // created / strengthened / removed link
    nlohmann::json detail = nlohmann::json::object();

    nlohmann::json to_json() const;
};

/**
 * @brief Applies the neuroplasticity action set against a GraphStore.
 *
 * Each action runs as one store transaction. Optimistic-concurrency
 * conflicts are retried with full-jitter exponential backoff up to
 * RetryConfig::max_attempts; any other error fails the action at once.
 * Every invocation writes exactly one MutationLogEntry: on success it is
 * committed together with the change, on failure it is appended with
 * success=false before the error is rethrown.
 *
 * Holds no locks of its own; safe to share between threads.
 */
class MutationEngine {
public:
    MutationEngine(GraphStore& store, const SimilarityScorer& scorer, const Clock& clock,
                   RetryConfig retry = RetryConfig(), ForceLayout layout = ForceLayout(),
                   std::string triggered_by = "databrain");

    MutationResult create_node(const CreateNodeParams& params, const MutationContext& ctx = {});
    MutationResult create_link(const CreateLinkParams& params, const MutationContext& ctx = {});
    MutationResult update_mass(const UpdateMassParams& params, const MutationContext& ctx = {});
    MutationResult decay_node(const DecayNodeParams& params, const MutationContext& ctx = {});
    MutationResult merge_nodes(const MergeNodesParams& params, const MutationContext& ctx = {});
    MutationResult remove_link(const RemoveLinkParams& params, const MutationContext& ctx = {});

    /**
     * @brief Scheduled exponential decay of one node.
     *
     * mass *= 0.5 ^ (days / half_life), measured from the later of
     * last_accessed and last_decay_applied_at, floored at policy.min_mass.
     * A node still inside the inactivity window, or already decayed on the
     * current UTC day, is left unchanged (detail.skipped says why).
     */
    MutationResult temporal_decay(const TemporalDecayParams& params, const MutationContext& ctx = {});

    /**
     * @brief Batch entry point.
     *
     * Accepts `[{action, params}, ...]` or `{"actions": [...]}`. Each action
     * commits or fails on its own; the reply holds one
     * `{action, success, result | error}` object per request, in order.
     */
    nlohmann::json mutate_brain(const nlohmann::json& actions, const MutationContext& ctx = {});

    /**
     * @brief One `{action, params}` request, never throws a BrainError.
     */
    nlohmann::json apply(const nlohmann::json& request, const MutationContext& ctx = {});

    void set_decay_defaults(const DecayConfig& decay) { decay_defaults_ = decay; }
    const RetryConfig& retry_config() const { return retry_; }

private:
    using Attempt = std::function<MutationResult(MutationLogEntry&)>;

    // Retry loop plus the one-entry-per-invocation guarantee
    MutationResult run(MutationAction action, nlohmann::json params, const MutationContext& ctx,
                       const Attempt& attempt);

    MutationLogEntry make_entry(MutationAction action, nlohmann::json params, const MutationContext& ctx) const;
    void record_failure(MutationLogEntry entry, const std::string& kind, const std::string& message);
    void backoff(int attempt) const;

    Node load_live(const NodeId& id, const char* role);

    // Version-guarded rewrite of an unchanged node, so concurrent link
    // changes on the same endpoint conflict instead of interleaving
    static void guard(WriteBatch& batch, const Node& node);

    Node build_node(const CreateNodeParams& params, SystemTimePoint now);

    MutationResult dispatch(MutationAction action, const nlohmann::json& params, const MutationContext& ctx);

    GraphStore& store_;
    const SimilarityScorer& scorer_;
    const Clock& clock_;
    RetryConfig retry_;
    ForceLayout layout_;
    std::string triggered_by_;
    DecayConfig decay_defaults_;
    EntityIdGenerator ids_;
};

} // namespace Databrain
