/**
 * @file action_params.hpp
 * @brief Typed parameters of the mutation actions and their JSON decoding
 */

#pragma once

#include <core/types.hpp>
#include <config/brain_config.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Databrain {

/**
 * @brief Who asked for a mutation. Copied into the log entry.
 */
struct MutationContext {
    std::string triggered_by;
    std::string session_id;
    std::string reason;
};

struct CreateNodeParams {
    std::string label;
    NodeType type = NodeType::Information;
    double initial_mass = 20.0;
    std::string description;
    Metadata metadata;
    std::optional<int> z_index;              // canonical for the type when absent
    NodeCategory category = NodeCategory::Static;
};

/**
 * @brief Target is resolved by id first, then by label; a label-only
 * target that matches nothing is created.
 */
struct CreateLinkParams {
    NodeId source_id;
    std::optional<NodeId> target_id;
    std::optional<std::string> target_label;
    double weight = 0.95;
    std::optional<double> strength;          // defaults to the clamped weight
    LinkType link_type = LinkType::Semantic;
};

struct UpdateMassParams {
    NodeId target_id;
    double delta = 5.0;
};

struct DecayNodeParams {
    NodeId target_id;
    std::string reason = "relevance_decay";
};

struct MergeNodesParams {
    NodeId winner_id;
    NodeId loser_id;
};

struct RemoveLinkParams {
    LinkId link_id;
};

struct TemporalDecayParams {
    NodeId target_id;
    DecayConfig policy;
};

// Decoders throw ValidationError on missing or wrongly typed fields.
// Unknown keys are ignored.
CreateNodeParams parse_create_node(const nlohmann::json& params);
CreateLinkParams parse_create_link(const nlohmann::json& params);
UpdateMassParams parse_update_mass(const nlohmann::json& params);
DecayNodeParams parse_decay_node(const nlohmann::json& params);
MergeNodesParams parse_merge_nodes(const nlohmann::json& params);
RemoveLinkParams parse_remove_link(const nlohmann::json& params);
TemporalDecayParams parse_temporal_decay(const nlohmann::json& params, const DecayConfig& defaults);

/**
 * @brief Per-action triggered_by / session_id / reason, falling back to base.
 */
MutationContext parse_context(const nlohmann::json& params, const MutationContext& base);

// Log-entry form of the parameters
nlohmann::json to_log_params(const CreateNodeParams& p);
nlohmann::json to_log_params(const CreateLinkParams& p);
nlohmann::json to_log_params(const UpdateMassParams& p);
nlohmann::json to_log_params(const DecayNodeParams& p);
nlohmann::json to_log_params(const MergeNodesParams& p);
nlohmann::json to_log_params(const RemoveLinkParams& p);
nlohmann::json to_log_params(const TemporalDecayParams& p);

} // namespace Databrain
