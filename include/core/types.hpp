/**
 * @file types.hpp
 * @brief Graph entities: nodes, links, force fields, audit log, replay samples
 */

#pragma once

#include <utils/time.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Databrain {

using NodeId = std::string;
using LinkId = std::string;

/**
 * @brief Open-ended annotations attached to nodes and links.
 *
 * Schema-on-read: values are stored as text and interpreted by the reader.
 * Well-known keys:
 *   decay_reason   - last reason passed to DECAY_NODE
 *   merged_from    - comma-separated ids of nodes merged into this one
 *   merge_survivor - on a merged-away node, the id it was merged into
 */
using Metadata = std::map<std::string, std::string>;

inline constexpr double kMinMass = 1.0;
inline constexpr double kMaxMass = 100.0;
inline constexpr double kMinStrength = 0.0;
inline constexpr double kMaxStrength = 1.0;

inline double clamp_mass(double mass) {
    if (mass < kMinMass) return kMinMass;
    if (mass > kMaxMass) return kMaxMass;
    return mass;
}

inline double clamp_strength(double strength) {
    if (strength < kMinStrength) return kMinStrength;
    if (strength > kMaxStrength) return kMaxStrength;
    return strength;
}

enum class NodeType {
    Concept,
    Entity,
    Process,
    Resource,
    Wisdom,
    Knowledge,
    Information,
    RawData
};

enum class NodeCategory {
    Static,
    Ephemeral
};

enum class LinkType {
    Semantic,
    Causal,
    Temporal,
    Hierarchical
};

/**
 * @brief Epistemic layer, derived from z_index bands.
 *
 * 0-100 raw data, 100-200 information, 200-300 knowledge, 300+ wisdom.
 */
enum class Layer {
    RawData,
    Information,
    Knowledge,
    Wisdom
};

std::string to_string(NodeType type);
std::string to_string(NodeCategory category);
std::string to_string(LinkType type);
std::string to_string(Layer layer);

std::optional<NodeType> parse_node_type(std::string_view text);
std::optional<NodeCategory> parse_node_category(std::string_view text);
std::optional<LinkType> parse_link_type(std::string_view text);

/**
 * @brief Canonical z_index for a node type (centre of its layer band).
 */
DATABRAIN_API int canonical_z_index(NodeType type);

DATABRAIN_API Layer layer_of(int z_index);

struct Node {
    NodeId id;
    std::string label;
    NodeType type = NodeType::Information;

    // Layout only, never used for correctness
    double x = 0.0;
    double y = 0.0;
    int z_index = 150;

    double mass = 10.0;
    NodeCategory category = NodeCategory::Static;
    std::string similarity_signature;

    SystemTimePoint created_at{};
    SystemTimePoint last_accessed{};
    int64_t access_count = 1;

    int cluster_id = 0;
    std::string description;
    Metadata metadata;

    std::optional<NodeId> redirected_to;
    std::optional<SystemTimePoint> last_decay_applied_at;

    // Optimistic concurrency fingerprint, bumped by every committed write
    uint64_t version = 0;

    bool is_redirected() const { return redirected_to.has_value(); }
    Layer layer() const { return layer_of(z_index); }
};

struct Link {
    LinkId id;
    NodeId source_id;
    NodeId target_id;
    double strength = 0.5;
    LinkType link_type = LinkType::Semantic;
    SystemTimePoint created_at{};
    std::optional<SystemTimePoint> last_traversed;
    int64_t traversal_count = 0;
    double weight = 1.0;
    Metadata metadata;

    bool touches(const NodeId& node_id) const {
        return source_id == node_id || target_id == node_id;
    }

    const NodeId& other_end(const NodeId& node_id) const {
        return source_id == node_id ? target_id : source_id;
    }
};

/**
 * @brief Named cluster attractor used for layout.
 */
struct ForceField {
    std::string id;
    std::string label;
    double x = 0.0;
    double y = 0.0;
    double radius = 150.0;
    double strength = 0.5;
    std::string signature;
    std::vector<std::string> keywords;
    int cluster_id = 0;
};

enum class MutationAction {
    CreateNode,
    CreateLink,
    UpdateMass,
    DecayNode,
    MergeNodes,
    RemoveLink,
    TemporalDecay
};

std::string to_string(MutationAction action);
std::optional<MutationAction> parse_mutation_action(std::string_view text);

/**
 * @brief Append-only audit record. One per action invocation.
 */
struct MutationLogEntry {
    uint64_t sequence = 0;  // assigned by the store on append
    MutationAction action = MutationAction::CreateNode;
    std::string target_id;
    std::string source_id;
    nlohmann::json params = nlohmann::json::object();
    std::string reason;
    std::string triggered_by;
    std::string session_id;
    bool success = false;
    std::string error;
    std::string error_kind;
    SystemTimePoint timestamp{};
};

struct ReplaySample {
    std::string instruction;
    std::string input;
    std::string output;
    std::vector<NodeId> source_node_ids;
    std::string layer;
    double confidence = 0.0;
    std::string export_batch;
    std::string profile;
};

// JSON shapes for the wire and for NDJSON export
void to_json(nlohmann::json& j, const Node& node);
void to_json(nlohmann::json& j, const Link& link);
void to_json(nlohmann::json& j, const MutationLogEntry& entry);
void to_json(nlohmann::json& j, const ReplaySample& sample);

nlohmann::json metadata_to_json(const Metadata& metadata);

/**
 * @brief Parse a JSON object into metadata. Non-string values are stored in
 * their JSON text form.
 */
Metadata metadata_from_json(const nlohmann::json& j);

} // namespace Databrain
