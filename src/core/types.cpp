#include <core/types.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cctype>

namespace Databrain {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:       return "ValidationError";
        case ErrorKind::Conflict:         return "ConflictError";
        case ErrorKind::NotFound:         return "NotFoundError";
        case ErrorKind::StoreUnavailable: return "StoreUnavailableError";
    }
    return "BrainError";
}

std::string to_string(NodeType type) {
    switch (type) {
        case NodeType::Concept:     return "concept";
        case NodeType::Entity:      return "entity";
        case NodeType::Process:     return "process";
        case NodeType::Resource:    return "resource";
        case NodeType::Wisdom:      return "wisdom";
        case NodeType::Knowledge:   return "knowledge";
        case NodeType::Information: return "information";
        case NodeType::RawData:     return "raw_data";
    }
    return "information";
}

std::string to_string(NodeCategory category) {
    return category == NodeCategory::Ephemeral ? "ephemeral" : "static";
}

std::string to_string(LinkType type) {
    switch (type) {
        case LinkType::Semantic:     return "semantic";
        case LinkType::Causal:       return "causal";
        case LinkType::Temporal:     return "temporal";
        case LinkType::Hierarchical: return "hierarchical";
    }
    return "semantic";
}

std::string to_string(Layer layer) {
    switch (layer) {
        case Layer::RawData:     return "Raw_Data";
        case Layer::Information: return "Information";
        case Layer::Knowledge:   return "Knowledge";
        case Layer::Wisdom:      return "Wisdom";
    }
    return "Information";
}

std::optional<NodeType> parse_node_type(std::string_view text) {
    std::string t = lower(text);
    if (t == "concept")     return NodeType::Concept;
    if (t == "entity")      return NodeType::Entity;
    if (t == "process")     return NodeType::Process;
    if (t == "resource")    return NodeType::Resource;
    if (t == "wisdom")      return NodeType::Wisdom;
    if (t == "knowledge")   return NodeType::Knowledge;
    if (t == "information") return NodeType::Information;
    if (t == "raw_data")    return NodeType::RawData;
    return std::nullopt;
}

std::optional<NodeCategory> parse_node_category(std::string_view text) {
    std::string t = lower(text);
    if (t == "static")    return NodeCategory::Static;
    if (t == "ephemeral") return NodeCategory::Ephemeral;
    return std::nullopt;
}

std::optional<LinkType> parse_link_type(std::string_view text) {
    std::string t = lower(text);
    if (t == "semantic")     return LinkType::Semantic;
    if (t == "causal")       return LinkType::Causal;
    if (t == "temporal")     return LinkType::Temporal;
    if (t == "hierarchical") return LinkType::Hierarchical;
    return std::nullopt;
}

int canonical_z_index(NodeType type) {
    switch (type) {
        case NodeType::RawData:   return 50;
        case NodeType::Knowledge: return 250;
        case NodeType::Wisdom:    return 350;
        default:                  return 150;
    }
}

Layer layer_of(int z_index) {
    if (z_index < 100) return Layer::RawData;
    if (z_index < 200) return Layer::Information;
    if (z_index < 300) return Layer::Knowledge;
    return Layer::Wisdom;
}

std::string to_string(MutationAction action) {
    switch (action) {
        case MutationAction::CreateNode:    return "CREATE_NODE";
        case MutationAction::CreateLink:    return "CREATE_LINK";
        case MutationAction::UpdateMass:    return "UPDATE_MASS";
        case MutationAction::DecayNode:     return "DECAY_NODE";
        case MutationAction::MergeNodes:    return "MERGE_NODES";
        case MutationAction::RemoveLink:    return "REMOVE_LINK";
        case MutationAction::TemporalDecay: return "TEMPORAL_DECAY";
    }
    return "UNKNOWN";
}

std::optional<MutationAction> parse_mutation_action(std::string_view text) {
    if (text == "CREATE_NODE")    return MutationAction::CreateNode;
    if (text == "CREATE_LINK")    return MutationAction::CreateLink;
    if (text == "UPDATE_MASS")    return MutationAction::UpdateMass;
    if (text == "DECAY_NODE")     return MutationAction::DecayNode;
    if (text == "MERGE_NODES")    return MutationAction::MergeNodes;
    if (text == "REMOVE_LINK")    return MutationAction::RemoveLink;
    if (text == "TEMPORAL_DECAY") return MutationAction::TemporalDecay;
    return std::nullopt;
}

// ============================================================================
// JSON
// ============================================================================

nlohmann::json metadata_to_json(const Metadata& metadata) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : metadata) {
        j[key] = value;
    }
    return j;
}

Metadata metadata_from_json(const nlohmann::json& j) {
    Metadata metadata;
    if (j.is_null()) return metadata;
    if (!j.is_object()) {
        throw ValidationError("metadata must be a JSON object");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        metadata[it.key()] = it.value().is_string() ? it.value().get<std::string>()
                                                    : it.value().dump();
    }
    return metadata;
}

void to_json(nlohmann::json& j, const Node& node) {
    j = nlohmann::json{
        {"id", node.id},
        {"label", node.label},
        {"type", to_string(node.type)},
        {"x", node.x},
        {"y", node.y},
        {"z_index", node.z_index},
        {"z_layer", to_string(node.layer())},
        {"mass", node.mass},
        {"category", to_string(node.category)},
        {"created_at", format_iso8601(node.created_at)},
        {"last_accessed", format_iso8601(node.last_accessed)},
        {"access_count", node.access_count},
        {"cluster_id", node.cluster_id},
        {"description", node.description},
        {"metadata", metadata_to_json(node.metadata)},
        {"version", node.version}
    };
    j["redirected_to"] = node.redirected_to ? nlohmann::json(*node.redirected_to) : nlohmann::json();
}

void to_json(nlohmann::json& j, const Link& link) {
    j = nlohmann::json{
        {"id", link.id},
        {"source_id", link.source_id},
        {"target_id", link.target_id},
        {"strength", link.strength},
        {"link_type", to_string(link.link_type)},
        {"created_at", format_iso8601(link.created_at)},
        {"traversal_count", link.traversal_count},
        {"weight", link.weight},
        {"metadata", metadata_to_json(link.metadata)}
    };
    j["last_traversed"] = link.last_traversed ? nlohmann::json(format_iso8601(*link.last_traversed))
                                              : nlohmann::json();
}

void to_json(nlohmann::json& j, const MutationLogEntry& entry) {
    j = nlohmann::json{
        {"sequence", entry.sequence},
        {"action", to_string(entry.action)},
        {"target_id", entry.target_id},
        {"source_id", entry.source_id},
        {"params", entry.params},
        {"reason", entry.reason},
        {"triggered_by", entry.triggered_by},
        {"session_id", entry.session_id},
        {"success", entry.success},
        {"error", entry.error},
        {"error_kind", entry.error_kind},
        {"timestamp", format_iso8601(entry.timestamp)}
    };
}

void to_json(nlohmann::json& j, const ReplaySample& sample) {
    j = nlohmann::json{
        {"instruction", sample.instruction},
        {"input", sample.input},
        {"output", sample.output},
        {"source_node_ids", sample.source_node_ids},
        {"layer", sample.layer},
        {"confidence", sample.confidence},
        {"export_batch", sample.export_batch},
        {"target_profile", sample.profile}
    };
}

} // namespace Databrain
