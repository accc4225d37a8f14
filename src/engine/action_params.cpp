#include <engine/action_params.hpp>
#include <core/errors.hpp>
#include <cstdint>
#include <limits>

namespace Databrain {

namespace {

const nlohmann::json& as_object(const nlohmann::json& params) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (params.is_null()) return empty;
    if (!params.is_object()) {
        throw ValidationError("action params must be a JSON object");
    }
    return params;
}

std::optional<std::string> opt_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw ValidationError(std::string("param '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::string req_string(const nlohmann::json& j, const char* key) {
    auto value = opt_string(j, key);
    if (!value) {
        throw ValidationError(std::string("missing required param '") + key + "'");
    }
    return *value;
}

std::optional<double> opt_number(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) {
        throw ValidationError(std::string("param '") + key + "' must be a number");
    }
    return it->get<double>();
}

std::optional<int> opt_int(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer()) {
        throw ValidationError(std::string("param '") + key + "' must be an integer");
    }
    bool in_range = it->is_number_unsigned()
        ? it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : it->get<int64_t>() >= std::numeric_limits<int>::min() &&
          it->get<int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
        throw ValidationError(std::string("param '") + key + "' is out of range: " + it->dump());
    }
    return static_cast<int>(it->get<int64_t>());
}

} // namespace

CreateNodeParams parse_create_node(const nlohmann::json& params) {
    const auto& j = as_object(params);

    CreateNodeParams p;
    p.label = req_string(j, "label");

    if (auto type = opt_string(j, "type")) {
        auto parsed = parse_node_type(*type);
        if (!parsed) throw ValidationError("unknown node type: " + *type);
        p.type = *parsed;
    }
    if (auto category = opt_string(j, "category")) {
        auto parsed = parse_node_category(*category);
        if (!parsed) throw ValidationError("unknown node category: " + *category);
        p.category = *parsed;
    }

    if (auto mass = opt_number(j, "initial_mass")) {
        p.initial_mass = *mass;
    } else if (auto alias = opt_number(j, "mass")) {
        p.initial_mass = *alias;
    }

    p.description = opt_string(j, "description").value_or("");
    p.z_index = opt_int(j, "z_index");

    if (auto it = j.find("metadata"); it != j.end()) {
        p.metadata = metadata_from_json(*it);
    }
    return p;
}

CreateLinkParams parse_create_link(const nlohmann::json& params) {
    const auto& j = as_object(params);

    CreateLinkParams p;
    p.source_id = req_string(j, "source_id");
    p.target_id = opt_string(j, "target_id");
    p.target_label = opt_string(j, "target_label");
    if (!p.target_id && !p.target_label) {
        throw ValidationError("CREATE_LINK needs target_id or target_label");
    }

    if (auto weight = opt_number(j, "weight")) p.weight = *weight;
    p.strength = opt_number(j, "strength");

    if (auto type = opt_string(j, "link_type")) {
        auto parsed = parse_link_type(*type);
        if (!parsed) throw ValidationError("unknown link type: " + *type);
        p.link_type = *parsed;
    }
    return p;
}

UpdateMassParams parse_update_mass(const nlohmann::json& params) {
    const auto& j = as_object(params);

    UpdateMassParams p;
    p.target_id = req_string(j, "target_id");
    if (auto delta = opt_number(j, "delta")) p.delta = *delta;
    return p;
}

DecayNodeParams parse_decay_node(const nlohmann::json& params) {
    const auto& j = as_object(params);

    DecayNodeParams p;
    p.target_id = req_string(j, "target_id");
    if (auto reason = opt_string(j, "reason")) p.reason = *reason;
    return p;
}

MergeNodesParams parse_merge_nodes(const nlohmann::json& params) {
    const auto& j = as_object(params);

    MergeNodesParams p;
    p.winner_id = req_string(j, "winner_id");
    p.loser_id = req_string(j, "loser_id");
    return p;
}

RemoveLinkParams parse_remove_link(const nlohmann::json& params) {
    const auto& j = as_object(params);
    return RemoveLinkParams{req_string(j, "link_id")};
}

TemporalDecayParams parse_temporal_decay(const nlohmann::json& params, const DecayConfig& defaults) {
    const auto& j = as_object(params);

    TemporalDecayParams p;
    p.target_id = req_string(j, "target_id");
    p.policy = defaults;
    if (auto v = opt_number(j, "inactivity_days")) p.policy.inactivity_days = *v;
    if (auto v = opt_number(j, "half_life_days")) p.policy.half_life_days = *v;
    if (auto v = opt_number(j, "min_mass")) p.policy.min_mass = *v;
    return p;
}

MutationContext parse_context(const nlohmann::json& params, const MutationContext& base) {
    MutationContext ctx = base;
    if (!params.is_object()) return ctx;

    if (auto v = opt_string(params, "triggered_by")) ctx.triggered_by = *v;
    if (auto v = opt_string(params, "session_id")) ctx.session_id = *v;
    if (auto v = opt_string(params, "reason")) ctx.reason = *v;
    return ctx;
}

// ============================================================================
// Log form
// ============================================================================

nlohmann::json to_log_params(const CreateNodeParams& p) {
    nlohmann::json j = {
        {"label", p.label},
        {"type", to_string(p.type)},
        {"initial_mass", p.initial_mass},
        {"description", p.description},
        {"category", to_string(p.category)},
        {"metadata", metadata_to_json(p.metadata)}
    };
    if (p.z_index) j["z_index"] = *p.z_index;
    return j;
}

nlohmann::json to_log_params(const CreateLinkParams& p) {
    nlohmann::json j = {
        {"source_id", p.source_id},
        {"weight", p.weight},
        {"link_type", to_string(p.link_type)}
    };
    if (p.target_id) j["target_id"] = *p.target_id;
    if (p.target_label) j["target_label"] = *p.target_label;
    if (p.strength) j["strength"] = *p.strength;
    return j;
}

nlohmann::json to_log_params(const UpdateMassParams& p) {
    return {{"target_id", p.target_id}, {"delta", p.delta}};
}

nlohmann::json to_log_params(const DecayNodeParams& p) {
    return {{"target_id", p.target_id}, {"reason", p.reason}};
}

nlohmann::json to_log_params(const MergeNodesParams& p) {
    return {{"winner_id", p.winner_id}, {"loser_id", p.loser_id}};
}

nlohmann::json to_log_params(const RemoveLinkParams& p) {
    return {{"link_id", p.link_id}};
}

nlohmann::json to_log_params(const TemporalDecayParams& p) {
    return {
        {"target_id", p.target_id},
        {"inactivity_days", p.policy.inactivity_days},
        {"half_life_days", p.policy.half_life_days},
        {"min_mass", p.policy.min_mass}
    };
}

} // namespace Databrain
