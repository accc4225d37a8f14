/**
 * @file mutation_engine.cpp
 * @brief Neuroplasticity actions over GraphStore write batches
 */

#include <engine/mutation_engine.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <random>
#include <set>
#include <thread>

namespace Databrain {

namespace {

constexpr double k_explicit_decay_factor = 0.8;

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

void require_utf8(const std::string& value, const std::string& field) {
    if (!is_valid_utf8(value)) {
        throw ValidationError(field + " is not valid UTF-8");
    }
}

void require_utf8(const Metadata& metadata) {
    for (const auto& [key, value] : metadata) {
        require_utf8(key, "metadata key");
        require_utf8(value, "metadata value for '" + key + "'");
    }
}

nlohmann::json error_json(const std::string& kind, const std::string& message, bool retryable) {
    return {{"kind", kind}, {"message", message}, {"retryable", retryable}};
}

} // namespace

nlohmann::json MutationResult::to_json() const {
    nlohmann::json j = detail;
    if (node) {
        j["node_id"] = node->id;
        j["new_mass"] = node->mass;
        j["node"] = *node;
    }
    if (link) {
        j["link_id"] = link->id;
        j["link"] = *link;
    }
    return j;
}

MutationEngine::MutationEngine(GraphStore& store, const SimilarityScorer& scorer, const Clock& clock,
                               RetryConfig retry, ForceLayout layout, std::string triggered_by)
    : store_(store), scorer_(scorer), clock_(clock), retry_(retry), layout_(layout),
      triggered_by_(std::move(triggered_by)) {
    if (retry_.max_attempts < 1) retry_.max_attempts = 1;
}

// ============================================================================
// Retry loop and audit log
// ============================================================================

MutationLogEntry MutationEngine::make_entry(MutationAction action, nlohmann::json params,
                                            const MutationContext& ctx) const {
    MutationLogEntry entry;
    entry.action = action;
    entry.params = std::move(params);
    entry.reason = ctx.reason;
    entry.triggered_by = ctx.triggered_by.empty() ? triggered_by_ : ctx.triggered_by;
    entry.session_id = ctx.session_id;
    return entry;
}

MutationResult MutationEngine::run(MutationAction action, nlohmann::json params,
                                   const MutationContext& ctx, const Attempt& attempt) {
    const MutationLogEntry seed = make_entry(action, std::move(params), ctx);

    for (int attempt_no = 1;; ++attempt_no) {
        MutationLogEntry draft = seed;
        draft.timestamp = clock_.now();
        draft.success = true;

        try {
            require_utf8(draft.reason, "reason");
            require_utf8(draft.triggered_by, "triggered_by");
            require_utf8(draft.session_id, "session_id");

            MutationResult result = attempt(draft);
            Logger::debug(to_string(action) + " " + draft.target_id + " committed");
            return result;
        } catch (const ConflictError& e) {
            if (attempt_no < retry_.max_attempts) {
                Logger::debug(to_string(action) + " conflict on attempt " + std::to_string(attempt_no) +
                              ", retrying: " + e.what());
                backoff(attempt_no);
                continue;
            }
            record_failure(draft, to_string(e.kind()),
                           "gave up after " + std::to_string(attempt_no) + " attempts: " + e.what());
            throw;
        } catch (const BrainError& e) {
            record_failure(draft, to_string(e.kind()), e.what());
            throw;
        } catch (const std::exception& e) {
            record_failure(draft, "InternalError", e.what());
            throw;
        }
    }
}

void MutationEngine::record_failure(MutationLogEntry entry, const std::string& kind, const std::string& message) {
    entry.success = false;
    entry.error = message;
    entry.error_kind = kind;
    entry.timestamp = clock_.now();

    Logger::warn(to_string(entry.action) + " failed [" + kind + "]: " + message);

    try {
        store_.append_log(entry);
    } catch (const BrainError& log_error) {
        // The action error is still rethrown by the caller
        Logger::error("Could not record failed " + to_string(entry.action) + ": " + log_error.what());
    }
}

void MutationEngine::backoff(int attempt) const {
    using std::chrono::microseconds;

    auto base = std::chrono::duration_cast<microseconds>(retry_.base_backoff).count();
    auto cap = std::chrono::duration_cast<microseconds>(retry_.max_backoff).count();

    int64_t ceiling = base;
    for (int i = 1; i < attempt && ceiling < cap; ++i) ceiling *= 2;
    ceiling = std::min<int64_t>(ceiling, cap);
    if (ceiling <= 0) return;

    // Full jitter
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int64_t> dist(0, ceiling);
    std::this_thread::sleep_for(microseconds(dist(rng)));
}

Node MutationEngine::load_live(const NodeId& id, const char* role) {
    if (id.empty()) {
        throw ValidationError(std::string(role) + " id must not be empty");
    }
    auto node = store_.get_node(id);
    if (!node) {
        throw NotFoundError(std::string(role) + " node not found: " + id);
    }
    if (node->redirected_to) {
        throw ValidationError(std::string(role) + " node " + id + " was merged into " + *node->redirected_to);
    }
    return *node;
}

void MutationEngine::guard(WriteBatch& batch, const Node& node) {
    for (const auto& write : batch.nodes) {
        if (write.node.id == node.id) return;
    }
    batch.nodes.push_back({node, node.version});
}

Node MutationEngine::build_node(const CreateNodeParams& params, SystemTimePoint now) {
    Node node;
    node.label = trim(params.label);
    node.type = params.type;
    node.id = ids_.node_id(node.label, to_string(node.type), now);
    node.z_index = params.z_index.value_or(canonical_z_index(params.type));
    node.mass = clamp_mass(params.initial_mass);
    node.category = params.category;
    node.description = params.description;
    node.metadata = params.metadata;
    node.similarity_signature = scorer_.signature(node.label, node.description);
    node.created_at = now;
    node.last_accessed = now;
    node.access_count = 1;

    Placement placement = layout_.place(node.label, node.id, store_.list_force_fields());
    node.cluster_id = placement.cluster_id;
    node.x = placement.position.x();
    node.y = placement.position.y();
    return node;
}

// ============================================================================
// Actions
// ============================================================================

MutationResult MutationEngine::create_node(const CreateNodeParams& params, const MutationContext& ctx) {
    return run(MutationAction::CreateNode, to_log_params(params), ctx, [&](MutationLogEntry& entry) {
        if (trim(params.label).empty()) {
            throw ValidationError("CREATE_NODE needs a non-empty label");
        }
        require_utf8(params.label, "label");
        require_utf8(params.description, "description");
        require_utf8(params.metadata);
        if (!std::isfinite(params.initial_mass)) {
            throw ValidationError("initial_mass must be a finite number");
        }
        if (params.z_index && *params.z_index < 0) {
            throw ValidationError("z_index must not be negative");
        }

        Node node = build_node(params, clock_.now());
        entry.target_id = node.id;

        WriteBatch batch;
        batch.nodes.push_back({node, std::nullopt});
        batch.log = entry;
        store_.commit(batch);

        node.version = 1;
        Logger::debug("Created node " + node.id + " '" + node.label + "' mass " + std::to_string(node.mass));

        MutationResult result;
        result.action = MutationAction::CreateNode;
        result.detail = {{"z_index", node.z_index}, {"cluster_id", node.cluster_id}};
        result.node = std::move(node);
        return result;
    });
}

MutationResult MutationEngine::create_link(const CreateLinkParams& params, const MutationContext& ctx) {
    return run(MutationAction::CreateLink, to_log_params(params), ctx, [&](MutationLogEntry& entry) {
        entry.source_id = params.source_id;

        if (params.target_id && *params.target_id == params.source_id) {
            throw ValidationError("self-loop rejected on node " + params.source_id);
        }
        if (!std::isfinite(params.weight) || (params.strength && !std::isfinite(*params.strength))) {
            throw ValidationError("link weight and strength must be finite numbers");
        }
        if (!params.target_id && !params.target_label) {
            throw ValidationError("CREATE_LINK needs target_id or target_label");
        }

        SystemTimePoint now = clock_.now();
        Node source = load_live(params.source_id, "source");

        // Target: id first, then label, then a new node for a label-only target
        std::optional<Node> target;
        bool created_target = false;

        if (params.target_id) {
            auto found = store_.get_node(*params.target_id);
            if (found) {
                if (found->redirected_to) {
                    throw ValidationError("target node " + found->id + " was merged into " + *found->redirected_to);
                }
                target = std::move(*found);
            } else if (!params.target_label) {
                throw NotFoundError("target node not found: " + *params.target_id);
            }
        }

        if (!target) {
            std::string label = trim(*params.target_label);
            if (label.empty()) {
                throw ValidationError("target_label must not be empty");
            }
            require_utf8(label, "target_label");
            auto matches = store_.find_by_label(label);
            if (!matches.empty()) {
                target = std::move(matches.front());
            } else {
                CreateNodeParams defaults;
                defaults.label = label;
                target = build_node(defaults, now);
                created_target = true;
            }
        }

        if (target->id == source.id) {
            throw ValidationError("self-loop rejected on node " + source.id);
        }
        entry.target_id = target->id;

        double weight = clamp_strength(params.weight);
        double strength = clamp_strength(params.strength.value_or(params.weight));

        // Same directed pair: strengthen instead of adding a parallel link
        std::optional<Link> existing;
        for (auto& l : store_.list_links(source.id)) {
            if (l.source_id == source.id && l.target_id == target->id) {
                existing = std::move(l);
                break;
            }
        }

        Link link;
        if (existing) {
            // Re-asserting a known link counts as a traversal
            link = *existing;
            link.strength = std::max(link.strength, strength);
            link.weight = std::max(link.weight, weight);
            link.traversal_count += 1;
            link.last_traversed = now;
        } else {
            link.id = ids_.link_id(source.id, target->id, now);
            link.source_id = source.id;
            link.target_id = target->id;
            link.strength = strength;
            link.weight = weight;
            link.link_type = params.link_type;
            link.created_at = now;
        }

        WriteBatch batch;
        guard(batch, source);
        if (created_target) {
            batch.nodes.push_back({*target, std::nullopt});
        } else {
            guard(batch, *target);
        }
        batch.upsert_links.push_back(link);

        entry.params["strengthened"] = existing.has_value();
        entry.params["created_target"] = created_target;
        batch.log = entry;
        store_.commit(batch);

        MutationResult result;
        result.action = MutationAction::CreateLink;
        result.detail = {
            {"source_id", source.id},
            {"target_id", target->id},
            {"strength", link.strength},
            {"strengthened", existing.has_value()},
            {"created_target", created_target}
        };
        result.link = std::move(link);
        return result;
    });
}

MutationResult MutationEngine::update_mass(const UpdateMassParams& params, const MutationContext& ctx) {
    return run(MutationAction::UpdateMass, to_log_params(params), ctx, [&](MutationLogEntry& entry) {
        entry.target_id = params.target_id;

        if (params.target_id.empty()) {
            throw ValidationError("target_id must not be empty");
        }
        if (!std::isfinite(params.delta)) {
            throw ValidationError("delta must be a finite number");
        }

        MassDelta change;
        change.delta = params.delta;
        change.touch_at = clock_.now();
        change.log = entry;

        MutationResult result;
        result.action = MutationAction::UpdateMass;
        result.node = store_.apply_mass_delta(params.target_id, change);
        result.detail = {{"delta", params.delta}};
        return result;
    });
}

MutationResult MutationEngine::decay_node(const DecayNodeParams& params, const MutationContext& ctx) {
    MutationContext logged = ctx;
    if (logged.reason.empty()) logged.reason = params.reason;

    return run(MutationAction::DecayNode, to_log_params(params), logged, [&](MutationLogEntry& entry) {
        entry.target_id = params.target_id;
        require_utf8(params.reason, "reason");
        Node node = load_live(params.target_id, "target");

        Node updated = node;
        updated.mass = clamp_mass(node.mass * k_explicit_decay_factor);
        updated.metadata["decay_reason"] = params.reason;

        WriteBatch batch;
        batch.nodes.push_back({updated, node.version});
        batch.log = entry;
        store_.commit(batch);

        updated.version = node.version + 1;

        MutationResult result;
        result.action = MutationAction::DecayNode;
        result.detail = {{"old_mass", node.mass}, {"reason", params.reason}};
        result.node = std::move(updated);
        return result;
    });
}

MutationResult MutationEngine::merge_nodes(const MergeNodesParams& params, const MutationContext& ctx) {
    return run(MutationAction::MergeNodes, to_log_params(params), ctx, [&](MutationLogEntry& entry) {
        entry.target_id = params.winner_id;
        entry.source_id = params.loser_id;

        if (params.winner_id == params.loser_id) {
            throw ValidationError("cannot merge node " + params.winner_id + " into itself");
        }

        Node winner = load_live(params.winner_id, "winner");
        Node loser = load_live(params.loser_id, "loser");

        std::vector<Link> winner_links = store_.list_links(winner.id);
        std::vector<Link> loser_links = store_.list_links(loser.id);

        // Directed pair -> surviving link
        std::map<std::pair<NodeId, NodeId>, Link> by_pair;
        for (const auto& l : winner_links) {
            if (l.touches(loser.id)) continue;
            by_pair.emplace(std::make_pair(l.source_id, l.target_id), l);
        }

        std::map<LinkId, Link> upserts;
        std::set<LinkId> deletes;
        int rewired = 0;
        int deduplicated = 0;
        int dropped = 0;

        for (const auto& l : loser_links) {
            Link moved = l;
            if (moved.source_id == loser.id) moved.source_id = winner.id;
            if (moved.target_id == loser.id) moved.target_id = winner.id;

            // winner <-> loser links would become self-loops
            if (moved.source_id == moved.target_id) {
                deletes.insert(l.id);
                ++dropped;
                continue;
            }

            auto key = std::make_pair(moved.source_id, moved.target_id);
            auto it = by_pair.find(key);
            if (it == by_pair.end()) {
                by_pair.emplace(key, moved);
                upserts[moved.id] = moved;
                ++rewired;
                continue;
            }

            // Parallel link: keep the surviving one at the higher strength
            Link& kept = it->second;
            kept.strength = std::max(kept.strength, moved.strength);
            kept.weight = std::max(kept.weight, moved.weight);
            kept.traversal_count += moved.traversal_count;
            if (moved.last_traversed && (!kept.last_traversed || *kept.last_traversed < *moved.last_traversed)) {
                kept.last_traversed = moved.last_traversed;
            }
            upserts[kept.id] = kept;
            deletes.insert(l.id);
            ++deduplicated;
        }

        Node merged = winner;
        merged.mass = clamp_mass(winner.mass + loser.mass);
        merged.access_count = winner.access_count + loser.access_count;
        merged.last_accessed = std::max(winner.last_accessed, loser.last_accessed);
        if (merged.description.empty()) merged.description = loser.description;

        auto position = ForceLayout::weighted_centroid(ForceLayout::Vec2(winner.x, winner.y), winner.mass,
                                                       ForceLayout::Vec2(loser.x, loser.y), loser.mass);
        merged.x = position.x();
        merged.y = position.y();

        for (const auto& [key, value] : loser.metadata) {
            if (key == "merged_from" || key == "merge_survivor") continue;
            merged.metadata.emplace(key, value);
        }
        auto& merged_from = merged.metadata["merged_from"];
        merged_from = merged_from.empty() ? loser.id : merged_from + "," + loser.id;
        merged.similarity_signature = scorer_.signature(merged.label, merged.description);

        Node tombstone = loser;
        tombstone.redirected_to = winner.id;
        tombstone.metadata["merge_survivor"] = winner.id;

        WriteBatch batch;
        batch.nodes.push_back({merged, winner.version});
        batch.nodes.push_back({tombstone, loser.version});

        // Every other endpoint of a changed link is guarded too
        std::set<NodeId> neighbors;
        auto collect = [&](const Link& l) {
            for (const NodeId* end : {&l.source_id, &l.target_id}) {
                if (*end != winner.id && *end != loser.id) neighbors.insert(*end);
            }
        };
        for (const auto& l : loser_links) collect(l);
        for (const auto& [id, l] : upserts) collect(l);

        for (const auto& id : neighbors) {
            auto neighbor = store_.get_node(id);
            if (!neighbor || neighbor->redirected_to) {
                throw ConflictError("neighbor " + id + " changed while merging " + loser.id);
            }
            guard(batch, *neighbor);
        }

        for (const auto& id : deletes) batch.delete_links.push_back(id);
        for (auto& [id, l] : upserts) batch.upsert_links.push_back(l);

        entry.params["links_rewired"] = rewired;
        entry.params["links_deduplicated"] = deduplicated;
        entry.params["links_dropped"] = dropped;
        batch.log = entry;
        store_.commit(batch);

        merged.version = winner.version + 1;
        Logger::debug("Merged " + loser.id + " into " + winner.id + ": " + std::to_string(rewired) +
                      " rewired, " + std::to_string(deduplicated) + " deduplicated");

        MutationResult result;
        result.action = MutationAction::MergeNodes;
        result.detail = {
            {"winner_id", winner.id},
            {"loser_id", loser.id},
            {"links_rewired", rewired},
            {"links_deduplicated", deduplicated},
            {"links_dropped", dropped}
        };
        result.node = std::move(merged);
        return result;
    });
}

MutationResult MutationEngine::remove_link(const RemoveLinkParams& params, const MutationContext& ctx) {
    return run(MutationAction::RemoveLink, to_log_params(params), ctx, [&](MutationLogEntry& entry) {
        entry.target_id = params.link_id;

        if (params.link_id.empty()) {
            throw ValidationError("link_id must not be empty");
        }
        auto link = store_.get_link(params.link_id);
        if (!link) {
            throw NotFoundError("link not found: " + params.link_id);
        }
        entry.source_id = link->source_id;

        WriteBatch batch;
        for (const NodeId* end : {&link->source_id, &link->target_id}) {
            auto node = store_.get_node(*end);
            if (!node) {
                throw ConflictError("endpoint " + *end + " of link " + link->id + " changed concurrently");
            }
            guard(batch, *node);
        }
        batch.delete_links.push_back(link->id);
        batch.log = entry;
        store_.commit(batch);

        MutationResult result;
        result.action = MutationAction::RemoveLink;
        result.detail = {{"source_id", link->source_id}, {"target_id", link->target_id}};
        result.link = std::move(*link);
        return result;
    });
}

MutationResult MutationEngine::temporal_decay(const TemporalDecayParams& params, const MutationContext& ctx) {
    return run(MutationAction::TemporalDecay, to_log_params(params), ctx, [&](MutationLogEntry& entry) {
        entry.target_id = params.target_id;

        const DecayConfig& policy = params.policy;
        if (!(policy.half_life_days > 0.0) || !std::isfinite(policy.half_life_days)) {
            throw ValidationError("half_life_days must be a positive number");
        }
        if (!(policy.inactivity_days >= 0.0) || !std::isfinite(policy.min_mass)) {
            throw ValidationError("inactivity_days and min_mass must be valid numbers");
        }

        Node node = load_live(params.target_id, "target");
        SystemTimePoint now = clock_.now();
        double inactive_days = days_between(node.last_accessed, now);

        MutationResult result;
        result.action = MutationAction::TemporalDecay;

        auto skip = [&](const char* why) {
            entry.params["skipped"] = why;
            store_.append_log(entry);
            result.detail = {{"decayed", false}, {"skipped", why}, {"days_inactive", inactive_days}};
            result.node = node;
            return result;
        };

        if (inactive_days <= policy.inactivity_days) {
            return skip("active");
        }
        if (node.last_decay_applied_at && utc_day_number(*node.last_decay_applied_at) == utc_day_number(now)) {
            return skip("already_decayed_today");
        }

        // Decay since whichever came later: the last access or the last decay
        SystemTimePoint baseline = node.last_accessed;
        if (node.last_decay_applied_at && baseline < *node.last_decay_applied_at) {
            baseline = *node.last_decay_applied_at;
        }
        double elapsed = std::max(0.0, days_between(baseline, now));
        double factor = std::pow(0.5, elapsed / policy.half_life_days);

        double floor = clamp_mass(policy.min_mass);
        double mass = node.mass * factor;
        if (mass < floor) mass = std::min(node.mass, floor);

        Node updated = node;
        updated.mass = clamp_mass(mass);
        updated.last_decay_applied_at = now;

        entry.params["old_mass"] = node.mass;
        entry.params["new_mass"] = updated.mass;
        entry.params["days_inactive"] = inactive_days;
        entry.params["factor"] = factor;

        WriteBatch batch;
        batch.nodes.push_back({updated, node.version});
        batch.log = entry;
        store_.commit(batch);

        updated.version = node.version + 1;
        result.detail = {
            {"decayed", true},
            {"old_mass", node.mass},
            {"days_inactive", inactive_days},
            {"factor", factor}
        };
        result.node = std::move(updated);
        return result;
    });
}

// ============================================================================
// JSON surface
// ============================================================================

MutationResult MutationEngine::dispatch(MutationAction action, const nlohmann::json& params,
                                        const MutationContext& ctx) {
    // Malformed params never reach an action body, so the rejection is logged here
    auto decode = [&](auto parse) {
        try {
            return parse(params);
        } catch (const ValidationError& e) {
            nlohmann::json logged = params.is_object() ? params : nlohmann::json::object();
            record_failure(make_entry(action, std::move(logged), ctx), to_string(e.kind()), e.what());
            throw;
        }
    };

    MutationContext scoped = decode([&](const nlohmann::json& j) { return parse_context(j, ctx); });

    switch (action) {
        case MutationAction::CreateNode:
            return create_node(decode(parse_create_node), scoped);
        case MutationAction::CreateLink:
            return create_link(decode(parse_create_link), scoped);
        case MutationAction::UpdateMass:
            return update_mass(decode(parse_update_mass), scoped);
        case MutationAction::DecayNode:
            return decay_node(decode(parse_decay_node), scoped);
        case MutationAction::MergeNodes:
            return merge_nodes(decode(parse_merge_nodes), scoped);
        case MutationAction::RemoveLink:
            return remove_link(decode(parse_remove_link), scoped);
        case MutationAction::TemporalDecay:
            return temporal_decay(decode([&](const nlohmann::json& j) {
                return parse_temporal_decay(j, decay_defaults_);
            }), scoped);
    }
    throw ValidationError("unsupported action");
}

nlohmann::json MutationEngine::apply(const nlohmann::json& request, const MutationContext& ctx) {
    nlohmann::json reply = nlohmann::json::object();

    std::string name;
    if (request.is_object()) {
        auto it = request.find("action");
        if (it != request.end() && it->is_string()) name = it->get<std::string>();
    }
    reply["action"] = name;

    auto action = parse_mutation_action(name);
    if (!action) {
        Logger::warn("Rejected unknown mutation action '" + name + "'");
        reply["success"] = false;
        reply["error"] = error_json("ValidationError", "unknown action '" + name + "'", false);
        return reply;
    }

    nlohmann::json params = nlohmann::json::object();
    if (auto it = request.find("params"); it != request.end()) params = *it;

    try {
        MutationResult result = dispatch(*action, params, ctx);
        reply["success"] = true;
        reply["result"] = result.to_json();
    } catch (const BrainError& e) {
        reply["success"] = false;
        reply["error"] = error_json(to_string(e.kind()), e.what(), e.retryable());
    } catch (const std::exception& e) {
        Logger::error(name + " raised an unexpected error: " + e.what());
        reply["success"] = false;
        reply["error"] = error_json("InternalError", e.what(), false);
    }
    return reply;
}

nlohmann::json MutationEngine::mutate_brain(const nlohmann::json& actions, const MutationContext& ctx) {
    const nlohmann::json* list = &actions;
    if (actions.is_object() && actions.contains("actions")) {
        list = &actions.at("actions");
    }
    if (!list->is_array()) {
        throw ValidationError("mutate_brain expects an array of {action, params} objects");
    }

    nlohmann::json replies = nlohmann::json::array();
    size_t succeeded = 0;
    for (const auto& request : *list) {
        replies.push_back(apply(request, ctx));
        if (replies.back().at("success").get<bool>()) ++succeeded;
    }

    Logger::info("mutate_brain: " + std::to_string(succeeded) + "/" + std::to_string(list->size()) +
                 " actions applied");
    return replies;
}

} // namespace Databrain
