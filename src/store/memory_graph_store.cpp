#include <store/memory_graph_store.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>
#include <unordered_set>

namespace Databrain {

std::string MemoryGraphStore::label_key(const std::string& label) {
    std::string key = label;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

// ============================================================================
// Nodes
// ============================================================================

std::optional<Node> MemoryGraphStore::get_node(const NodeId& id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    return it->second;
}

void MemoryGraphStore::check_node_write(const NodeWrite& write) const {
    const Node& node = write.node;

    if (node.id.empty()) {
        throw ValidationError("node id must not be empty");
    }
    if (!std::isfinite(node.mass) || node.mass < kMinMass || node.mass > kMaxMass) {
        throw ValidationError("node mass out of range [1, 100]: " + std::to_string(node.mass));
    }

    auto it = nodes_.find(node.id);

    if (!write.expected_version) {
        if (it != nodes_.end()) {
            throw ConflictError("node already exists: " + node.id);
        }
        return;
    }

    if (it == nodes_.end()) {
        throw NotFoundError("node not found: " + node.id);
    }
    if (it->second.version != *write.expected_version) {
        throw ConflictError("version mismatch on node " + node.id + ": expected " +
                            std::to_string(*write.expected_version) + ", stored " +
                            std::to_string(it->second.version));
    }
    if (it->second.redirected_to && it->second.redirected_to != node.redirected_to) {
        throw ValidationError("redirect of node " + node.id + " cannot be cleared or changed");
    }
}

void MemoryGraphStore::apply_node_write(const NodeWrite& write) {
    Node stored = write.node;

    auto it = nodes_.find(stored.id);
    if (it != nodes_.end()) {
        stored.version = it->second.version + 1;
        if (label_key(it->second.label) != label_key(stored.label)) {
            label_index_[label_key(it->second.label)].erase(stored.id);
        }
    } else {
        stored.version = 1;
    }

    label_index_[label_key(stored.label)].insert(stored.id);
    nodes_[stored.id] = std::move(stored);
}

Node MemoryGraphStore::upsert_node(const Node& node, std::optional<uint64_t> expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    NodeWrite write{node, expected_version};
    check_node_write(write);
    apply_node_write(write);
    return nodes_.at(node.id);
}

Node MemoryGraphStore::apply_mass_delta(const NodeId& id, const MassDelta& change) {
    if (!std::isfinite(change.delta)) {
        throw ValidationError("mass delta must be finite");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        throw NotFoundError("node not found: " + id);
    }
    Node& node = it->second;
    if (node.redirected_to) {
        throw ValidationError("node " + id + " was merged into " + *node.redirected_to);
    }

    node.mass = clamp_mass(node.mass + change.delta);
    if (change.touch_at) {
        node.last_accessed = *change.touch_at;
        node.access_count += 1;
    }
    node.version += 1;

    if (change.log) push_log(*change.log);
    return node;
}

bool MemoryGraphStore::touch_node(const NodeId& id, SystemTimePoint at) {
    std::unique_lock<std::shared_mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) return false;

    auto it = nodes_.find(id);
    if (it == nodes_.end() || it->second.redirected_to) return false;

    it->second.last_accessed = at;
    it->second.access_count += 1;
    it->second.version += 1;
    return true;
}

std::vector<Node> MemoryGraphStore::find_by_label(const std::string& label) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Node> out;
    auto it = label_index_.find(label_key(label));
    if (it == label_index_.end()) return out;

    for (const auto& id : it->second) {
        const Node& node = nodes_.at(id);
        if (!node.redirected_to) out.push_back(node);
    }

    std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return out;
}

std::vector<Node> MemoryGraphStore::scan_nodes(const NodeScan& scan) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Node> out;
    for (const auto& [id, node] : nodes_) {
        if (!scan.include_redirected && node.redirected_to) continue;
        if (scan.accessed_before && !(node.last_accessed < *scan.accessed_before)) continue;
        if (scan.min_z_index && node.z_index < *scan.min_z_index) continue;
        if (scan.min_mass && node.mass < *scan.min_mass) continue;
        out.push_back(node);
    }
    lock.unlock();

    switch (scan.order) {
        case NodeOrder::MassDesc:
            std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) {
                if (a.mass != b.mass) return a.mass > b.mass;
                return a.id < b.id;
            });
            break;
        case NodeOrder::LastAccessedAsc:
            std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) {
                if (a.last_accessed != b.last_accessed) return a.last_accessed < b.last_accessed;
                return a.id < b.id;
            });
            break;
        case NodeOrder::SignatureAsc:
            std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) {
                if (a.similarity_signature != b.similarity_signature) {
                    return a.similarity_signature < b.similarity_signature;
                }
                return a.id < b.id;
            });
            break;
    }

    if (scan.limit > 0 && out.size() > scan.limit) out.resize(scan.limit);
    return out;
}

// ============================================================================
// Links
// ============================================================================

std::optional<Link> MemoryGraphStore::get_link(const LinkId& id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = links_.find(id);
    if (it == links_.end()) return std::nullopt;
    return it->second;
}

std::vector<Link> MemoryGraphStore::list_links(const NodeId& node_id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Link> out;
    auto it = adjacency_.find(node_id);
    if (it == adjacency_.end()) return out;

    for (const auto& link_id : it->second) {
        out.push_back(links_.at(link_id));
    }
    return out;
}

std::vector<Neighbor> MemoryGraphStore::list_neighbors(const NodeId& node_id, size_t max_neighbors) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Neighbor> candidates;
    auto it = adjacency_.find(node_id);
    if (it != adjacency_.end()) {
        for (const auto& link_id : it->second) {
            const Link& link = links_.at(link_id);
            const NodeId& other = link.other_end(node_id);
            if (other == node_id) continue;

            auto nit = nodes_.find(other);
            if (nit == nodes_.end() || nit->second.redirected_to) continue;
            candidates.push_back({nit->second, link});
        }
    }
    lock.unlock();

    std::sort(candidates.begin(), candidates.end(), neighbor_before);

    // A node linked in both directions is listed once, via its strongest link
    std::vector<Neighbor> out;
    std::unordered_set<NodeId> seen;
    for (auto& n : candidates) {
        if (out.size() >= max_neighbors) break;
        if (!seen.insert(n.node.id).second) continue;
        out.push_back(std::move(n));
    }
    return out;
}

void MemoryGraphStore::put_link(const Link& link) {
    auto it = links_.find(link.id);
    if (it != links_.end()) {
        adjacency_[it->second.source_id].erase(link.id);
        adjacency_[it->second.target_id].erase(link.id);
    }
    links_[link.id] = link;
    adjacency_[link.source_id].insert(link.id);
    adjacency_[link.target_id].insert(link.id);
}

void MemoryGraphStore::erase_link(const LinkId& id) {
    auto it = links_.find(id);
    if (it == links_.end()) return;
    adjacency_[it->second.source_id].erase(id);
    adjacency_[it->second.target_id].erase(id);
    links_.erase(it);
}

// ============================================================================
// Batches
// ============================================================================

void MemoryGraphStore::commit(const WriteBatch& batch) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Validate everything before touching state
    std::unordered_map<NodeId, const Node*> pending;
    for (const auto& write : batch.nodes) {
        check_node_write(write);
        if (!pending.emplace(write.node.id, &write.node).second) {
            throw ValidationError("node written twice in one batch: " + write.node.id);
        }
    }

    auto final_node = [&](const NodeId& id) -> const Node* {
        auto p = pending.find(id);
        if (p != pending.end()) return p->second;
        auto n = nodes_.find(id);
        return n == nodes_.end() ? nullptr : &n->second;
    };

    std::unordered_set<LinkId> deleted(batch.delete_links.begin(), batch.delete_links.end());
    for (const auto& link_id : batch.delete_links) {
        if (!links_.count(link_id)) {
            throw NotFoundError("link not found: " + link_id);
        }
    }

    std::unordered_map<LinkId, const Link*> upserted;
    for (const auto& link : batch.upsert_links) {
        if (link.source_id == link.target_id) {
            throw ValidationError("self-loop on node " + link.source_id);
        }
        if (!std::isfinite(link.strength) || link.strength < kMinStrength || link.strength > kMaxStrength) {
            throw ValidationError("link strength out of range [0, 1]: " + std::to_string(link.strength));
        }
        for (const NodeId* end : {&link.source_id, &link.target_id}) {
            const Node* node = final_node(*end);
            if (!node) {
                throw ValidationError("link endpoint does not exist: " + *end);
            }
            if (node->redirected_to) {
                throw ValidationError("link endpoint was merged away: " + *end);
            }
        }
        upserted[link.id] = &link;
    }

    // A node being redirected must not keep any incident link
    for (const auto& write : batch.nodes) {
        if (!write.node.redirected_to) continue;
        auto adj = adjacency_.find(write.node.id);
        if (adj == adjacency_.end()) continue;
        for (const auto& link_id : adj->second) {
            if (deleted.count(link_id)) continue;
            auto up = upserted.find(link_id);
            if (up != upserted.end() && !up->second->touches(write.node.id)) continue;
            throw ValidationError("link " + link_id + " still references merged node " + write.node.id);
        }
    }

    // Apply
    for (const auto& write : batch.nodes) {
        apply_node_write(write);
    }
    for (const auto& link_id : batch.delete_links) {
        erase_link(link_id);
    }
    for (const auto& link : batch.upsert_links) {
        put_link(link);
    }
    if (batch.log) {
        push_log(*batch.log);
    }
}

// ============================================================================
// Audit log
// ============================================================================

uint64_t MemoryGraphStore::push_log(const MutationLogEntry& entry) {
    MutationLogEntry stored = entry;
    stored.sequence = next_sequence_++;
    log_.push_back(std::move(stored));
    return log_.back().sequence;
}

uint64_t MemoryGraphStore::append_log(const MutationLogEntry& entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return push_log(entry);
}

std::vector<MutationLogEntry> MemoryGraphStore::list_log(const LogFilter& filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<MutationLogEntry> out;
    for (const auto& entry : log_) {
        if (filter.action && entry.action != *filter.action) continue;
        if (filter.node_id && entry.target_id != *filter.node_id && entry.source_id != *filter.node_id) {
            continue;
        }
        out.push_back(entry);
    }
    lock.unlock();

    std::stable_sort(out.begin(), out.end(), [](const MutationLogEntry& a, const MutationLogEntry& b) {
        if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
        return a.sequence < b.sequence;
    });

    if (filter.limit > 0 && out.size() > filter.limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(filter.limit));
    }
    return out;
}

// ============================================================================
// Force fields
// ============================================================================

void MemoryGraphStore::upsert_force_field(const ForceField& field) {
    if (field.id.empty()) {
        throw ValidationError("force field id must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    force_fields_[field.id] = field;
}

std::vector<ForceField> MemoryGraphStore::list_force_fields() {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ForceField> out;
    out.reserve(force_fields_.size());
    for (const auto& [id, field] : force_fields_) {
        out.push_back(field);
    }
    return out;
}

StoreStats MemoryGraphStore::stats() {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    StoreStats s;
    s.nodes = nodes_.size();
    s.redirected_nodes = static_cast<size_t>(std::count_if(nodes_.begin(), nodes_.end(),
        [](const auto& kv) { return kv.second.redirected_to.has_value(); }));
    s.links = links_.size();
    s.force_fields = force_fields_.size();
    s.log_entries = log_.size();
    return s;
}

} // namespace Databrain
