/**
 * @file postgres_graph_store.cpp
 * @brief SQL for the GraphStore contract
 */

#include <store/postgres_graph_store.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <charconv>
#include <cmath>
#include <unordered_set>

namespace Databrain {

namespace {

// ============================================================================
// Schema
// ============================================================================

constexpr const char* k_schema[] = {
    "CREATE TABLE IF NOT EXISTS graph_nodes ("
    "  node_id TEXT PRIMARY KEY,"
    "  label TEXT NOT NULL,"
    "  node_type TEXT NOT NULL DEFAULT 'information',"
    "  x DOUBLE PRECISION NOT NULL DEFAULT 0,"
    "  y DOUBLE PRECISION NOT NULL DEFAULT 0,"
    "  z_index INTEGER NOT NULL DEFAULT 150,"
    "  mass DOUBLE PRECISION NOT NULL DEFAULT 10 CHECK (mass >= 1.0 AND mass <= 100.0),"
    "  category TEXT NOT NULL DEFAULT 'static',"
    "  similarity_signature TEXT NOT NULL DEFAULT '',"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  last_accessed TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  access_count BIGINT NOT NULL DEFAULT 1,"
    "  cluster_id INTEGER NOT NULL DEFAULT 0,"
    "  description TEXT NOT NULL DEFAULT '',"
    "  metadata JSONB NOT NULL DEFAULT '{}',"
    "  redirected_to TEXT REFERENCES graph_nodes (node_id),"
    "  last_decay_applied_at TIMESTAMPTZ,"
    "  version BIGINT NOT NULL DEFAULT 1"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_graph_nodes_mass ON graph_nodes (mass DESC)",
    "CREATE INDEX IF NOT EXISTS idx_graph_nodes_last_accessed ON graph_nodes (last_accessed ASC)",
    "CREATE INDEX IF NOT EXISTS idx_graph_nodes_signature ON graph_nodes (similarity_signature)",
    "CREATE INDEX IF NOT EXISTS idx_graph_nodes_label ON graph_nodes (lower(label))",
    "CREATE INDEX IF NOT EXISTS idx_graph_nodes_z_index ON graph_nodes (z_index)",

    "CREATE TABLE IF NOT EXISTS graph_links ("
    "  link_id TEXT PRIMARY KEY,"
    "  source_id TEXT NOT NULL REFERENCES graph_nodes (node_id),"
    "  target_id TEXT NOT NULL REFERENCES graph_nodes (node_id),"
    "  strength DOUBLE PRECISION NOT NULL DEFAULT 0.5 CHECK (strength >= 0.0 AND strength <= 1.0),"
    "  link_type TEXT NOT NULL DEFAULT 'semantic',"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now(),"
    "  last_traversed TIMESTAMPTZ,"
    "  traversal_count BIGINT NOT NULL DEFAULT 0,"
    "  weight DOUBLE PRECISION NOT NULL DEFAULT 1.0,"
    "  metadata JSONB NOT NULL DEFAULT '{}',"
    "  CHECK (source_id <> target_id)"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_graph_links_source ON graph_links (source_id)",
    "CREATE INDEX IF NOT EXISTS idx_graph_links_target ON graph_links (target_id)",

    "CREATE TABLE IF NOT EXISTS force_fields ("
    "  field_id TEXT PRIMARY KEY,"
    "  label TEXT NOT NULL,"
    "  x DOUBLE PRECISION NOT NULL DEFAULT 0,"
    "  y DOUBLE PRECISION NOT NULL DEFAULT 0,"
    "  radius DOUBLE PRECISION NOT NULL DEFAULT 150,"
    "  strength DOUBLE PRECISION NOT NULL DEFAULT 0.5,"
    "  signature TEXT NOT NULL DEFAULT '',"
    "  keywords JSONB NOT NULL DEFAULT '[]',"
    "  cluster_id INTEGER NOT NULL DEFAULT 0"
    ")",

    "CREATE TABLE IF NOT EXISTS neuroplasticity_log ("
    "  sequence BIGSERIAL PRIMARY KEY,"
    "  action TEXT NOT NULL,"
    "  target_id TEXT NOT NULL DEFAULT '',"
    "  source_id TEXT NOT NULL DEFAULT '',"
    "  params JSONB NOT NULL DEFAULT '{}',"
    "  reason TEXT NOT NULL DEFAULT '',"
    "  triggered_by TEXT NOT NULL DEFAULT '',"
    "  session_id TEXT NOT NULL DEFAULT '',"
    "  success BOOLEAN NOT NULL,"
    "  error TEXT NOT NULL DEFAULT '',"
    "  error_kind TEXT NOT NULL DEFAULT '',"
    "  created_at TIMESTAMPTZ NOT NULL DEFAULT now()"
    ")",
    "CREATE INDEX IF NOT EXISTS idx_neuroplasticity_log_time ON neuroplasticity_log (created_at, sequence)",
    "CREATE INDEX IF NOT EXISTS idx_neuroplasticity_log_target ON neuroplasticity_log (target_id)",
};

// ============================================================================
// Value codec
// ============================================================================

std::string fmt_double(double v) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

double parse_double(const std::string& s) {
    double v = 0.0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc()) {
        throw StoreUnavailableError("malformed numeric column: '" + s + "'");
    }
    return v;
}

int64_t parse_int(const std::string& s) {
    int64_t v = 0;
    auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc()) {
        throw StoreUnavailableError("malformed integer column: '" + s + "'");
    }
    return v;
}

std::string micros(SystemTimePoint t) {
    return std::to_string(to_epoch_micros(t));
}

// JSONB rejects invalid UTF-8; bad bytes become U+FFFD instead of throwing
std::string dump_json(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string param(size_t n) {
    return "$" + std::to_string(n);
}

// Timestamps cross the wire as epoch microseconds
std::string ts_out(const std::string& column) {
    return "(EXTRACT(EPOCH FROM " + column + ") * 1000000)::BIGINT";
}

std::string ts_in(size_t n) {
    return "(TIMESTAMPTZ 'epoch' + " + param(n) + "::BIGINT * INTERVAL '1 microsecond')";
}

std::string ts_in_nullable(size_t n) {
    return "(TIMESTAMPTZ 'epoch' + NULLIF(" + param(n) + ", '')::BIGINT * INTERVAL '1 microsecond')";
}

nlohmann::json parse_json(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        throw StoreUnavailableError(std::string("malformed JSON column: ") + e.what());
    }
}

Metadata parse_metadata(const std::string& text) {
    return metadata_from_json(parse_json(text));
}

// ============================================================================
// Row layouts
// ============================================================================

std::string node_columns(const std::string& p) {
    return p + "node_id, " + p + "label, " + p + "node_type, " + p + "x, " + p + "y, " +
           p + "z_index, " + p + "mass, " + p + "category, " + p + "similarity_signature, " +
           ts_out(p + "created_at") + ", " + ts_out(p + "last_accessed") + ", " +
           p + "access_count, " + p + "cluster_id, " + p + "description, " + p + "metadata::TEXT, " +
           "COALESCE(" + p + "redirected_to, ''), " +
           "COALESCE(" + ts_out(p + "last_decay_applied_at") + ", -1), " + p + "version";
}

Node node_from_row(const PostgresConnection::Row& r, size_t o = 0) {
    Node n;
    n.id = r[o + 0];
    n.label = r[o + 1];
    n.type = parse_node_type(r[o + 2]).value_or(NodeType::Information);
    n.x = parse_double(r[o + 3]);
    n.y = parse_double(r[o + 4]);
    n.z_index = static_cast<int>(parse_int(r[o + 5]));
    n.mass = parse_double(r[o + 6]);
    n.category = parse_node_category(r[o + 7]).value_or(NodeCategory::Static);
    n.similarity_signature = r[o + 8];
    n.created_at = from_epoch_micros(parse_int(r[o + 9]));
    n.last_accessed = from_epoch_micros(parse_int(r[o + 10]));
    n.access_count = parse_int(r[o + 11]);
    n.cluster_id = static_cast<int>(parse_int(r[o + 12]));
    n.description = r[o + 13];
    n.metadata = parse_metadata(r[o + 14]);
    if (!r[o + 15].empty()) n.redirected_to = r[o + 15];
    int64_t decayed = parse_int(r[o + 16]);
    if (decayed >= 0) n.last_decay_applied_at = from_epoch_micros(decayed);
    n.version = static_cast<uint64_t>(parse_int(r[o + 17]));
    return n;
}

// $1..$17, in insert column order (version excluded)
std::vector<std::string> node_params(const Node& n) {
    return {
        n.id,
        n.label,
        to_string(n.type),
        fmt_double(n.x),
        fmt_double(n.y),
        std::to_string(n.z_index),
        fmt_double(n.mass),
        to_string(n.category),
        n.similarity_signature,
        micros(n.created_at),
        micros(n.last_accessed),
        std::to_string(n.access_count),
        std::to_string(n.cluster_id),
        n.description,
        dump_json(metadata_to_json(n.metadata)),
        n.redirected_to.value_or(""),
        n.last_decay_applied_at ? micros(*n.last_decay_applied_at) : std::string()
    };
}

std::string link_columns(const std::string& p) {
    return p + "link_id, " + p + "source_id, " + p + "target_id, " + p + "strength, " +
           p + "link_type, " + ts_out(p + "created_at") + ", " +
           "COALESCE(" + ts_out(p + "last_traversed") + ", -1), " +
           p + "traversal_count, " + p + "weight, " + p + "metadata::TEXT";
}

Link link_from_row(const PostgresConnection::Row& r, size_t o = 0) {
    Link l;
    l.id = r[o + 0];
    l.source_id = r[o + 1];
    l.target_id = r[o + 2];
    l.strength = parse_double(r[o + 3]);
    l.link_type = parse_link_type(r[o + 4]).value_or(LinkType::Semantic);
    l.created_at = from_epoch_micros(parse_int(r[o + 5]));
    int64_t traversed = parse_int(r[o + 6]);
    if (traversed >= 0) l.last_traversed = from_epoch_micros(traversed);
    l.traversal_count = parse_int(r[o + 7]);
    l.weight = parse_double(r[o + 8]);
    l.metadata = parse_metadata(r[o + 9]);
    return l;
}

const std::string k_log_columns =
    "sequence, action, target_id, source_id, params::TEXT, reason, triggered_by, session_id, "
    "success, error, error_kind, " + ts_out("created_at");

MutationLogEntry log_from_row(const PostgresConnection::Row& r) {
    MutationLogEntry e;
    e.sequence = static_cast<uint64_t>(parse_int(r[0]));
    auto action = parse_mutation_action(r[1]);
    if (!action) {
        throw StoreUnavailableError("unknown action in mutation log: " + r[1]);
    }
    e.action = *action;
    e.target_id = r[2];
    e.source_id = r[3];
    e.params = parse_json(r[4]);
    e.reason = r[5];
    e.triggered_by = r[6];
    e.session_id = r[7];
    e.success = r[8] == "t" || r[8] == "true";
    e.error = r[9];
    e.error_kind = r[10];
    e.timestamp = from_epoch_micros(parse_int(r[11]));
    return e;
}

void validate_node(const Node& node) {
    if (node.id.empty()) {
        throw ValidationError("node id must not be empty");
    }
    if (!std::isfinite(node.mass) || node.mass < kMinMass || node.mass > kMaxMass) {
        throw ValidationError("node mass out of range [1, 100]: " + std::to_string(node.mass));
    }
}

} // namespace

// ============================================================================
// PostgresGraphStore
// ============================================================================

PostgresGraphStore::PostgresGraphStore(const DatabaseConfig& config) : pool_(config) {}

void PostgresGraphStore::ensure_schema() {
    auto conn = pool_.acquire();
    PostgresConnection::Transaction tx(*conn);
    for (const char* ddl : k_schema) {
        conn->execute(ddl);
    }
    tx.commit();
    Logger::success("Schema ready: graph_nodes, graph_links, force_fields, neuroplasticity_log");
}

void PostgresGraphStore::clear() {
    auto conn = pool_.acquire();
    conn->execute("TRUNCATE neuroplasticity_log, graph_links, force_fields, graph_nodes");
    Logger::warn("All graph tables truncated");
}

std::optional<Node> PostgresGraphStore::select_node(PostgresConnection& conn, const NodeId& id) {
    std::optional<Node> out;
    conn.query("SELECT " + node_columns("") + " FROM graph_nodes WHERE node_id = $1", {id},
               [&](const PostgresConnection::Row& row) { out = node_from_row(row); });
    return out;
}

std::optional<Node> PostgresGraphStore::get_node(const NodeId& id) {
    auto conn = pool_.acquire();
    return select_node(*conn, id);
}

Node PostgresGraphStore::write_node(PostgresConnection& conn, const NodeWrite& write) {
    validate_node(write.node);
    auto params = node_params(write.node);

    std::optional<Node> out;
    auto collect = [&](const PostgresConnection::Row& row) { out = node_from_row(row); };

    if (!write.expected_version) {
        // A duplicate id surfaces as unique_violation, i.e. ConflictError
        conn.query(
            "INSERT INTO graph_nodes (node_id, label, node_type, x, y, z_index, mass, category, "
            "similarity_signature, created_at, last_accessed, access_count, cluster_id, description, "
            "metadata, redirected_to, last_decay_applied_at, version) VALUES ("
            "$1, $2, $3, $4::DOUBLE PRECISION, $5::DOUBLE PRECISION, $6::INTEGER, $7::DOUBLE PRECISION, "
            "$8, $9, " + ts_in(10) + ", " + ts_in(11) + ", $12::BIGINT, $13::INTEGER, $14, $15::JSONB, "
            "NULLIF($16, ''), " + ts_in_nullable(17) + ", 1) RETURNING " + node_columns(""),
            params, collect);
        if (!out) {
            throw StoreUnavailableError("insert of node " + write.node.id + " returned no row");
        }
        return *out;
    }

    params.push_back(std::to_string(*write.expected_version));
    conn.query(
        "UPDATE graph_nodes SET label = $2, node_type = $3, x = $4::DOUBLE PRECISION, "
        "y = $5::DOUBLE PRECISION, z_index = $6::INTEGER, mass = $7::DOUBLE PRECISION, category = $8, "
        "similarity_signature = $9, created_at = " + ts_in(10) + ", last_accessed = " + ts_in(11) + ", "
        "access_count = $12::BIGINT, cluster_id = $13::INTEGER, description = $14, metadata = $15::JSONB, "
        "redirected_to = NULLIF($16, ''), last_decay_applied_at = " + ts_in_nullable(17) + ", "
        "version = version + 1 "
        "WHERE node_id = $1 AND version = $18::BIGINT "
        "AND (redirected_to IS NULL OR redirected_to = NULLIF($16, '')) "
        "RETURNING " + node_columns(""),
        params, collect);

    if (out) return *out;

    // Zero rows: find out which guard failed
    auto current = select_node(conn, write.node.id);
    if (!current) {
        throw NotFoundError("node not found: " + write.node.id);
    }
    if (current->version != *write.expected_version) {
        throw ConflictError("version mismatch on node " + write.node.id + ": expected " +
                            std::to_string(*write.expected_version) + ", stored " +
                            std::to_string(current->version));
    }
    throw ValidationError("redirect of node " + write.node.id + " cannot be cleared or changed");
}

Node PostgresGraphStore::upsert_node(const Node& node, std::optional<uint64_t> expected_version) {
    auto conn = pool_.acquire();
    return write_node(*conn, NodeWrite{node, expected_version});
}

Node PostgresGraphStore::apply_mass_delta(const NodeId& id, const MassDelta& change) {
    if (!std::isfinite(change.delta)) {
        throw ValidationError("mass delta must be finite");
    }

    auto conn = pool_.acquire();
    PostgresConnection::Transaction tx(*conn);

    std::vector<std::string> params = {id, fmt_double(change.delta)};
    std::string sql =
        "UPDATE graph_nodes SET mass = LEAST(GREATEST(mass + $2::DOUBLE PRECISION, 1.0), 100.0), "
        "version = version + 1";
    if (change.touch_at) {
        params.push_back(micros(*change.touch_at));
        sql += ", last_accessed = " + ts_in(3) + ", access_count = access_count + 1";
    }
    sql += " WHERE node_id = $1 AND redirected_to IS NULL RETURNING " + node_columns("");

    std::optional<Node> out;
    conn->query(sql, params, [&](const PostgresConnection::Row& row) { out = node_from_row(row); });

    if (!out) {
        auto current = select_node(*conn, id);
        if (!current) {
            throw NotFoundError("node not found: " + id);
        }
        throw ValidationError("node " + id + " was merged into " + current->redirected_to.value_or("?"));
    }

    if (change.log) insert_log(*conn, *change.log);
    tx.commit();
    return *out;
}

bool PostgresGraphStore::touch_node(const NodeId& id, SystemTimePoint at) {
    auto conn = pool_.acquire();

    // SKIP LOCKED: a row held by a writer is skipped, never waited on
    size_t touched = conn->execute(
        "UPDATE graph_nodes SET last_accessed = " + ts_in(2) + ", "
        "access_count = access_count + 1, version = version + 1 "
        "WHERE node_id = (SELECT node_id FROM graph_nodes "
        "WHERE node_id = $1 AND redirected_to IS NULL FOR UPDATE SKIP LOCKED)",
        {id, micros(at)});
    return touched > 0;
}

std::vector<Node> PostgresGraphStore::find_by_label(const std::string& label) {
    auto conn = pool_.acquire();

    std::vector<Node> out;
    conn->query("SELECT " + node_columns("") + " FROM graph_nodes "
                "WHERE lower(label) = lower($1) AND redirected_to IS NULL "
                "ORDER BY created_at ASC, node_id ASC",
                {label}, [&](const PostgresConnection::Row& row) { out.push_back(node_from_row(row)); });
    return out;
}

std::vector<Node> PostgresGraphStore::scan_nodes(const NodeScan& scan) {
    std::vector<std::string> params;
    std::string where;
    auto add = [&](const std::string& clause) {
        where += where.empty() ? " WHERE " : " AND ";
        where += clause;
    };

    if (!scan.include_redirected) add("redirected_to IS NULL");
    if (scan.accessed_before) {
        params.push_back(micros(*scan.accessed_before));
        add("last_accessed < " + ts_in(params.size()));
    }
    if (scan.min_z_index) {
        params.push_back(std::to_string(*scan.min_z_index));
        add("z_index >= " + param(params.size()) + "::INTEGER");
    }
    if (scan.min_mass) {
        params.push_back(fmt_double(*scan.min_mass));
        add("mass >= " + param(params.size()) + "::DOUBLE PRECISION");
    }

    std::string order;
    switch (scan.order) {
        case NodeOrder::MassDesc:        order = " ORDER BY mass DESC, node_id ASC"; break;
        case NodeOrder::LastAccessedAsc: order = " ORDER BY last_accessed ASC, node_id ASC"; break;
        case NodeOrder::SignatureAsc:    order = " ORDER BY similarity_signature ASC, node_id ASC"; break;
    }

    std::string sql = "SELECT " + node_columns("") + " FROM graph_nodes" + where + order;
    if (scan.limit > 0) sql += " LIMIT " + std::to_string(scan.limit);

    auto conn = pool_.acquire();
    std::vector<Node> out;
    conn->query(sql, params, [&](const PostgresConnection::Row& row) { out.push_back(node_from_row(row)); });
    return out;
}

// ============================================================================
// Links
// ============================================================================

std::optional<Link> PostgresGraphStore::get_link(const LinkId& id) {
    auto conn = pool_.acquire();

    std::optional<Link> out;
    conn->query("SELECT " + link_columns("") + " FROM graph_links WHERE link_id = $1", {id},
                [&](const PostgresConnection::Row& row) { out = link_from_row(row); });
    return out;
}

std::vector<Link> PostgresGraphStore::list_links(const NodeId& node_id) {
    auto conn = pool_.acquire();

    std::vector<Link> out;
    conn->query("SELECT " + link_columns("") + " FROM graph_links "
                "WHERE source_id = $1 OR target_id = $1 ORDER BY link_id ASC",
                {node_id}, [&](const PostgresConnection::Row& row) { out.push_back(link_from_row(row)); });
    return out;
}

std::vector<Neighbor> PostgresGraphStore::list_neighbors(const NodeId& node_id, size_t max_neighbors) {
    auto conn = pool_.acquire();

    std::vector<Neighbor> candidates;
    conn->query(
        "SELECT " + link_columns("l.") + ", " + node_columns("n.") + " "
        "FROM graph_links l JOIN graph_nodes n ON n.node_id = "
        "CASE WHEN l.source_id = $1 THEN l.target_id ELSE l.source_id END "
        "WHERE (l.source_id = $1 OR l.target_id = $1) "
        "AND n.redirected_to IS NULL AND n.node_id <> $1",
        {node_id}, [&](const PostgresConnection::Row& row) {
            candidates.push_back({node_from_row(row, 10), link_from_row(row, 0)});
        });

    std::sort(candidates.begin(), candidates.end(), neighbor_before);

    std::vector<Neighbor> out;
    std::unordered_set<NodeId> seen;
    for (auto& n : candidates) {
        if (out.size() >= max_neighbors) break;
        if (!seen.insert(n.node.id).second) continue;
        out.push_back(std::move(n));
    }
    return out;
}

void PostgresGraphStore::write_link(PostgresConnection& conn, const Link& link) {
    if (link.source_id == link.target_id) {
        throw ValidationError("self-loop on node " + link.source_id);
    }
    if (!std::isfinite(link.strength) || link.strength < kMinStrength || link.strength > kMaxStrength) {
        throw ValidationError("link strength out of range [0, 1]: " + std::to_string(link.strength));
    }

    // FOR SHARE holds both endpoints against a concurrent merge until commit
    size_t live = 0;
    conn.query("SELECT node_id FROM graph_nodes WHERE node_id IN ($1, $2) "
               "AND redirected_to IS NULL FOR SHARE",
               {link.source_id, link.target_id},
               [&](const PostgresConnection::Row&) { ++live; });
    if (live != 2) {
        throw ValidationError("link " + link.id + " endpoint missing or merged away: " +
                              link.source_id + " -> " + link.target_id);
    }

    conn.execute(
        "INSERT INTO graph_links (link_id, source_id, target_id, strength, link_type, created_at, "
        "last_traversed, traversal_count, weight, metadata) VALUES ("
        "$1, $2, $3, $4::DOUBLE PRECISION, $5, " + ts_in(6) + ", " + ts_in_nullable(7) + ", "
        "$8::BIGINT, $9::DOUBLE PRECISION, $10::JSONB) "
        "ON CONFLICT (link_id) DO UPDATE SET source_id = EXCLUDED.source_id, "
        "target_id = EXCLUDED.target_id, strength = EXCLUDED.strength, link_type = EXCLUDED.link_type, "
        "created_at = EXCLUDED.created_at, last_traversed = EXCLUDED.last_traversed, "
        "traversal_count = EXCLUDED.traversal_count, weight = EXCLUDED.weight, "
        "metadata = EXCLUDED.metadata",
        {
            link.id,
            link.source_id,
            link.target_id,
            fmt_double(link.strength),
            to_string(link.link_type),
            micros(link.created_at),
            link.last_traversed ? micros(*link.last_traversed) : std::string(),
            std::to_string(link.traversal_count),
            fmt_double(link.weight),
            dump_json(metadata_to_json(link.metadata))
        });
}

// ============================================================================
// Batches
// ============================================================================

void PostgresGraphStore::commit(const WriteBatch& batch) {
    auto conn = pool_.acquire();
    PostgresConnection::Transaction tx(*conn);

    std::unordered_set<NodeId> written;
    for (const auto& write : batch.nodes) {
        if (!written.insert(write.node.id).second) {
            throw ValidationError("node written twice in one batch: " + write.node.id);
        }
        write_node(*conn, write);
    }

    for (const auto& link_id : batch.delete_links) {
        if (conn->execute("DELETE FROM graph_links WHERE link_id = $1", {link_id}) == 0) {
            throw NotFoundError("link not found: " + link_id);
        }
    }

    for (const auto& link : batch.upsert_links) {
        write_link(*conn, link);
    }

    // A node being redirected must not keep any incident link
    for (const auto& write : batch.nodes) {
        if (!write.node.redirected_to) continue;
        auto dangling = conn->query_single(
            "SELECT link_id FROM graph_links WHERE source_id = $1 OR target_id = $1 LIMIT 1",
            {write.node.id});
        if (dangling) {
            throw ValidationError("link " + *dangling + " still references merged node " + write.node.id);
        }
    }

    if (batch.log) insert_log(*conn, *batch.log);
    tx.commit();
}

// ============================================================================
// Audit log
// ============================================================================

uint64_t PostgresGraphStore::insert_log(PostgresConnection& conn, const MutationLogEntry& entry) {
    auto seq = conn.query_single(
        "INSERT INTO neuroplasticity_log (action, target_id, source_id, params, reason, triggered_by, "
        "session_id, success, error, error_kind, created_at) VALUES ("
        "$1, $2, $3, $4::JSONB, $5, $6, $7, $8::BOOLEAN, $9, $10, " + ts_in(11) + ") RETURNING sequence",
        {
            to_string(entry.action),
            entry.target_id,
            entry.source_id,
            dump_json(entry.params),
            entry.reason,
            entry.triggered_by,
            entry.session_id,
            entry.success ? "true" : "false",
            entry.error,
            entry.error_kind,
            micros(entry.timestamp)
        });
    if (!seq) {
        throw StoreUnavailableError("log insert returned no sequence");
    }
    return static_cast<uint64_t>(parse_int(*seq));
}

uint64_t PostgresGraphStore::append_log(const MutationLogEntry& entry) {
    auto conn = pool_.acquire();
    return insert_log(*conn, entry);
}

std::vector<MutationLogEntry> PostgresGraphStore::list_log(const LogFilter& filter) {
    std::vector<std::string> params;
    std::string where;
    auto add = [&](const std::string& clause) {
        where += where.empty() ? " WHERE " : " AND ";
        where += clause;
    };

    if (filter.node_id) {
        params.push_back(*filter.node_id);
        add("(target_id = " + param(params.size()) + " OR source_id = " + param(params.size()) + ")");
    }
    if (filter.action) {
        params.push_back(to_string(*filter.action));
        add("action = " + param(params.size()));
    }

    // With a limit, take the newest entries and hand them back oldest first
    std::string sql = "SELECT " + k_log_columns + " FROM neuroplasticity_log" + where;
    if (filter.limit > 0) {
        sql += " ORDER BY created_at DESC, sequence DESC LIMIT " + std::to_string(filter.limit);
    } else {
        sql += " ORDER BY created_at ASC, sequence ASC";
    }

    auto conn = pool_.acquire();
    std::vector<MutationLogEntry> out;
    conn->query(sql, params, [&](const PostgresConnection::Row& row) { out.push_back(log_from_row(row)); });

    if (filter.limit > 0) std::reverse(out.begin(), out.end());
    return out;
}

// ============================================================================
// Force fields
// ============================================================================

void PostgresGraphStore::upsert_force_field(const ForceField& field) {
    if (field.id.empty()) {
        throw ValidationError("force field id must not be empty");
    }

    auto conn = pool_.acquire();
    conn->execute(
        "INSERT INTO force_fields (field_id, label, x, y, radius, strength, signature, keywords, cluster_id) "
        "VALUES ($1, $2, $3::DOUBLE PRECISION, $4::DOUBLE PRECISION, $5::DOUBLE PRECISION, "
        "$6::DOUBLE PRECISION, $7, $8::JSONB, $9::INTEGER) "
        "ON CONFLICT (field_id) DO UPDATE SET label = EXCLUDED.label, x = EXCLUDED.x, y = EXCLUDED.y, "
        "radius = EXCLUDED.radius, strength = EXCLUDED.strength, signature = EXCLUDED.signature, "
        "keywords = EXCLUDED.keywords, cluster_id = EXCLUDED.cluster_id",
        {
            field.id,
            field.label,
            fmt_double(field.x),
            fmt_double(field.y),
            fmt_double(field.radius),
            fmt_double(field.strength),
            field.signature,
            dump_json(nlohmann::json(field.keywords)),
            std::to_string(field.cluster_id)
        });
}

std::vector<ForceField> PostgresGraphStore::list_force_fields() {
    auto conn = pool_.acquire();

    std::vector<ForceField> out;
    conn->query("SELECT field_id, label, x, y, radius, strength, signature, keywords::TEXT, cluster_id "
                "FROM force_fields ORDER BY field_id ASC",
                [&](const PostgresConnection::Row& r) {
                    ForceField f;
                    f.id = r[0];
                    f.label = r[1];
                    f.x = parse_double(r[2]);
                    f.y = parse_double(r[3]);
                    f.radius = parse_double(r[4]);
                    f.strength = parse_double(r[5]);
                    f.signature = r[6];
                    for (const auto& k : parse_json(r[7])) {
                        if (k.is_string()) f.keywords.push_back(k.get<std::string>());
                    }
                    f.cluster_id = static_cast<int>(parse_int(r[8]));
                    out.push_back(std::move(f));
                });
    return out;
}

StoreStats PostgresGraphStore::stats() {
    auto conn = pool_.acquire();

    StoreStats s;
    conn->query("SELECT (SELECT count(*) FROM graph_nodes), "
                "(SELECT count(*) FROM graph_nodes WHERE redirected_to IS NOT NULL), "
                "(SELECT count(*) FROM graph_links), "
                "(SELECT count(*) FROM force_fields), "
                "(SELECT count(*) FROM neuroplasticity_log)",
                [&](const PostgresConnection::Row& r) {
                    s.nodes = static_cast<size_t>(parse_int(r[0]));
                    s.redirected_nodes = static_cast<size_t>(parse_int(r[1]));
                    s.links = static_cast<size_t>(parse_int(r[2]));
                    s.force_fields = static_cast<size_t>(parse_int(r[3]));
                    s.log_entries = static_cast<size_t>(parse_int(r[4]));
                });
    return s;
}

} // namespace Databrain
