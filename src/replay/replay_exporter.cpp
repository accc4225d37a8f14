#include <replay/replay_exporter.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Databrain {

namespace {

constexpr int kKnowledgeFloor = 200;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string fixed2(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return ss.str();
}

std::string join_labels(const std::vector<Neighbor>& neighbors) {
    std::string out;
    for (const auto& n : neighbors) {
        if (!out.empty()) out += ", ";
        out += n.node.label;
    }
    return out;
}

ReplaySample make_sample(const Node& node, const ReplayProfile& profile, const std::string& batch) {
    ReplaySample s;
    s.source_node_ids.push_back(node.id);
    s.layer = to_string(node.layer());
    s.confidence = node.mass / kMaxMass;
    s.export_batch = batch;
    s.profile = profile.name;
    return s;
}

} // namespace

nlohmann::json ReplayRunReport::to_json() const {
    return {
        {"profile", profile},
        {"export_batch", export_batch},
        {"path", path},
        {"nodes_selected", nodes_selected},
        {"samples_written", samples_written},
        {"errors", errors},
        {"elapsed_ms", elapsed_ms}
    };
}

ReplayExporter::ReplayExporter(GraphStore& store, ReplayConfig config)
    : store_(store), config_(std::move(config)) {
    for (auto& p : builtin_profiles()) {
        register_profile(std::move(p));
    }
}

std::vector<ReplayProfile> ReplayExporter::builtin_profiles() {
    return {
        {"coder", {"code", "api", "function", "class", "implementation"}, false},
        {"general", {}, true}
    };
}

void ReplayExporter::register_profile(ReplayProfile profile) {
    if (profile.name.empty()) {
        throw ValidationError("Replay profile name must not be empty");
    }
    for (auto& kw : profile.specialization_keywords) {
        kw = lowercase(kw);
    }
    std::string name = profile.name;
    profiles_[name] = std::move(profile);
}

const ReplayProfile& ReplayExporter::profile(const std::string& name) const {
    auto it = profiles_.find(name);
    if (it == profiles_.end()) {
        throw NotFoundError("Unknown replay profile: " + name);
    }
    return it->second;
}

std::vector<std::string> ReplayExporter::profile_names() const {
    std::vector<std::string> names;
    names.reserve(profiles_.size());
    for (const auto& [name, _] : profiles_) names.push_back(name);
    return names;
}

std::vector<Node> ReplayExporter::select_nodes() {
    NodeScan scan;
    scan.order = NodeOrder::MassDesc;
    scan.min_z_index = kKnowledgeFloor;
    scan.min_mass = config_.min_mass;

    std::vector<Node> selected;
    for (auto& node : store_.scan_nodes(scan)) {
        if (node.is_redirected()) continue;
        if (node.layer() != Layer::Knowledge && node.layer() != Layer::Wisdom) continue;
        if (node.mass < config_.min_mass) continue;
        if (node.access_count < config_.min_access_count) continue;
        selected.push_back(std::move(node));
    }

    std::sort(selected.begin(), selected.end(), [](const Node& a, const Node& b) {
        if (a.mass != b.mass) return a.mass > b.mass;
        if (a.access_count != b.access_count) return a.access_count > b.access_count;
        return a.id < b.id;
    });

    if (config_.max_nodes > 0 && selected.size() > config_.max_nodes) {
        selected.resize(config_.max_nodes);
    }
    return selected;
}

std::string ReplayExporter::export_batch(const std::string& profile_name, const std::vector<Node>& nodes) {
    std::vector<std::string> fields;
    fields.reserve(1 + nodes.size() * 2);
    fields.push_back(profile_name);
    for (const auto& node : nodes) {
        fields.push_back(node.id);
        fields.push_back(std::to_string(node.version));
    }
    return BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash_fields(fields));
}

std::vector<Neighbor> ReplayExporter::neighbors_of(const Node& node) {
    auto neighbors = store_.list_neighbors(node.id, config_.max_neighbors);
    std::sort(neighbors.begin(), neighbors.end(), [](const Neighbor& a, const Neighbor& b) {
        if (a.link.strength != b.link.strength) return a.link.strength > b.link.strength;
        if (a.node.label != b.node.label) return a.node.label < b.node.label;
        return a.node.id < b.node.id;
    });
    return neighbors;
}

void ReplayExporter::samples_for(const Node& node, const std::vector<Neighbor>& neighbors,
                                 const ReplayProfile& profile, const std::string& batch,
                                 std::vector<ReplaySample>& out) {
    const std::string quoted = "'" + node.label + "'";
    const double confidence = node.mass / kMaxMass;
    const std::string neighbor_list = join_labels(neighbors);

    // Direct recall needs something to recall
    if (!node.description.empty()) {
        ReplaySample s = make_sample(node, profile, batch);
        s.instruction = "Explain the strategic context of " + quoted + ".";
        s.output = node.description;
        out.push_back(std::move(s));
    }

    if (!neighbors.empty()) {
        ReplaySample s = make_sample(node, profile, batch);
        s.instruction = "Identify the key factors influencing " + quoted + ".";
        s.input = "Use the internal Knowledge Graph relationships.";
        s.output = "The concept " + quoted + " is fundamentally linked to: " + neighbor_list +
                   ". These factors should be analyzed concurrently when reasoning about " + quoted +
                   ". This relationship has a confidence score of " + fixed2(confidence) + ".";
        for (const auto& n : neighbors) s.source_node_ids.push_back(n.node.id);
        out.push_back(std::move(s));
    }

    if (!profile.specialization_keywords.empty()) {
        const std::string label = lowercase(node.label);
        bool matches = std::any_of(profile.specialization_keywords.begin(), profile.specialization_keywords.end(),
                                   [&](const std::string& kw) { return !kw.empty() && label.find(kw) != std::string::npos; });
        if (matches) {
            ReplaySample s = make_sample(node, profile, batch);
            s.instruction = "Generate implementation guidance for " + quoted + ".";
            s.input = "Provide code-specific recommendations.";
            s.output = "When implementing features related to " + quoted +
                       ", consider the following context: " + node.description +
                       ". Key dependencies include: " +
                       (neighbors.empty() ? std::string("none identified") : neighbor_list) + ".";
            out.push_back(std::move(s));
        }
    }

    if (profile.strategic && node.layer() == Layer::Wisdom) {
        ReplaySample s = make_sample(node, profile, batch);
        s.instruction = "Provide strategic analysis of " + quoted + ".";
        s.input = "Frame this as executive-level strategic insight.";
        s.output = "From a strategic perspective, " + quoted + " represents: " + node.description +
                   ". This insight was derived from analysis of " + std::to_string(neighbors.size()) +
                   " related factors and has been validated with " +
                   std::to_string(static_cast<int>(std::lround(confidence * 100.0))) + "% confidence.";
        for (const auto& n : neighbors) s.source_node_ids.push_back(n.node.id);
        out.push_back(std::move(s));
    }
}

ReplayExporter::BuildResult ReplayExporter::build(const ReplayProfile& profile) {
    BuildResult result;

    std::vector<Node> nodes = select_nodes();
    result.nodes_selected = nodes.size();
    result.export_batch = export_batch(profile.name, nodes);

    for (const auto& node : nodes) {
        try {
            samples_for(node, neighbors_of(node), profile, result.export_batch, result.samples);
        } catch (const BrainError& e) {
            ++result.errors;
            Logger::warn("Replay of " + node.id + " failed: " + e.what());
        }
    }
    return result;
}

std::vector<ReplaySample> ReplayExporter::build_samples(const std::string& profile_name) {
    return build(profile(profile_name)).samples;
}

ReplayRunReport ReplayExporter::run(const std::string& profile_name, std::ostream& out) {
    Timer timer;
    const ReplayProfile& p = profile(profile_name);

    Logger::step("Replay export for profile '" + p.name + "'");
    BuildResult built = build(p);

    ReplayRunReport report;
    report.profile = p.name;
    report.export_batch = built.export_batch;
    report.nodes_selected = built.nodes_selected;
    report.errors = built.errors;

    for (const auto& sample : built.samples) {
        // Stored text is not guaranteed to be UTF-8; bad bytes become U+FFFD
        out << nlohmann::json(sample).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
        if (!out) {
            throw std::runtime_error("Replay output stream failed after " +
                                     std::to_string(report.samples_written) + " samples");
        }
        ++report.samples_written;
    }
    out.flush();

    report.elapsed_ms = timer.elapsed_ms();
    Logger::success("Replay '" + p.name + "': " + std::to_string(report.samples_written) + " samples from " +
                    std::to_string(report.nodes_selected) + " nodes, " + std::to_string(report.errors) +
                    " errors (batch " + report.export_batch + ")");
    return report;
}

ReplayRunReport ReplayExporter::run(const std::string& profile_name) {
    const ReplayProfile& p = profile(profile_name);

    std::filesystem::path dir(config_.output_dir);
    std::filesystem::create_directories(dir);
    std::filesystem::path path = dir / (p.name + "_cortex_evolution.jsonl");

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot open replay output: " + path.string());
    }

    ReplayRunReport report = run(p.name, file);
    report.path = path.string();
    return report;
}

} // namespace Databrain
