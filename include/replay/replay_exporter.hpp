/**
 * @file replay_exporter.hpp
 * @brief Training-sample export of high-confidence graph knowledge
 */

#pragma once

#include <store/graph_store.hpp>
#include <config/brain_config.hpp>
#include <nlohmann/json.hpp>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace Databrain {

/**
 * @brief How samples are phrased for one downstream model.
 *
 * specialization_keywords: a label containing any of them (case-insensitive)
 * earns an implementation-guidance sample. strategic: wisdom nodes earn a
 * strategic-analysis sample.
 */
struct ReplayProfile {
    std::string name;
    std::vector<std::string> specialization_keywords;
    bool strategic = false;
};

struct ReplayRunReport {
    std::string profile;
    std::string export_batch;
    std::string path;            // empty when written to a caller's stream
    size_t nodes_selected = 0;
    size_t samples_written = 0;
    size_t errors = 0;
    double elapsed_ms = 0.0;

    nlohmann::json to_json() const;
};

/**
 * @brief Read-only exporter. Same graph snapshot + same profile = same bytes.
 *
 * Nodes qualify when they sit in the knowledge or wisdom layer, are live,
 * and clear both the mass and access-count thresholds. Selection order is
 * mass desc, access_count desc, id asc.
 */
class ReplayExporter {
public:
    explicit ReplayExporter(GraphStore& store, ReplayConfig config = ReplayConfig());

    /**
     * @brief Add or replace a profile by name
     * @throws ValidationError on an empty name
     */
    void register_profile(ReplayProfile profile);

    /**
     * @throws NotFoundError for an unregistered name
     */
    const ReplayProfile& profile(const std::string& name) const;

    std::vector<std::string> profile_names() const;

    std::vector<Node> select_nodes();

    std::vector<ReplaySample> build_samples(const std::string& profile_name);

    /**
     * @brief Export one profile as NDJSON to a stream
     */
    ReplayRunReport run(const std::string& profile_name, std::ostream& out);

    /**
     * @brief Export one profile to <output_dir>/<profile>_cortex_evolution.jsonl
     */
    ReplayRunReport run(const std::string& profile_name);

    /**
     * @brief `general` (strategic) and `coder` (code keywords)
     */
    static std::vector<ReplayProfile> builtin_profiles();

    /**
     * @brief BLAKE3 fingerprint of the profile and the selected (id, version) list
     */
    static std::string export_batch(const std::string& profile_name, const std::vector<Node>& nodes);

    const ReplayConfig& config() const { return config_; }

private:
    struct BuildResult {
        std::vector<ReplaySample> samples;
        std::string export_batch;
        size_t nodes_selected = 0;
        size_t errors = 0;
    };

    BuildResult build(const ReplayProfile& profile);

    std::vector<Neighbor> neighbors_of(const Node& node);

    static void samples_for(const Node& node, const std::vector<Neighbor>& neighbors,
                            const ReplayProfile& profile, const std::string& batch,
                            std::vector<ReplaySample>& out);

    GraphStore& store_;
    ReplayConfig config_;
    std::map<std::string, ReplayProfile> profiles_;
};

} // namespace Databrain
