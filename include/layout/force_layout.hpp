/**
 * @file force_layout.hpp
 * @brief Force-field membership and 2-D seeding of node positions
 *
 * Positions are advisory (visualization only). Everything here is
 * deterministic: the same label, key and field set always give the same
 * placement.
 */

#pragma once

#include <core/types.hpp>
#include <Eigen/Core>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Databrain {

struct ForceLayoutConfig {
    double unclustered_ring_radius = 500.0;  // nodes outside every field
    double ring_jitter = 0.25;               // fraction of the ring radius
    double field_fill = 0.9;                 // fraction of a field's radius used for seeding
};

struct Placement {
    int cluster_id = 0;
    std::optional<std::string> field_id;
    Eigen::Vector2d position = Eigen::Vector2d::Zero();
};

class ForceLayout {
public:
    using Vec2 = Eigen::Vector2d;

    explicit ForceLayout(const ForceLayoutConfig& config = ForceLayoutConfig()) : config_(config) {}

    /**
     * @brief First field, by id, with a keyword occurring in the label
     * (case-insensitive substring match).
     */
    static std::optional<ForceField> match_field(std::string_view label, std::vector<ForceField> fields);

    /**
     * @brief Field membership plus a seeded position for a new node.
     * @param key Stable per-node key (the node id) that picks the offset
     */
    Placement place(std::string_view label, std::string_view key, const std::vector<ForceField>& fields) const;

    /**
     * @brief Mass-weighted centroid of two positions (used when merging).
     */
    static Vec2 weighted_centroid(const Vec2& a, double mass_a, const Vec2& b, double mass_b);

    /**
     * @brief Seed fields for a fresh brain
     */
    static std::vector<ForceField> default_fields();

private:
    // Two uniform values in [0, 1) derived from the key
    static std::pair<double, double> unit_pair(std::string_view key);

    ForceLayoutConfig config_;
};

} // namespace Databrain
