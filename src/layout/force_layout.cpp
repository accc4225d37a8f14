#include <layout/force_layout.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <numbers>

namespace Databrain {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<ForceField> ForceLayout::match_field(std::string_view label, std::vector<ForceField> fields) {
    std::sort(fields.begin(), fields.end(),
              [](const ForceField& a, const ForceField& b) { return a.id < b.id; });

    std::string haystack = lowercase(label);
    for (auto& field : fields) {
        for (const auto& keyword : field.keywords) {
            if (keyword.empty()) continue;
            if (haystack.find(lowercase(keyword)) != std::string::npos) {
                return std::move(field);
            }
        }
    }
    return std::nullopt;
}

std::pair<double, double> ForceLayout::unit_pair(std::string_view key) {
    auto hash = BLAKE3Pipeline::hash(key);

    uint64_t a = 0;
    uint64_t b = 0;
    std::memcpy(&a, hash.data(), sizeof(a));
    std::memcpy(&b, hash.data() + sizeof(a), sizeof(b));

    // 53 bits of mantissa
    constexpr double scale = 1.0 / 9007199254740992.0;
    return {static_cast<double>(a >> 11) * scale, static_cast<double>(b >> 11) * scale};
}

Placement ForceLayout::place(std::string_view label, std::string_view key,
                             const std::vector<ForceField>& fields) const {
    auto [u, v] = unit_pair(key);
    double angle = 2.0 * std::numbers::pi * u;
    Vec2 direction(std::cos(angle), std::sin(angle));

    Placement out;
    if (auto field = match_field(label, fields)) {
        // sqrt keeps the seeding uniform over the disc
        double r = field->radius * config_.field_fill * std::sqrt(v);
        out.cluster_id = field->cluster_id;
        out.field_id = field->id;
        out.position = Vec2(field->x, field->y) + r * direction;
        return out;
    }

    double r = config_.unclustered_ring_radius * (1.0 + config_.ring_jitter * v);
    out.position = r * direction;
    return out;
}

ForceLayout::Vec2 ForceLayout::weighted_centroid(const Vec2& a, double mass_a, const Vec2& b, double mass_b) {
    double total = mass_a + mass_b;
    if (total <= 1e-12) {
        return a;
    }
    return (a * mass_a + b * mass_b) / total;
}

std::vector<ForceField> ForceLayout::default_fields() {
    auto field = [](std::string id, std::string label, double x, double y, int cluster,
                    std::vector<std::string> keywords) {
        ForceField f;
        f.id = std::move(id);
        f.label = std::move(label);
        f.x = x;
        f.y = y;
        f.radius = 150.0;
        f.strength = 0.5;
        f.keywords = std::move(keywords);
        f.cluster_id = cluster;
        return f;
    };

    return {
        field("risk", "Risk & Fraud Detection", 240, 640, 1,
              {"risk", "fraud", "attack", "alert", "danger", "warning", "threat", "security", "breach"}),
        field("compliance", "Compliance & Legal", 960, 640, 2,
              {"audit", "legal", "compliance", "regulation", "policy", "law", "gdpr", "contract"}),
        field("innovation", "Innovation & Research", 600, 200, 3,
              {"innovation", "research", "experiment", "patent", "discovery", "invention", "prototype"}),
        field("finance", "Financial Operations", 240, 200, 4,
              {"revenue", "cost", "profit", "budget", "invoice", "payment", "financial", "accounting"}),
        field("customer", "Customer Success", 960, 200, 5,
              {"customer", "client", "support", "satisfaction", "feedback", "retention", "churn"}),
    };
}

} // namespace Databrain
