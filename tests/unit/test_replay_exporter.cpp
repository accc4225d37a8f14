/**
 * @file test_replay_exporter.cpp
 * @brief Unit tests for replay sample selection, phrasing and determinism
 */

#include <gtest/gtest.h>
#include <replay/replay_exporter.hpp>
#include <store/memory_graph_store.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace Databrain;

namespace {

const SystemTimePoint T0 = make_utc_time(2026, 10, 1);

Node make_node(const std::string& id, const std::string& label, NodeType type, double mass,
               int64_t access_count, const std::string& description = "") {
    Node node;
    node.id = id;
    node.label = label;
    node.type = type;
    node.z_index = canonical_z_index(type);
    node.mass = mass;
    node.access_count = access_count;
    node.description = description;
    node.created_at = T0;
    node.last_accessed = T0;
    return node;
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

class ReplayExporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.upsert_node(make_node("w", "Pricing Strategy", NodeType::Wisdom, 80.0, 10,
                                    "Value-based pricing beats cost-plus"), std::nullopt);
        store.upsert_node(make_node("k", "API Rate Limiting", NodeType::Knowledge, 60.0, 6,
                                    "Token bucket per tenant"), std::nullopt);
        store.upsert_node(make_node("i", "Churn Signals", NodeType::Information, 90.0, 20), std::nullopt);
        store.upsert_node(make_node("light", "Minor Note", NodeType::Knowledge, 40.0, 50), std::nullopt);
        store.upsert_node(make_node("rare", "Rare Insight", NodeType::Knowledge, 70.0, 2), std::nullopt);

        Node gone = make_node("gone", "Merged Away", NodeType::Knowledge, 95.0, 30);
        gone.redirected_to = "w";
        store.upsert_node(gone, std::nullopt);

        WriteBatch links;
        links.upsert_links.push_back(make_link("l1", "w", "k", 0.9));
        links.upsert_links.push_back(make_link("l2", "i", "w", 0.5));
        store.commit(links);
    }

    static Link make_link(const std::string& id, const std::string& src, const std::string& dst, double strength) {
        Link link;
        link.id = id;
        link.source_id = src;
        link.target_id = dst;
        link.strength = strength;
        link.created_at = T0;
        return link;
    }

    MemoryGraphStore store;
};

} // namespace

TEST_F(ReplayExporterTest, SelectionHonorsLayerMassAccessAndRedirects) {
    ReplayExporter exporter(store);
    auto nodes = exporter.select_nodes();

    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].id, "w");
    EXPECT_EQ(nodes[1].id, "k");

    ReplayConfig capped;
    capped.max_nodes = 1;
    ReplayExporter small(store, capped);
    ASSERT_EQ(small.select_nodes().size(), 1u);
    EXPECT_EQ(small.select_nodes()[0].id, "w");
}

TEST_F(ReplayExporterTest, GeneralProfileSamples) {
    ReplayExporter exporter(store);
    auto samples = exporter.build_samples("general");

    // w: recall, relational, strategic; k: recall, relational
    ASSERT_EQ(samples.size(), 5u);

    EXPECT_EQ(samples[0].instruction, "Explain the strategic context of 'Pricing Strategy'.");
    EXPECT_EQ(samples[0].input, "");
    EXPECT_EQ(samples[0].output, "Value-based pricing beats cost-plus");
    EXPECT_EQ(samples[0].layer, "Wisdom");
    EXPECT_DOUBLE_EQ(samples[0].confidence, 0.8);
    EXPECT_EQ(samples[0].profile, "general");
    EXPECT_EQ(samples[0].source_node_ids, std::vector<NodeId>{"w"});

    EXPECT_EQ(samples[1].instruction, "Identify the key factors influencing 'Pricing Strategy'.");
    EXPECT_NE(samples[1].output.find("linked to: API Rate Limiting, Churn Signals."), std::string::npos);
    EXPECT_NE(samples[1].output.find("confidence score of 0.80"), std::string::npos);
    EXPECT_EQ(samples[1].source_node_ids, (std::vector<NodeId>{"w", "k", "i"}));

    EXPECT_EQ(samples[2].instruction, "Provide strategic analysis of 'Pricing Strategy'.");
    EXPECT_NE(samples[2].output.find("analysis of 2 related factors"), std::string::npos);
    EXPECT_NE(samples[2].output.find("validated with 80% confidence"), std::string::npos);

    EXPECT_EQ(samples[3].layer, "Knowledge");
    EXPECT_EQ(samples[4].source_node_ids, (std::vector<NodeId>{"k", "w"}));

    for (const auto& s : samples) {
        EXPECT_EQ(s.export_batch, samples[0].export_batch);
    }
}

TEST_F(ReplayExporterTest, CoderProfileSpecializesOnCodeKeywords) {
    ReplayExporter exporter(store);
    auto samples = exporter.build_samples("coder");

    ASSERT_EQ(samples.size(), 5u);
    size_t guidance = 0;
    for (const auto& s : samples) {
        EXPECT_EQ(s.instruction.find("Provide strategic analysis"), std::string::npos);
        if (s.instruction == "Generate implementation guidance for 'API Rate Limiting'.") {
            ++guidance;
            EXPECT_EQ(s.input, "Provide code-specific recommendations.");
            EXPECT_NE(s.output.find("Key dependencies include: Pricing Strategy."), std::string::npos);
        }
    }
    EXPECT_EQ(guidance, 1u);
}

TEST_F(ReplayExporterTest, OutputIsDeterministic) {
    ReplayExporter exporter(store);

    std::ostringstream first;
    std::ostringstream second;
    ReplayRunReport a = exporter.run("general", first);
    ReplayRunReport b = exporter.run("general", second);

    EXPECT_EQ(first.str(), second.str());
    EXPECT_EQ(a.export_batch, b.export_batch);
    EXPECT_EQ(a.samples_written, 5u);
    EXPECT_EQ(a.errors, 0u);
    EXPECT_EQ(a.export_batch, ReplayExporter::export_batch("general", exporter.select_nodes()));

    // A fresh exporter over the same snapshot gives the same bytes
    ReplayExporter other(store);
    std::ostringstream third;
    other.run("general", third);
    EXPECT_EQ(first.str(), third.str());

    // Profiles are part of the fingerprint
    EXPECT_NE(ReplayExporter::export_batch("coder", exporter.select_nodes()), a.export_batch);
}

TEST_F(ReplayExporterTest, BatchChangesWhenASelectedNodeChanges) {
    ReplayExporter exporter(store);
    std::string before = ReplayExporter::export_batch("general", exporter.select_nodes());

    store.touch_node("k", T0 + std::chrono::hours(1));
    std::string after = ReplayExporter::export_batch("general", exporter.select_nodes());
    EXPECT_NE(before, after);
}

TEST_F(ReplayExporterTest, NdjsonLinesCarryTheProfile) {
    ReplayExporter exporter(store);
    std::ostringstream out;
    ReplayRunReport report = exporter.run("coder", out);

    auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), report.samples_written);
    for (const auto& line : lines) {
        nlohmann::json j = nlohmann::json::parse(line);
        EXPECT_EQ(j["target_profile"], "coder");
        EXPECT_EQ(j["export_batch"], report.export_batch);
        EXPECT_TRUE(j.contains("instruction"));
        EXPECT_TRUE(j.contains("source_node_ids"));
    }
}

TEST_F(ReplayExporterTest, InvalidUtf8InStoredTextIsReplaced) {
    // Written straight to the store, around the engine's validation
    store.upsert_node(make_node("bad", "Bad \xFF label knowledge", NodeType::Wisdom, 90.0, 10,
                                "trailing \xE2\x82"), std::nullopt);

    ReplayExporter exporter(store);
    std::ostringstream out;
    ReplayRunReport report;
    ASSERT_NO_THROW(report = exporter.run("general", out));

    auto lines = lines_of(out.str());
    ASSERT_EQ(lines.size(), report.samples_written);

    bool saw_bad = false;
    for (const auto& line : lines) {
        nlohmann::json j = nlohmann::json::parse(line);
        for (const auto& id : j["source_node_ids"]) {
            if (id == "bad") saw_bad = true;
        }
        if (line.find("Bad ") != std::string::npos) {
            EXPECT_NE(line.find("Bad \xEF\xBF\xBD label"), std::string::npos);
        }
    }
    EXPECT_TRUE(saw_bad);
}

TEST_F(ReplayExporterTest, WritesProfileFile) {
    auto dir = std::filesystem::temp_directory_path() / "databrain_replay_test";
    std::filesystem::remove_all(dir);

    ReplayConfig config;
    config.output_dir = dir.string();
    ReplayExporter exporter(store, config);

    ReplayRunReport report = exporter.run("general");
    std::filesystem::path path = dir / "general_cortex_evolution.jsonl";
    EXPECT_EQ(report.path, path.string());
    ASSERT_TRUE(std::filesystem::exists(path));

    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(lines_of(content.str()).size(), report.samples_written);

    std::filesystem::remove_all(dir);
}

TEST_F(ReplayExporterTest, Profiles) {
    ReplayExporter exporter(store);
    EXPECT_EQ(exporter.profile_names(), (std::vector<std::string>{"coder", "general"}));
    EXPECT_THROW(exporter.profile("nonexistent"), NotFoundError);
    EXPECT_THROW(exporter.build_samples("nonexistent"), NotFoundError);
    EXPECT_THROW(exporter.register_profile(ReplayProfile{}), ValidationError);

    exporter.register_profile({"analyst", {"PRICING"}, false});
    auto samples = exporter.build_samples("analyst");
    size_t guidance = 0;
    for (const auto& s : samples) {
        if (s.instruction == "Generate implementation guidance for 'Pricing Strategy'.") ++guidance;
        EXPECT_EQ(s.profile, "analyst");
    }
    EXPECT_EQ(guidance, 1u);
}

TEST_F(ReplayExporterTest, EmptyGraphExportsNothing) {
    MemoryGraphStore empty;
    ReplayExporter exporter(empty);

    std::ostringstream out;
    ReplayRunReport report = exporter.run("general", out);
    EXPECT_EQ(report.nodes_selected, 0u);
    EXPECT_EQ(report.samples_written, 0u);
    EXPECT_TRUE(out.str().empty());
}
