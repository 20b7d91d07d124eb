#include <gtest/gtest.h>
#include "compression/compression_engine.hpp"
#include "compression/error_suppression.hpp"
#include "config/config.hpp"
#include "graph/graph_store.hpp"
#include "log/log.hpp"
#include "persistence/memory_provider.hpp"
#include "persistence/persistence_manager.hpp"
#include "plasticity/hebbian_weights.hpp"
#include "synapse/synaptic_linker.hpp"

using namespace weave;

// ─── Full session lifecycle ────────────────────────────────────

TEST(EndToEndTest, SimilarNodesAreLinkedRetroactively) {
    GraphStore g("e2e");
    LinkerConfig config;
    config.threshold = 0.2;
    g.setSynapticLinker(std::make_shared<SynapticLinker>(config));

    Node a = g.addNode(makeConcept("TypeScript generics"));
    Node b = g.addNode(makeConcept("TypeScript generic types"));

    auto relates = g.queryEdgesByType(EdgeType::Relates);
    ASSERT_GE(relates.size(), 1u);
    const Edge& link = relates.front();
    EXPECT_EQ(link.source_id, b.id);
    EXPECT_EQ(link.target_id, a.id);
    EXPECT_EQ(link.metadata.at("synapse"), true);
}

TEST(EndToEndTest, SuppressedErrorIsNoLongerUncorrected) {
    GraphStore g("e2e");
    Node error = g.addNode(makeError("Segfault in tokenizer"));
    ASSERT_EQ(g.uncorrectedErrors().size(), 1u);

    g.suppressError(error.id, "fix", std::string("details"));

    EXPECT_EQ(g.getNode(error.id)->metadata.at("suppressed"), true);
    EXPECT_EQ(g.queryByType(NodeType::Correction).size(), 1u);
    EXPECT_EQ(g.queryEdgesByType(EdgeType::Corrects).size(), 1u);
    EXPECT_TRUE(ErrorSuppression::findUncorrectedErrors(g.allNodes(), g.allEdges()).empty());
}

TEST(EndToEndTest, ConfiguredSessionSurvivesPersistence) {
    WeaveConfig config = parseConfig({
        {"log_level", "warn"},
        {"linker", {{"threshold", 0.3}}},
        {"hebbian", {{"prune_threshold", 0.9}}},
        {"compression", {{"target_reduction", 0.5}}},
    });
    log::setLevel(config.log_level);

    GraphStore g("lifecycle", config.compression);
    g.setSynapticLinker(std::make_shared<SynapticLinker>(config.linker));
    auto hebbian = std::make_shared<HebbianWeights>(config.hebbian);
    g.setHebbianWeights(hebbian);

    Node cache = g.addNode(makeConcept("LRU cache eviction"));
    Node policy = g.addNode(makeDecision("cache eviction policy"));
    ASSERT_EQ(g.edgeCount(), 1u);
    Edge link = g.edgesFrom(policy.id).front();

    // Co-retrieval strengthens, decay weakens, prune removes what is left weak.
    g.queryByLabel("eviction");
    double strengthened = g.getEdge(link.id)->weight;
    EXPECT_NEAR(strengthened, link.weight + 0.1, 1e-12);

    hebbian->decay(g);
    EXPECT_NEAR(g.getEdge(link.id)->weight, strengthened * 0.99, 1e-12);
    EXPECT_EQ(hebbian->prune(g), 1u);
    EXPECT_EQ(g.edgeCount(), 0u);

    PersistenceManager manager(std::make_shared<MemoryProvider>());
    manager.saveGraph(g);
    GraphStore reloaded = manager.loadOrCreateGraph("lifecycle");
    EXPECT_EQ(reloaded.nodeCount(), 2u);
    EXPECT_NE(reloaded.getNode(cache.id), nullptr);

    CompressionEngine engine(config.compression);
    EXPECT_FALSE(reloaded.shouldCompress(engine));
    auto archived = reloaded.compress(engine);
    EXPECT_EQ(archived.size(), 1u);
    EXPECT_EQ(reloaded.nodeCount(), 1u);
    EXPECT_EQ(reloaded.restoreArchived(engine, archived), 1u);
    EXPECT_EQ(reloaded.nodeCount(), 2u);

    log::setLevel("info");
}
