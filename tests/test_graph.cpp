#include <gtest/gtest.h>
#include "graph/errors.hpp"
#include "graph/graph_store.hpp"
#include "plasticity/hebbian_weights.hpp"
#include "synapse/synaptic_linker.hpp"

#include <thread>

using namespace weave;

// ─── Enum names ────────────────────────────────────────────────

TEST(GraphTypesTest, NodeTypeNames) {
    EXPECT_EQ(toString(NodeType::CodeEntity), "CODE_ENTITY");
    EXPECT_EQ(parseNodeType("ERROR"), NodeType::Error);
    EXPECT_THROW(parseNodeType("error"), WeaveError);
}

TEST(GraphTypesTest, EdgeTypeNames) {
    EXPECT_EQ(toString(EdgeType::DependsOn), "DEPENDS_ON");
    EXPECT_EQ(parseEdgeType("CORRECTS"), EdgeType::Corrects);
    EXPECT_THROW(parseEdgeType("LINKS"), WeaveError);
}

TEST(GraphTypesTest, FactoriesFillDefaults) {
    Node n = makeDecision("Use sqlite", std::string("embedded, zero config"));
    EXPECT_EQ(n.type, NodeType::Decision);
    EXPECT_EQ(n.frequency, 1u);
    EXPECT_EQ(n.id.size(), 36u);
    EXPECT_EQ(n.id[14], '4');
    EXPECT_TRUE(n.metadata.is_object());
    EXPECT_EQ(n.created_at, n.updated_at);
    EXPECT_EQ(n.text(), "Use sqlite embedded, zero config");

    Edge e = makeCauses("a", "b");
    EXPECT_EQ(e.type, EdgeType::Causes);
    EXPECT_DOUBLE_EQ(e.weight, 1.0);
    EXPECT_NE(e.id, n.id);
}

// ─── Basic Node/Edge CRUD ──────────────────────────────────────

TEST(GraphStoreTest, AddAndGetNode) {
    GraphStore g("chat-1");
    Node n = g.addNode(makeConcept("Dependency injection"));
    ASSERT_EQ(g.nodeCount(), 1u);

    const Node* stored = g.getNode(n.id);
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->label, "Dependency injection");
    EXPECT_EQ(stored->type, NodeType::Concept);
    EXPECT_EQ(g.getNode("missing"), nullptr);
}

TEST(GraphStoreTest, DuplicateNodeIdRejected) {
    GraphStore g("chat-1");
    Node n = g.addNode(makeConcept("a"));
    EXPECT_THROW(g.addNode(n), PolicyViolationError);
    EXPECT_EQ(g.nodeCount(), 1u);
}

TEST(GraphStoreTest, RejectsThresholdOutsideUnitInterval) {
    EXPECT_THROW(GraphStore("c", 0.0), WeaveError);
    EXPECT_THROW(GraphStore("c", 1.5), WeaveError);
    EXPECT_NO_THROW(GraphStore("c", 1.0));
}

TEST(GraphStoreTest, UpdateNode) {
    GraphStore g("chat-1");
    Node n = g.addNode(makeConcept("old label"));

    NodePatch patch;
    patch.label = "New Label";
    patch.description = "now described";
    auto updated = g.updateNode(n.id, patch);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->label, "New Label");
    EXPECT_EQ(*updated->description, "now described");
    EXPECT_EQ(updated->id, n.id);
    EXPECT_GE(updated->updated_at, n.updated_at);

    EXPECT_FALSE(g.updateNode("missing", patch).has_value());
}

TEST(GraphStoreTest, UpdateNodeReindexesLabelAndType) {
    GraphStore g("chat-1");
    Node n = g.addNode(makeConcept("alpha"));

    NodePatch patch;
    patch.label = "beta";
    patch.type = NodeType::Milestone;
    g.updateNode(n.id, patch);

    EXPECT_TRUE(g.queryByLabel("alpha").empty());
    ASSERT_EQ(g.queryByLabel("beta").size(), 1u);
    EXPECT_TRUE(g.queryByType(NodeType::Concept).empty());
    EXPECT_EQ(g.queryByType(NodeType::Milestone).size(), 1u);
}

TEST(GraphStoreTest, IncrementFrequency) {
    GraphStore g("chat-1");
    Node n = g.addNode(makeConcept("a"));
    g.incrementFrequency(n.id);
    auto bumped = g.incrementFrequency(n.id);
    ASSERT_TRUE(bumped.has_value());
    EXPECT_EQ(bumped->frequency, 3u);
    EXPECT_FALSE(g.incrementFrequency("missing").has_value());
}

TEST(GraphStoreTest, DeleteNodeCascadesEdges) {
    GraphStore g("chat-1");
    Node a = g.addNode(makeConcept("a"));
    Node b = g.addNode(makeConcept("b"));
    Node c = g.addNode(makeConcept("c"));
    g.addEdge(makeRelates(a.id, b.id));
    g.addEdge(makeRelates(c.id, a.id));
    Edge keep = g.addEdge(makeRelates(b.id, c.id));
    g.addEdge(makeRelates(a.id, a.id));  // self-loop

    ASSERT_TRUE(g.deleteNode(a.id));
    EXPECT_EQ(g.nodeCount(), 2u);
    EXPECT_EQ(g.edgeCount(), 1u);
    EXPECT_NE(g.getEdge(keep.id), nullptr);
    EXPECT_TRUE(g.edgesFrom(c.id).empty());
    EXPECT_TRUE(g.edgesTo(b.id).empty());
    EXPECT_FALSE(g.deleteNode(a.id));  // already removed
}

TEST(GraphStoreTest, AddAndGetEdge) {
    GraphStore g("chat-1");
    Node a = g.addNode(makeConcept("a"));
    Node b = g.addNode(makeConcept("b"));
    Edge e = g.addEdge(makeEdge(a.id, b.id, EdgeType::Implements, 0.5));

    const Edge* stored = g.getEdge(e.id);
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->source_id, a.id);
    EXPECT_EQ(stored->target_id, b.id);
    EXPECT_EQ(stored->type, EdgeType::Implements);
    EXPECT_DOUBLE_EQ(stored->weight, 0.5);
}

TEST(GraphStoreTest, AddEdgeRequiresBothEndpoints) {
    GraphStore g("chat-1");
    Node a = g.addNode(makeConcept("a"));
    EXPECT_THROW(g.addEdge(makeRelates(a.id, "ghost")), NodeNotFoundError);
    EXPECT_THROW(g.addEdge(makeRelates("ghost", a.id)), NodeNotFoundError);
    EXPECT_EQ(g.edgeCount(), 0u);
}

TEST(GraphStoreTest, UpdateAndReinforceEdge) {
    GraphStore g("chat-1");
    Node a = g.addNode(makeConcept("a"));
    Node b = g.addNode(makeConcept("b"));
    Edge e = g.addEdge(makeRelates(a.id, b.id, 2.0));

    EdgePatch patch;
    patch.type = EdgeType::Blocks;
    g.updateEdge(e.id, patch);
    EXPECT_TRUE(g.queryEdgesByType(EdgeType::Relates).empty());
    EXPECT_EQ(g.queryEdgesByType(EdgeType::Blocks).size(), 1u);

    auto reinforced = g.reinforceEdge(e.id);
    ASSERT_TRUE(reinforced.has_value());
    EXPECT_NEAR(reinforced->weight, 2.2, 1e-12);
    EXPECT_FALSE(g.reinforceEdge("missing").has_value());
}

TEST(GraphStoreTest, DeleteEdge) {
    GraphStore g("chat-1");
    Node a = g.addNode(makeConcept("a"));
    Node b = g.addNode(makeConcept("b"));
    Edge e = g.addEdge(makeRelates(a.id, b.id));
    ASSERT_TRUE(g.deleteEdge(e.id));
    EXPECT_EQ(g.edgeCount(), 0u);
    EXPECT_TRUE(g.edgesFrom(a.id).empty());
    EXPECT_FALSE(g.deleteEdge(e.id));
    EXPECT_EQ(g.nodeCount(), 2u);
}

TEST(GraphStoreTest, UnknownEdgeIdsAreNotErrors) {
    GraphStore g("chat-1");
    EdgePatch patch;
    patch.weight = 2.0;
    EXPECT_NO_THROW({
        EXPECT_EQ(g.getEdge("missing"), nullptr);
        EXPECT_FALSE(g.updateEdge("missing", patch).has_value());
        EXPECT_FALSE(g.reinforceEdge("missing").has_value());
        EXPECT_FALSE(g.deleteEdge("missing"));
    });
    EXPECT_FALSE(HebbianWeights().strengthen("missing", g).has_value());
}

TEST(GraphStoreTest, MutationsBumpUpdatedAt) {
    GraphStore g("chat-1");
    Timestamp before = g.updatedAt();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    g.addNode(makeConcept("a"));
    EXPECT_GT(g.updatedAt(), before);
    EXPECT_EQ(g.createdAt(), before);
}

// ─── Queries ───────────────────────────────────────────────────

TEST(GraphStoreTest, QueryByLabelIsCaseInsensitiveSubstring) {
    GraphStore g("chat-1");
    g.addNode(makeConcept("React Hooks"));
    g.addNode(makeConcept("useState hook"));
    g.addNode(makeConcept("Redux"));

    EXPECT_EQ(g.queryByLabel("HOOK").size(), 2u);
    EXPECT_EQ(g.queryByLabel("re").size(), 2u);
    EXPECT_TRUE(g.queryByLabel("vue").empty());
}

TEST(GraphStoreTest, QueryByLabelOrdersByFrequency) {
    GraphStore g("chat-1");
    Node low = g.addNode(makeConcept("cache low"));
    Node high = g.addNode(makeConcept("cache high"));
    Node mid = g.addNode(makeConcept("cache mid"));
    for (int i = 0; i < 4; i++) g.incrementFrequency(high.id);
    for (int i = 0; i < 2; i++) g.incrementFrequency(mid.id);

    auto results = g.queryByLabel("cache");
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].id, high.id);
    EXPECT_EQ(results[1].id, mid.id);
    EXPECT_EQ(results[2].id, low.id);
}

TEST(GraphStoreTest, QueryByLabelReturnsWholeBucket) {
    GraphStore g("chat-1");
    g.addNode(makeConcept("Parser"));
    g.addNode(makeConcept("parser"));
    EXPECT_EQ(g.queryByLabel("PARSER").size(), 2u);
}

TEST(GraphStoreTest, QueryByType) {
    GraphStore g("chat-1");
    g.addNode(makeConcept("a"));
    g.addNode(makeError("b"));
    g.addNode(makeError("c"));
    EXPECT_EQ(g.queryByType(NodeType::Error).size(), 2u);
    EXPECT_TRUE(g.queryByType(NodeType::Milestone).empty());
}

TEST(GraphStoreTest, StatsCountByType) {
    GraphStore g("chat-1");
    Node a = g.addNode(makeConcept("a"));
    Node b = g.addNode(makeError("b"));
    g.addEdge(makeCauses(a.id, b.id));

    GraphStats s = g.stats();
    EXPECT_EQ(s.total_nodes, 2u);
    EXPECT_EQ(s.total_edges, 1u);
    EXPECT_EQ(s.nodes_by_type["CONCEPT"], 1u);
    EXPECT_EQ(s.nodes_by_type["ERROR"], 1u);
    EXPECT_EQ(s.edges_by_type["CAUSES"], 1u);
    EXPECT_EQ(s.chat_id, "chat-1");
}

TEST(GraphStoreTest, Clear) {
    GraphStore g("chat-1");
    Node a = g.addNode(makeConcept("a"));
    Node b = g.addNode(makeConcept("b"));
    g.addEdge(makeRelates(a.id, b.id));
    g.clear();
    EXPECT_EQ(g.nodeCount(), 0u);
    EXPECT_EQ(g.edgeCount(), 0u);
    EXPECT_TRUE(g.queryByLabel("a").empty());
    EXPECT_EQ(g.chatId(), "chat-1");
}

// ─── Collaborators ─────────────────────────────────────────────

TEST(GraphStoreTest, NoImplicitLinksWithoutLinker) {
    GraphStore g("chat-1");
    g.addNode(makeConcept("TypeScript generics"));
    g.addNode(makeConcept("TypeScript generics"));
    EXPECT_EQ(g.edgeCount(), 0u);
}

TEST(GraphStoreTest, AttachedLinkerLinksOnInsert) {
    GraphStore g("chat-1");
    LinkerConfig config;
    config.threshold = 0.5;
    g.setSynapticLinker(std::make_shared<SynapticLinker>(config));

    Node first = g.addNode(makeConcept("graph compression engine"));
    Node second = g.addNode(makeConcept("compression engine design"));

    auto edges = g.edgesFrom(second.id);
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].target_id, first.id);
    EXPECT_EQ(edges[0].metadata.at("mode"), "keyword");
    EXPECT_TRUE(g.edgesFrom(first.id).empty());
}

TEST(GraphStoreTest, QueriesStrengthenCoRetrievedEdges) {
    GraphStore g("chat-1");
    g.setHebbianWeights(std::make_shared<HebbianWeights>());

    Node a = g.addNode(makeConcept("cache eviction"));
    Node b = g.addNode(makeConcept("cache sizing"));
    Node c = g.addNode(makeConcept("unrelated"));
    Edge ab = g.addEdge(makeRelates(a.id, b.id, 1.0));
    Edge ac = g.addEdge(makeRelates(a.id, c.id, 1.0));

    g.queryByLabel("cache");
    EXPECT_NEAR(g.getEdge(ab.id)->weight, 1.1, 1e-12);
    EXPECT_DOUBLE_EQ(g.getEdge(ac.id)->weight, 1.0);

    // A single hit activates nothing.
    g.queryByLabel("eviction");
    EXPECT_NEAR(g.getEdge(ab.id)->weight, 1.1, 1e-12);

    g.queryByType(NodeType::Concept);
    EXPECT_NEAR(g.getEdge(ab.id)->weight, 1.2, 1e-12);
    EXPECT_NEAR(g.getEdge(ac.id)->weight, 1.1, 1e-12);
}

TEST(GraphStoreTest, QueriesLeaveWeightsAloneWithoutHebbian) {
    GraphStore g("chat-1");
    ASSERT_EQ(g.hebbianWeights(), nullptr);

    Node a = g.addNode(makeConcept("cache eviction"));
    Node b = g.addNode(makeConcept("cache sizing"));
    Node c = g.addNode(makeConcept("cache warming"));
    Edge ab = g.addEdge(makeRelates(a.id, b.id, 1.0));
    Edge bc = g.addEdge(makeRelates(b.id, c.id, 0.4));

    ASSERT_EQ(g.queryByLabel("cache").size(), 3u);
    ASSERT_EQ(g.queryByType(NodeType::Concept).size(), 3u);
    g.queryByLabel("cache");

    EXPECT_DOUBLE_EQ(g.getEdge(ab.id)->weight, 1.0);
    EXPECT_DOUBLE_EQ(g.getEdge(bc.id)->weight, 0.4);
    EXPECT_EQ(g.edgeCount(), 2u);
}
