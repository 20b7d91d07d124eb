#pragma once

#include "compression/compression_engine.hpp"
#include "compression/error_suppression.hpp"
#include "graph/edge.hpp"
#include "graph/graph_snapshot.hpp"
#include "graph/graph_view.hpp"
#include "graph/node.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace weave {

class SynapticLinker;
class HebbianWeights;

struct GraphStats {
    size_t total_nodes = 0;
    size_t total_edges = 0;
    std::map<std::string, size_t> nodes_by_type;
    std::map<std::string, size_t> edges_by_type;
    std::string chat_id;
    Timestamp created_at;
    Timestamp updated_at;
};

// ─── GraphStore ────────────────────────────────────────────────
// The knowledge graph of one chat session.
// Owns every Node and Edge by id; the label, type and adjacency maps
// hold ids only and are rebuilt incrementally on each mutation.
//
// Not thread-safe: callers sharing an instance must serialize access.
//
// Optional collaborators:
// - SynapticLinker: addNode() links the new node to similar history
// - HebbianWeights: label/type queries returning ≥ 2 nodes strengthen
//                   the edges among the results

class GraphStore : public SynapticGraph, public HebbianGraph {
public:
    explicit GraphStore(std::string chat_id, double compression_threshold = 0.75);
    /// Takes the compression threshold from `compression.threshold`.
    GraphStore(std::string chat_id, const CompressionConfig& compression);

    // ── Node operations ──
    /// Insert `node` (ids must be unique) and, with a linker attached,
    /// link it retroactively. Returns the stored node.
    Node addNode(Node node);
    const Node* getNode(const std::string& id) const;
    /// Clone-with-overrides; bumps updated_at. nullopt if the id is unknown.
    std::optional<Node> updateNode(const std::string& id, const NodePatch& patch);
    std::optional<Node> incrementFrequency(const std::string& id);
    /// Removes the node and every edge touching it. False if unknown.
    bool deleteNode(const std::string& id);
    size_t nodeCount() const { return nodes_.size(); }

    // ── Edge operations ──
    /// Both endpoints must exist (NodeNotFoundError otherwise).
    Edge addEdge(Edge edge) override;
    const Edge* getEdge(const std::string& id) const override;
    std::optional<Edge> updateEdge(const std::string& id, const EdgePatch& patch) override;
    /// weight × factor.
    std::optional<Edge> reinforceEdge(const std::string& id, double factor = 1.1);
    bool deleteEdge(const std::string& id) override;
    size_t edgeCount() const { return edges_.size(); }

    // ── Adjacency ──
    std::vector<Edge> edgesFrom(const std::string& node_id) const override;
    std::vector<Edge> edgesTo(const std::string& node_id) const;

    // ── Queries ──
    /// Case-insensitive substring match against each lowercased label
    /// bucket; every node of a matching bucket is returned. Ordered by
    /// descending frequency.
    std::vector<Node> queryByLabel(const std::string& substring);
    std::vector<Node> queryByType(NodeType type);
    std::vector<Edge> queryEdgesByType(EdgeType type) const;

    /// Ordered by creation time, then id.
    std::vector<Node> allNodes() const override;
    std::vector<Edge> allEdges() const override;
    GraphStats stats() const;

    // ── Collaborators ──
    void setSynapticLinker(std::shared_ptr<SynapticLinker> linker) { linker_ = std::move(linker); }
    void setHebbianWeights(std::shared_ptr<HebbianWeights> hebbian) { hebbian_ = std::move(hebbian); }
    const std::shared_ptr<SynapticLinker>& synapticLinker() const { return linker_; }
    const std::shared_ptr<HebbianWeights>& hebbianWeights() const { return hebbian_; }

    // ── Compression ──
    size_t contextSize() const;
    /// contextSize() against the engine's max_context_bytes, in [0, 1].
    double contextWindowUsage(const CompressionEngine& engine) const;
    double contextWindowUsage() const { return contextWindowUsage(CompressionEngine()); }
    bool shouldCompress(const CompressionEngine& engine) const;
    bool shouldCompress() const { return shouldCompress(CompressionEngine()); }
    /// Archive the lowest-importance nodes into `engine` and drop them
    /// (and their edges) from the active graph. Returns the archived ids.
    std::vector<std::string> compress(CompressionEngine& engine, double target_reduction);
    /// Same, with the engine's configured target_reduction.
    std::vector<std::string> compress(CompressionEngine& engine) {
        return compress(engine, engine.config().target_reduction);
    }
    /// Bring archived nodes back, plus archived edges whose endpoints are
    /// both active again. Returns the number of nodes restored. A node whose
    /// id is active again stays in the archive.
    size_t restoreArchived(CompressionEngine& engine, const std::vector<std::string>& node_ids);

    // ── Error suppression ──
    /// Mark ERROR node `error_id` suppressed and attach a CORRECTION.
    /// Throws NodeNotFoundError or PolicyViolationError.
    Correction suppressError(const std::string& error_id, const std::string& label,
                             std::optional<std::string> description = std::nullopt);
    std::map<std::string, CorrectedError> correctedErrors() const;
    std::vector<Node> uncorrectedErrors() const;

    // ── Snapshots ──
    GraphSnapshot snapshot() const;
    static GraphStore restore(const GraphSnapshot& snapshot);
    void clear();

    const std::string& chatId() const { return chat_id_; }
    double compressionThreshold() const { return compression_threshold_; }
    Timestamp createdAt() const { return created_at_; }
    Timestamp updatedAt() const { return updated_at_; }

private:
    // Insert without linking; used by addNode(), restore and un-archiving.
    const Node& insertNode(Node node);
    const Edge& insertEdge(Edge edge);
    void unindexEdge(const Edge& edge);
    void strengthenResults(const std::vector<Node>& results);
    void touch();

    std::string chat_id_;
    double compression_threshold_;
    std::string version_ = "0.1.0";
    Timestamp created_at_;
    Timestamp updated_at_;

    std::unordered_map<std::string, Node> nodes_;
    std::unordered_map<std::string, Edge> edges_;

    // Derived indices: ids only
    std::map<std::string, std::unordered_set<std::string>> nodes_by_label_;  // lowercased label
    std::unordered_map<NodeType, std::unordered_set<std::string>> nodes_by_type_;
    std::unordered_map<EdgeType, std::unordered_set<std::string>> edges_by_type_;
    std::unordered_map<std::string, std::unordered_set<std::string>> outgoing_;
    std::unordered_map<std::string, std::unordered_set<std::string>> incoming_;

    std::shared_ptr<SynapticLinker> linker_;
    std::shared_ptr<HebbianWeights> hebbian_;
};

} // namespace weave
