#pragma once

#include "graph/edge.hpp"
#include "graph/node.hpp"

#include <optional>
#include <string>
#include <vector>

namespace weave {

// ─── Narrow graph views ────────────────────────────────────────
// The engines depend on these instead of GraphStore, so each can be
// driven by a small fake in tests. GraphStore implements both.

/// What retroactive linking needs: the node population and a way to add edges.
class SynapticGraph {
public:
    virtual ~SynapticGraph() = default;

    virtual std::vector<Node> allNodes() const = 0;
    virtual Edge addEdge(Edge edge) = 0;
};

/// What weight dynamics need: edge lookup, update, enumeration and deletion.
class HebbianGraph {
public:
    virtual ~HebbianGraph() = default;

    virtual const Edge* getEdge(const std::string& edge_id) const = 0;
    virtual std::optional<Edge> updateEdge(const std::string& edge_id,
                                           const EdgePatch& patch) = 0;
    virtual std::vector<Edge> allEdges() const = 0;
    virtual std::vector<Edge> edgesFrom(const std::string& node_id) const = 0;
    virtual bool deleteEdge(const std::string& edge_id) = 0;
};

} // namespace weave
