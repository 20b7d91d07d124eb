#pragma once

#include "graph/graph_view.hpp"

#include <optional>
#include <string>
#include <vector>

namespace weave {

struct HebbianConfig {
    double strength = 0.1;         // added to weight on co-activation
    double decay_rate = 0.99;      // multiplied into every weight per cycle
    double prune_threshold = 0.05; // edges strictly below this are deleted
    double max_weight = 5.0;       // ceiling applied on strengthen
};

// ─── Hebbian Weights ──────────────────────────────────────────
// Usage-driven edge dynamics:
// - strengthen: edges between nodes retrieved together gain weight
//   ("fire together, wire together"), capped at max_weight
// - decay:      every weight shrinks by decay_rate each cycle
// - prune:      edges whose weight fell below the threshold are removed
//
// Together they rank connections by recent use and evict stale ones.

class HebbianWeights {
public:
    explicit HebbianWeights(HebbianConfig config = {})
        : config_(config) {}

    /// weight = min(weight + strength, max_weight).
    /// Returns the updated edge, or nullopt if the id is unknown.
    std::optional<Edge> strengthen(const std::string& edge_id, HebbianGraph& graph) const;

    /// Strengthen once every edge whose source and target are both in
    /// `node_ids`. Fewer than two ids is a no-op.
    /// Returns the ids of the strengthened edges.
    std::vector<std::string> strengthenCoActivated(const std::vector<std::string>& node_ids,
                                                   HebbianGraph& graph) const;

    /// Multiply every weight by decay_rate. Returns the number of edges touched.
    size_t decay(HebbianGraph& graph) const;

    /// Delete every edge with weight < (min_weight or prune_threshold).
    /// An edge exactly at the threshold survives. Returns the number deleted.
    size_t prune(HebbianGraph& graph, std::optional<double> min_weight = std::nullopt) const;

    const HebbianConfig& config() const { return config_; }

private:
    HebbianConfig config_;
};

} // namespace weave
