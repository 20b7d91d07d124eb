#include "plasticity/hebbian_weights.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <unordered_set>

namespace weave {

std::optional<Edge> HebbianWeights::strengthen(const std::string& edge_id,
                                               HebbianGraph& graph) const {
    const Edge* edge = graph.getEdge(edge_id);
    if (!edge) return std::nullopt;

    EdgePatch patch;
    patch.weight = std::min(edge->weight + config_.strength, config_.max_weight);
    return graph.updateEdge(edge_id, patch);
}

std::vector<std::string> HebbianWeights::strengthenCoActivated(
    const std::vector<std::string>& node_ids, HebbianGraph& graph) const {

    std::vector<std::string> strengthened;
    if (node_ids.size() < 2) return strengthened;

    std::unordered_set<std::string> active(node_ids.begin(), node_ids.end());

    // Collect first: strengthening rewrites edges while we walk the index.
    std::vector<std::string> targets;
    for (const auto& node_id : active) {
        for (const Edge& e : graph.edgesFrom(node_id)) {
            if (active.count(e.target_id)) targets.push_back(e.id);
        }
    }

    for (const auto& edge_id : targets) {
        if (strengthen(edge_id, graph)) {
            strengthened.push_back(edge_id);
        }
    }
    return strengthened;
}

size_t HebbianWeights::decay(HebbianGraph& graph) const {
    size_t count = 0;
    for (const Edge& e : graph.allEdges()) {
        EdgePatch patch;
        patch.weight = e.weight * config_.decay_rate;
        if (graph.updateEdge(e.id, patch)) count++;
    }
    log::get()->debug("Hebbian decay touched {} edge(s)", count);
    return count;
}

size_t HebbianWeights::prune(HebbianGraph& graph, std::optional<double> min_weight) const {
    double threshold = min_weight.value_or(config_.prune_threshold);

    std::vector<std::string> doomed;
    for (const Edge& e : graph.allEdges()) {
        if (e.weight < threshold) doomed.push_back(e.id);
    }

    size_t removed = 0;
    for (const auto& id : doomed) {
        if (graph.deleteEdge(id)) removed++;
    }
    log::get()->debug("Hebbian prune removed {} edge(s) below {}", removed, threshold);
    return removed;
}

} // namespace weave
