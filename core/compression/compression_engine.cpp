#include "compression/compression_engine.hpp"
#include "graph/errors.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace weave {

// ─── Size estimation ───────────────────────────────────────────

size_t CompressionEngine::estimateNodeSize(const Node& node) {
    // ~50 bytes of fixed fields, two bytes per text character, plus metadata.
    size_t label_size = node.label.size() * 2;
    size_t desc_size = node.description ? node.description->size() * 2 : 0;
    size_t metadata_size = node.metadata.is_null() ? 2 : node.metadata.dump().size();
    return 50 + label_size + desc_size + metadata_size;
}

size_t CompressionEngine::estimateEdgeSize(const Edge& edge) {
    // Two ids, a type and a weight are ~100 bytes.
    size_t metadata_size = edge.metadata.is_null() ? 2 : edge.metadata.dump().size();
    return 100 + metadata_size;
}

size_t CompressionEngine::calculateContextSize(const std::vector<Node>& nodes,
                                               const std::vector<Edge>& edges) {
    size_t total = 0;
    for (const auto& n : nodes) total += estimateNodeSize(n);
    for (const auto& e : edges) total += estimateEdgeSize(e);
    return total;
}

double CompressionEngine::calculateContextUsagePercentage(size_t size_bytes) const {
    if (config_.max_context_bytes <= 0.0) return 1.0;
    return std::min(static_cast<double>(size_bytes) / config_.max_context_bytes, 1.0);
}

// ─── Candidate selection ───────────────────────────────────────

std::vector<std::string> CompressionEngine::identifyArchiveCandidates(
    const std::vector<Node>& nodes, const std::vector<Edge>& edges,
    double target_reduction) const {
    return identifyArchiveCandidates(nodes, edges, target_reduction, now());
}

std::vector<std::string> CompressionEngine::identifyArchiveCandidates(
    const std::vector<Node>& nodes, const std::vector<Edge>& edges,
    double target_reduction, Timestamp reference) const {

    if (!std::isfinite(target_reduction)) {
        throw WeaveError("target_reduction must be finite");
    }
    if (nodes.empty() || target_reduction <= 0.0) return {};

    std::unordered_map<std::string, size_t> connections;
    for (const Edge& e : edges) {
        connections[e.source_id]++;
        connections[e.target_id]++;
    }

    std::vector<std::pair<std::string, double>> scored;
    scored.reserve(nodes.size());
    for (const Node& n : nodes) {
        double importance = static_cast<double>(n.frequency);

        auto it = connections.find(n.id);
        if (it != connections.end()) {
            importance += config_.connection_weight * static_cast<double>(it->second);
        }

        if (n.type == NodeType::Error) {
            importance = std::max(config_.error_floor, importance - config_.error_penalty);
        }

        if (hoursBetween(n.updated_at, reference) > config_.stale_age_hours &&
            n.frequency < config_.stale_frequency) {
            importance *= config_.stale_factor;
        }

        scored.emplace_back(n.id, importance);
    }

    // Stable: equal scores keep input order.
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    // 1e-9 keeps products like 10 × 0.3 = 3.0000000000000004 from rounding up.
    double wanted = std::ceil(static_cast<double>(nodes.size()) * target_reduction - 1e-9);
    size_t count = std::min(nodes.size(), static_cast<size_t>(wanted));

    std::vector<std::string> result;
    result.reserve(count);
    for (size_t i = 0; i < count; i++) {
        result.push_back(scored[i].first);
    }
    return result;
}

// ─── Archive ───────────────────────────────────────────────────

void CompressionEngine::archiveNodes(const std::vector<std::string>& node_ids,
                                     const std::vector<Node>& nodes,
                                     const std::vector<Edge>& edges) {
    std::unordered_set<std::string> wanted(node_ids.begin(), node_ids.end());
    std::unordered_set<std::string> archived_now;

    for (const Node& n : nodes) {
        if (wanted.count(n.id)) {
            archived_nodes_[n.id] = n;
            archived_now.insert(n.id);
        }
    }

    size_t edge_count = 0;
    for (const Edge& e : edges) {
        if (archived_now.count(e.source_id) || archived_now.count(e.target_id)) {
            archived_edges_[e.id] = e;
            edge_count++;
        }
    }

    log::get()->debug("Archived {} node(s) and {} edge(s)", archived_now.size(), edge_count);
}

RestoredArchive CompressionEngine::restoreNodes(const std::vector<std::string>& node_ids) {
    RestoredArchive restored;
    for (const auto& id : node_ids) {
        auto it = archived_nodes_.find(id);
        if (it == archived_nodes_.end()) continue;
        restored.nodes.push_back(std::move(it->second));
        archived_nodes_.erase(it);
    }

    for (auto it = archived_edges_.begin(); it != archived_edges_.end();) {
        const Edge& e = it->second;
        if (!archived_nodes_.count(e.source_id) && !archived_nodes_.count(e.target_id)) {
            restored.edges.push_back(e);
            it = archived_edges_.erase(it);
        } else {
            ++it;
        }
    }
    return restored;
}

ArchiveStats CompressionEngine::getArchiveStats() const {
    ArchiveStats stats;
    stats.archived_node_count = archived_nodes_.size();
    stats.archived_edge_count = archived_edges_.size();
    return stats;
}

void CompressionEngine::clearArchives() {
    archived_nodes_.clear();
    archived_edges_.clear();
}

} // namespace weave
