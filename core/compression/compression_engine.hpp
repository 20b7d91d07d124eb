#pragma once

#include "graph/edge.hpp"
#include "graph/node.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace weave {

struct CompressionConfig {
    double max_context_bytes = 100000.0;  // graph share of the LLM context
    double threshold = 0.75;              // usage at which compression kicks in
    double target_reduction = 0.3;        // default fraction of nodes to archive
    double connection_weight = 2.0;       // importance per incident edge
    double error_penalty = 5.0;           // subtracted from ERROR nodes
    double error_floor = 0.1;             // ERROR importance never goes below this
    double stale_age_hours = 24.0;        // older than this ...
    uint64_t stale_frequency = 3;         // ... and rarer than this is halved
    double stale_factor = 0.5;
};

struct ArchiveStats {
    size_t archived_node_count = 0;
    size_t archived_edge_count = 0;
};

/// Nodes and edges handed back by restoreNodes().
struct RestoredArchive {
    std::vector<Node> nodes;
    std::vector<Edge> edges;  // archived edges whose endpoints are no longer archived
};

// ─── Compression Engine ───────────────────────────────────────
// Under context pressure, rank nodes by importance and move the least
// important ones (with every edge touching them) into an archive.
//
// importance(n) = frequency
//               + connection_weight × (in + out edges)
//               − error_penalty for ERROR nodes, floored at error_floor
//               × stale_factor if older than stale_age_hours and
//                 frequency < stale_frequency
//
// Archiving relocates data, it never deletes it.

class CompressionEngine {
public:
    explicit CompressionEngine(CompressionConfig config = {})
        : config_(config) {}

    // ── Size estimation (relative cost signal, not real bytes) ──
    static size_t estimateNodeSize(const Node& node);
    static size_t estimateEdgeSize(const Edge& edge);
    static size_t calculateContextSize(const std::vector<Node>& nodes,
                                       const std::vector<Edge>& edges);

    /// min(size_bytes / max_context_bytes, 1), always in [0, 1].
    double calculateContextUsagePercentage(size_t size_bytes) const;

    /// Lowest-importance node ids, worst first.
    /// Returns ceil(nodes.size() × target_reduction) ids, capped at
    /// nodes.size(). Throws WeaveError for a NaN or infinite target.
    std::vector<std::string> identifyArchiveCandidates(const std::vector<Node>& nodes,
                                                       const std::vector<Edge>& edges,
                                                       double target_reduction) const;

    /// Same, with an explicit clock for the staleness rule.
    std::vector<std::string> identifyArchiveCandidates(const std::vector<Node>& nodes,
                                                       const std::vector<Edge>& edges,
                                                       double target_reduction,
                                                       Timestamp reference) const;

    /// Copy the named nodes and every edge touching them into the archive.
    /// Ids not present in `nodes` are ignored.
    void archiveNodes(const std::vector<std::string>& node_ids,
                      const std::vector<Node>& nodes,
                      const std::vector<Edge>& edges);

    /// Take the named nodes back out of the archive, together with the
    /// archived edges that no longer touch any archived node.
    RestoredArchive restoreNodes(const std::vector<std::string>& node_ids);

    bool isArchived(const std::string& node_id) const {
        return archived_nodes_.count(node_id) > 0;
    }

    ArchiveStats getArchiveStats() const;
    void clearArchives();

    const CompressionConfig& config() const { return config_; }

private:
    CompressionConfig config_;
    std::unordered_map<std::string, Node> archived_nodes_;
    std::unordered_map<std::string, Edge> archived_edges_;
};

} // namespace weave
