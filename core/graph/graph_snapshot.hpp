#pragma once

#include "graph/edge.hpp"
#include "graph/node.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace weave {

struct SnapshotMetadata {
    std::string chat_id;          // logical session id, never sanitized
    std::string version = "0.1.0";
    Timestamp created_at;
    Timestamp updated_at;
    double compression_threshold = 0.75;  // in (0, 1]
};

/// Complete serializable state of one session's graph.
/// Nodes and edges are keyed by id.
struct GraphSnapshot {
    std::map<std::string, Node> nodes;
    std::map<std::string, Edge> edges;
    SnapshotMetadata metadata;
};

// ─── Wire format ───────────────────────────────────────────────
// {
//   "nodes": { "<id>": { id, type, label, description?, metadata,
//                        frequency, createdAt, updatedAt } },
//   "edges": { "<id>": { id, sourceId, targetId, type, weight,
//                        metadata, createdAt, updatedAt } },
//   "metadata": { chatId, version, createdAt, updatedAt, compressionThreshold }
// }
// Timestamps are ISO-8601 strings. Decoding never returns a partial
// snapshot: any defect throws SnapshotFormatError.

nlohmann::json nodeToJson(const Node& node);
nlohmann::json edgeToJson(const Edge& edge);
nlohmann::json snapshotToJson(const GraphSnapshot& snapshot);

Node nodeFromJson(const nlohmann::json& j);
Edge edgeFromJson(const nlohmann::json& j);
GraphSnapshot snapshotFromJson(const nlohmann::json& j);

} // namespace weave
