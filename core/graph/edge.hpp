#pragma once

#include "graph/node.hpp"

#include <optional>
#include <string>

namespace weave {

enum class EdgeType {
    Relates,
    Causes,
    Corrects,
    Implements,
    DependsOn,
    Blocks,
};

std::string toString(EdgeType type);
EdgeType parseEdgeType(const std::string& name);

/// A directed, typed, weighted relationship source → target.
/// Endpoints are referenced by id only; the store cascades deletes.
struct Edge {
    std::string id;
    std::string source_id;
    std::string target_id;
    EdgeType type = EdgeType::Relates;
    double weight = 1.0;  // confidence / strength
    Metadata metadata = Metadata::object();
    Timestamp created_at;
    Timestamp updated_at;
};

struct EdgePatch {
    std::optional<EdgeType> type;
    std::optional<double> weight;
    std::optional<Metadata> metadata;
};

// ─── Edge factories ────────────────────────────────────────────

Edge makeEdge(std::string source_id, std::string target_id, EdgeType type,
              double weight = 1.0, Metadata metadata = Metadata::object());

Edge makeRelates(std::string source_id, std::string target_id, double weight = 1.0);
Edge makeCauses(std::string source_id, std::string target_id, double weight = 1.0);
/// CORRECTION → ERROR.
Edge makeCorrects(std::string correction_id, std::string error_id, double weight = 1.0);
/// CODE_ENTITY → DECISION.
Edge makeImplements(std::string code_entity_id, std::string decision_id, double weight = 1.0);
Edge makeDependsOn(std::string source_id, std::string target_id, double weight = 1.0);
Edge makeBlocks(std::string blocker_id, std::string blocked_id, double weight = 1.0);

Edge applyPatch(const Edge& edge, const EdgePatch& patch);

} // namespace weave
