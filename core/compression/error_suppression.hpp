#pragma once

#include "graph/edge.hpp"
#include "graph/node.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace weave {

/// A CORRECTION node plus the CORRECTS edge (correction → error) tying it
/// to the error it fixes.
struct Correction {
    Node correction_node;
    Edge correction_edge;
};

struct CorrectedError {
    Node error;
    std::vector<Node> corrections;
};

// ─── Error Suppression ────────────────────────────────────────
// Policy for ERROR nodes: once an error is understood it is marked
// suppressed and a CORRECTION is attached, so the agent stops repeating it.

class ErrorSuppression {
public:
    /// Copy of `node` with metadata.suppressed = true and
    /// metadata.suppressedAt = ISO-8601 now.
    /// Throws PolicyViolationError unless node.type is ERROR.
    static Node suppressNode(const Node& node);

    static bool isSuppressed(const Node& node);

    /// New CORRECTION node and a CORRECTS edge from it to `error_node_id`.
    static Correction createCorrection(const std::string& error_node_id,
                                       const std::string& label,
                                       std::optional<std::string> description = std::nullopt);

    /// ERROR nodes targeted by at least one CORRECTS edge, keyed by error id.
    static std::map<std::string, CorrectedError> findCorrectedErrors(
        const std::vector<Node>& nodes, const std::vector<Edge>& edges);

    /// ERROR nodes no CORRECTS edge points at, in input order.
    static std::vector<Node> findUncorrectedErrors(const std::vector<Node>& nodes,
                                                   const std::vector<Edge>& edges);
};

} // namespace weave
