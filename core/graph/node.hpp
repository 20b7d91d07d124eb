#pragma once

#include "graph/timestamp.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace weave {

/// Open string-keyed metadata attached to nodes and edges. Always a JSON object.
using Metadata = nlohmann::json;

enum class NodeType {
    Concept,
    Decision,
    Milestone,
    Error,
    Correction,
    CodeEntity,
};

/// "CONCEPT", "DECISION", ... as used on the wire.
std::string toString(NodeType type);

/// Inverse of toString(). Throws WeaveError for unknown names.
NodeType parseNodeType(const std::string& name);

/// A typed vertex of the knowledge graph: a concept, decision, milestone,
/// error, correction or code entity the agent wants to remember.
struct Node {
    std::string id;
    NodeType type = NodeType::Concept;
    std::string label;
    std::optional<std::string> description;
    Metadata metadata = Metadata::object();
    uint64_t frequency = 1;  // access-count hint
    Timestamp created_at;
    Timestamp updated_at;

    /// label + " " + description, trimmed. The text that linking compares.
    std::string text() const;

    bool hasMetadata(const std::string& key) const {
        return metadata.is_object() && metadata.contains(key);
    }
};

/// Partial update for GraphStore::updateNode(). Unset fields keep their value.
/// Frequency is deliberately absent: it only grows via incrementFrequency().
struct NodePatch {
    std::optional<NodeType> type;
    std::optional<std::string> label;
    std::optional<std::string> description;
    std::optional<Metadata> metadata;
};

// ─── Node factories ────────────────────────────────────────────
// Fresh id, frequency 1, created_at == updated_at == now().

Node makeNode(NodeType type, std::string label,
              std::optional<std::string> description = std::nullopt,
              Metadata metadata = Metadata::object());

Node makeConcept(std::string label, std::optional<std::string> description = std::nullopt);
Node makeDecision(std::string label, std::optional<std::string> description = std::nullopt);
Node makeMilestone(std::string label, std::optional<std::string> description = std::nullopt);
Node makeError(std::string label, std::optional<std::string> description = std::nullopt);
Node makeCorrection(std::string label, std::optional<std::string> description = std::nullopt);
Node makeCodeEntity(std::string label, std::optional<std::string> description = std::nullopt);

/// Copy of `node` with the patch applied and updated_at bumped.
Node applyPatch(const Node& node, const NodePatch& patch);

} // namespace weave
