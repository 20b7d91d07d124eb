#include "graph/node.hpp"
#include "graph/errors.hpp"
#include "graph/id.hpp"

#include <utility>

namespace weave {

std::string toString(NodeType type) {
    switch (type) {
        case NodeType::Concept:    return "CONCEPT";
        case NodeType::Decision:   return "DECISION";
        case NodeType::Milestone:  return "MILESTONE";
        case NodeType::Error:      return "ERROR";
        case NodeType::Correction: return "CORRECTION";
        case NodeType::CodeEntity: return "CODE_ENTITY";
    }
    return "CONCEPT";
}

NodeType parseNodeType(const std::string& name) {
    if (name == "CONCEPT")     return NodeType::Concept;
    if (name == "DECISION")    return NodeType::Decision;
    if (name == "MILESTONE")   return NodeType::Milestone;
    if (name == "ERROR")       return NodeType::Error;
    if (name == "CORRECTION")  return NodeType::Correction;
    if (name == "CODE_ENTITY") return NodeType::CodeEntity;
    throw WeaveError("Unknown node type: " + name);
}

std::string Node::text() const {
    std::string joined = label + " " + description.value_or("");
    size_t begin = joined.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = joined.find_last_not_of(" \t\r\n");
    return joined.substr(begin, end - begin + 1);
}

Node makeNode(NodeType type, std::string label,
              std::optional<std::string> description, Metadata metadata) {
    Node n;
    n.id = generateId();
    n.type = type;
    n.label = std::move(label);
    n.description = std::move(description);
    n.metadata = metadata.is_object() ? std::move(metadata) : Metadata::object();
    n.frequency = 1;
    n.created_at = now();
    n.updated_at = n.created_at;
    return n;
}

Node makeConcept(std::string label, std::optional<std::string> description) {
    return makeNode(NodeType::Concept, std::move(label), std::move(description));
}

Node makeDecision(std::string label, std::optional<std::string> description) {
    return makeNode(NodeType::Decision, std::move(label), std::move(description));
}

Node makeMilestone(std::string label, std::optional<std::string> description) {
    return makeNode(NodeType::Milestone, std::move(label), std::move(description));
}

Node makeError(std::string label, std::optional<std::string> description) {
    return makeNode(NodeType::Error, std::move(label), std::move(description));
}

Node makeCorrection(std::string label, std::optional<std::string> description) {
    return makeNode(NodeType::Correction, std::move(label), std::move(description));
}

Node makeCodeEntity(std::string label, std::optional<std::string> description) {
    return makeNode(NodeType::CodeEntity, std::move(label), std::move(description));
}

Node applyPatch(const Node& node, const NodePatch& patch) {
    Node updated = node;
    if (patch.type) updated.type = *patch.type;
    if (patch.label) updated.label = *patch.label;
    if (patch.description) updated.description = *patch.description;
    if (patch.metadata) updated.metadata = *patch.metadata;
    updated.updated_at = now();
    return updated;
}

} // namespace weave
