#include "graph/edge.hpp"
#include "graph/errors.hpp"
#include "graph/id.hpp"

#include <utility>

namespace weave {

std::string toString(EdgeType type) {
    switch (type) {
        case EdgeType::Relates:    return "RELATES";
        case EdgeType::Causes:     return "CAUSES";
        case EdgeType::Corrects:   return "CORRECTS";
        case EdgeType::Implements: return "IMPLEMENTS";
        case EdgeType::DependsOn:  return "DEPENDS_ON";
        case EdgeType::Blocks:     return "BLOCKS";
    }
    return "RELATES";
}

EdgeType parseEdgeType(const std::string& name) {
    if (name == "RELATES")    return EdgeType::Relates;
    if (name == "CAUSES")     return EdgeType::Causes;
    if (name == "CORRECTS")   return EdgeType::Corrects;
    if (name == "IMPLEMENTS") return EdgeType::Implements;
    if (name == "DEPENDS_ON") return EdgeType::DependsOn;
    if (name == "BLOCKS")     return EdgeType::Blocks;
    throw WeaveError("Unknown edge type: " + name);
}

Edge makeEdge(std::string source_id, std::string target_id, EdgeType type,
              double weight, Metadata metadata) {
    Edge e;
    e.id = generateId();
    e.source_id = std::move(source_id);
    e.target_id = std::move(target_id);
    e.type = type;
    e.weight = weight;
    e.metadata = metadata.is_object() ? std::move(metadata) : Metadata::object();
    e.created_at = now();
    e.updated_at = e.created_at;
    return e;
}

Edge makeRelates(std::string source_id, std::string target_id, double weight) {
    return makeEdge(std::move(source_id), std::move(target_id), EdgeType::Relates, weight);
}

Edge makeCauses(std::string source_id, std::string target_id, double weight) {
    return makeEdge(std::move(source_id), std::move(target_id), EdgeType::Causes, weight);
}

Edge makeCorrects(std::string correction_id, std::string error_id, double weight) {
    return makeEdge(std::move(correction_id), std::move(error_id), EdgeType::Corrects, weight);
}

Edge makeImplements(std::string code_entity_id, std::string decision_id, double weight) {
    return makeEdge(std::move(code_entity_id), std::move(decision_id), EdgeType::Implements, weight);
}

Edge makeDependsOn(std::string source_id, std::string target_id, double weight) {
    return makeEdge(std::move(source_id), std::move(target_id), EdgeType::DependsOn, weight);
}

Edge makeBlocks(std::string blocker_id, std::string blocked_id, double weight) {
    return makeEdge(std::move(blocker_id), std::move(blocked_id), EdgeType::Blocks, weight);
}

Edge applyPatch(const Edge& edge, const EdgePatch& patch) {
    Edge updated = edge;
    if (patch.type) updated.type = *patch.type;
    if (patch.weight) updated.weight = *patch.weight;
    if (patch.metadata) updated.metadata = *patch.metadata;
    updated.updated_at = now();
    return updated;
}

} // namespace weave
