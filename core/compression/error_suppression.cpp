#include "compression/error_suppression.hpp"
#include "graph/errors.hpp"

#include <unordered_map>
#include <unordered_set>

namespace weave {

Node ErrorSuppression::suppressNode(const Node& node) {
    if (node.type != NodeType::Error) {
        throw PolicyViolationError("Only ERROR type nodes can be suppressed (node " +
                                   node.id + " is " + toString(node.type) + ")");
    }
    Node suppressed = node;
    if (!suppressed.metadata.is_object()) suppressed.metadata = Metadata::object();
    suppressed.metadata["suppressed"] = true;
    suppressed.metadata["suppressedAt"] = toIso8601(now());
    return suppressed;
}

bool ErrorSuppression::isSuppressed(const Node& node) {
    if (!node.hasMetadata("suppressed")) return false;
    const auto& flag = node.metadata.at("suppressed");
    return flag.is_boolean() && flag.get<bool>();
}

Correction ErrorSuppression::createCorrection(const std::string& error_node_id,
                                              const std::string& label,
                                              std::optional<std::string> description) {
    Correction c;
    c.correction_node = makeCorrection(label, std::move(description));
    c.correction_edge = makeCorrects(c.correction_node.id, error_node_id);
    return c;
}

std::map<std::string, CorrectedError> ErrorSuppression::findCorrectedErrors(
    const std::vector<Node>& nodes, const std::vector<Edge>& edges) {

    std::unordered_map<std::string, const Node*> by_id;
    for (const auto& n : nodes) by_id[n.id] = &n;

    std::map<std::string, CorrectedError> corrected;
    for (const Edge& e : edges) {
        if (e.type != EdgeType::Corrects) continue;

        auto src = by_id.find(e.source_id);
        auto dst = by_id.find(e.target_id);
        if (src == by_id.end() || dst == by_id.end()) continue;
        if (dst->second->type != NodeType::Error) continue;

        auto it = corrected.find(e.target_id);
        if (it == corrected.end()) {
            it = corrected.emplace(e.target_id, CorrectedError{*dst->second, {}}).first;
        }
        it->second.corrections.push_back(*src->second);
    }
    return corrected;
}

std::vector<Node> ErrorSuppression::findUncorrectedErrors(const std::vector<Node>& nodes,
                                                          const std::vector<Edge>& edges) {
    std::unordered_set<std::string> corrected_ids;
    for (const Edge& e : edges) {
        if (e.type == EdgeType::Corrects) corrected_ids.insert(e.target_id);
    }

    std::vector<Node> result;
    for (const Node& n : nodes) {
        if (n.type == NodeType::Error && !corrected_ids.count(n.id)) {
            result.push_back(n);
        }
    }
    return result;
}

} // namespace weave
