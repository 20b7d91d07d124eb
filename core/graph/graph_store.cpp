#include "graph/graph_store.hpp"
#include "graph/errors.hpp"
#include "log/log.hpp"
#include "plasticity/hebbian_weights.hpp"
#include "synapse/synaptic_linker.hpp"

#include <algorithm>
#include <cctype>

namespace weave {

namespace {

std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename Map, typename Key>
void eraseFromBucket(Map& index, const Key& key, const std::string& id) {
    auto it = index.find(key);
    if (it == index.end()) return;
    it->second.erase(id);
    if (it->second.empty()) index.erase(it);
}

bool byCreation(const Node& a, const Node& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
}

bool edgeByCreation(const Edge& a, const Edge& b) {
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
}

} // namespace

GraphStore::GraphStore(std::string chat_id, const CompressionConfig& compression)
    : GraphStore(std::move(chat_id), compression.threshold) {}

GraphStore::GraphStore(std::string chat_id, double compression_threshold)
    : chat_id_(std::move(chat_id)),
      compression_threshold_(compression_threshold),
      created_at_(now()),
      updated_at_(created_at_) {
    if (!(compression_threshold_ > 0.0 && compression_threshold_ <= 1.0)) {
        throw WeaveError("compression threshold must be in (0, 1], got " +
                         std::to_string(compression_threshold_));
    }
}

void GraphStore::touch() {
    updated_at_ = now();
}

// ─── Node operations ───────────────────────────────────────────

const Node& GraphStore::insertNode(Node node) {
    if (node.id.empty()) {
        throw PolicyViolationError("Node id must not be empty");
    }
    if (nodes_.count(node.id)) {
        throw PolicyViolationError("Node ID already exists: " + node.id);
    }

    std::string id = node.id;
    nodes_by_label_[lowercase(node.label)].insert(id);
    nodes_by_type_[node.type].insert(id);
    outgoing_[id];
    incoming_[id];

    auto [it, _] = nodes_.emplace(id, std::move(node));
    touch();
    log::get()->trace("Added node {} ({})", id, toString(it->second.type));
    return it->second;
}

Node GraphStore::addNode(Node node) {
    Node stored = insertNode(std::move(node));
    if (linker_) {
        linker_->linkRetroactively(stored, *this);
    }
    return stored;
}

const Node* GraphStore::getNode(const std::string& id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::optional<Node> GraphStore::updateNode(const std::string& id, const NodePatch& patch) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;

    Node updated = applyPatch(it->second, patch);

    if (updated.label != it->second.label) {
        std::string old_key = lowercase(it->second.label);
        std::string new_key = lowercase(updated.label);
        if (old_key != new_key) {
            eraseFromBucket(nodes_by_label_, old_key, id);
            nodes_by_label_[new_key].insert(id);
        }
    }
    if (updated.type != it->second.type) {
        eraseFromBucket(nodes_by_type_, it->second.type, id);
        nodes_by_type_[updated.type].insert(id);
    }

    it->second = std::move(updated);
    touch();
    return it->second;
}

std::optional<Node> GraphStore::incrementFrequency(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return std::nullopt;
    it->second.frequency += 1;
    it->second.updated_at = now();
    touch();
    return it->second;
}

bool GraphStore::deleteNode(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    // Remove all connected edges
    std::vector<std::string> edges_to_remove;
    auto out = outgoing_.find(id);
    if (out != outgoing_.end()) {
        edges_to_remove.insert(edges_to_remove.end(), out->second.begin(), out->second.end());
    }
    auto in = incoming_.find(id);
    if (in != incoming_.end()) {
        edges_to_remove.insert(edges_to_remove.end(), in->second.begin(), in->second.end());
    }
    for (const auto& eid : edges_to_remove) {
        deleteEdge(eid);  // a self-loop shows up twice; the second call is a no-op
    }

    eraseFromBucket(nodes_by_label_, lowercase(it->second.label), id);
    eraseFromBucket(nodes_by_type_, it->second.type, id);
    outgoing_.erase(id);
    incoming_.erase(id);
    nodes_.erase(it);
    touch();
    return true;
}

// ─── Edge operations ───────────────────────────────────────────

const Edge& GraphStore::insertEdge(Edge edge) {
    if (edge.id.empty()) {
        throw PolicyViolationError("Edge id must not be empty");
    }
    if (edges_.count(edge.id)) {
        throw PolicyViolationError("Edge ID already exists: " + edge.id);
    }
    if (!nodes_.count(edge.source_id)) throw NodeNotFoundError(edge.source_id);
    if (!nodes_.count(edge.target_id)) throw NodeNotFoundError(edge.target_id);

    std::string id = edge.id;
    outgoing_[edge.source_id].insert(id);
    incoming_[edge.target_id].insert(id);
    edges_by_type_[edge.type].insert(id);

    auto [it, _] = edges_.emplace(id, std::move(edge));
    touch();
    log::get()->trace("Added edge {} {} -> {}", toString(it->second.type),
                      it->second.source_id, it->second.target_id);
    return it->second;
}

Edge GraphStore::addEdge(Edge edge) {
    return insertEdge(std::move(edge));
}

const Edge* GraphStore::getEdge(const std::string& id) const {
    auto it = edges_.find(id);
    return it != edges_.end() ? &it->second : nullptr;
}

std::optional<Edge> GraphStore::updateEdge(const std::string& id, const EdgePatch& patch) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return std::nullopt;

    Edge updated = applyPatch(it->second, patch);
    if (updated.type != it->second.type) {
        eraseFromBucket(edges_by_type_, it->second.type, id);
        edges_by_type_[updated.type].insert(id);
    }
    it->second = std::move(updated);
    touch();
    return it->second;
}

std::optional<Edge> GraphStore::reinforceEdge(const std::string& id, double factor) {
    const Edge* edge = getEdge(id);
    if (!edge) return std::nullopt;
    EdgePatch patch;
    patch.weight = edge->weight * factor;
    return updateEdge(id, patch);
}

void GraphStore::unindexEdge(const Edge& edge) {
    auto out = outgoing_.find(edge.source_id);
    if (out != outgoing_.end()) out->second.erase(edge.id);
    auto in = incoming_.find(edge.target_id);
    if (in != incoming_.end()) in->second.erase(edge.id);
    eraseFromBucket(edges_by_type_, edge.type, edge.id);
}

bool GraphStore::deleteEdge(const std::string& id) {
    auto it = edges_.find(id);
    if (it == edges_.end()) return false;

    unindexEdge(it->second);
    edges_.erase(it);
    touch();
    return true;
}

// ─── Adjacency ─────────────────────────────────────────────────

std::vector<Edge> GraphStore::edgesFrom(const std::string& node_id) const {
    std::vector<Edge> result;
    auto it = outgoing_.find(node_id);
    if (it == outgoing_.end()) return result;
    for (const auto& eid : it->second) {
        auto e = edges_.find(eid);
        if (e != edges_.end()) result.push_back(e->second);
    }
    return result;
}

std::vector<Edge> GraphStore::edgesTo(const std::string& node_id) const {
    std::vector<Edge> result;
    auto it = incoming_.find(node_id);
    if (it == incoming_.end()) return result;
    for (const auto& eid : it->second) {
        auto e = edges_.find(eid);
        if (e != edges_.end()) result.push_back(e->second);
    }
    return result;
}

// ─── Queries ───────────────────────────────────────────────────

void GraphStore::strengthenResults(const std::vector<Node>& results) {
    if (!hebbian_ || results.size() < 2) return;
    std::vector<std::string> ids;
    ids.reserve(results.size());
    for (const auto& n : results) ids.push_back(n.id);
    hebbian_->strengthenCoActivated(ids, *this);
}

std::vector<Node> GraphStore::queryByLabel(const std::string& substring) {
    std::string needle = lowercase(substring);

    std::vector<Node> results;
    for (const auto& [label, ids] : nodes_by_label_) {
        if (label.find(needle) == std::string::npos) continue;
        for (const auto& id : ids) {
            auto it = nodes_.find(id);
            if (it != nodes_.end()) results.push_back(it->second);
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const Node& a, const Node& b) {
        return a.frequency > b.frequency;
    });

    strengthenResults(results);
    return results;
}

std::vector<Node> GraphStore::queryByType(NodeType type) {
    std::vector<Node> results;
    auto bucket = nodes_by_type_.find(type);
    if (bucket != nodes_by_type_.end()) {
        for (const auto& id : bucket->second) {
            auto it = nodes_.find(id);
            if (it != nodes_.end()) results.push_back(it->second);
        }
    }
    std::sort(results.begin(), results.end(), byCreation);

    strengthenResults(results);
    return results;
}

std::vector<Edge> GraphStore::queryEdgesByType(EdgeType type) const {
    std::vector<Edge> results;
    auto bucket = edges_by_type_.find(type);
    if (bucket == edges_by_type_.end()) return results;
    for (const auto& id : bucket->second) {
        auto it = edges_.find(id);
        if (it != edges_.end()) results.push_back(it->second);
    }
    std::sort(results.begin(), results.end(), edgeByCreation);
    return results;
}

std::vector<Node> GraphStore::allNodes() const {
    std::vector<Node> result;
    result.reserve(nodes_.size());
    for (const auto& [_, node] : nodes_) result.push_back(node);
    std::sort(result.begin(), result.end(), byCreation);
    return result;
}

std::vector<Edge> GraphStore::allEdges() const {
    std::vector<Edge> result;
    result.reserve(edges_.size());
    for (const auto& [_, edge] : edges_) result.push_back(edge);
    std::sort(result.begin(), result.end(), edgeByCreation);
    return result;
}

GraphStats GraphStore::stats() const {
    GraphStats s;
    s.total_nodes = nodes_.size();
    s.total_edges = edges_.size();
    for (const auto& [type, ids] : nodes_by_type_) s.nodes_by_type[toString(type)] = ids.size();
    for (const auto& [type, ids] : edges_by_type_) s.edges_by_type[toString(type)] = ids.size();
    s.chat_id = chat_id_;
    s.created_at = created_at_;
    s.updated_at = updated_at_;
    return s;
}

// ─── Compression ───────────────────────────────────────────────

size_t GraphStore::contextSize() const {
    size_t total = 0;
    for (const auto& [_, n] : nodes_) total += CompressionEngine::estimateNodeSize(n);
    for (const auto& [_, e] : edges_) total += CompressionEngine::estimateEdgeSize(e);
    return total;
}

double GraphStore::contextWindowUsage(const CompressionEngine& engine) const {
    return engine.calculateContextUsagePercentage(contextSize());
}

bool GraphStore::shouldCompress(const CompressionEngine& engine) const {
    return contextWindowUsage(engine) >= compression_threshold_;
}

std::vector<std::string> GraphStore::compress(CompressionEngine& engine, double target_reduction) {
    std::vector<Node> nodes = allNodes();
    std::vector<Edge> edges = allEdges();

    std::vector<std::string> candidates =
        engine.identifyArchiveCandidates(nodes, edges, target_reduction);
    engine.archiveNodes(candidates, nodes, edges);

    for (const auto& id : candidates) {
        deleteNode(id);
    }

    log::get()->debug("Compressed session {}: archived {} of {} node(s)",
                      chat_id_, candidates.size(), nodes.size());
    return candidates;
}

size_t GraphStore::restoreArchived(CompressionEngine& engine,
                                   const std::vector<std::string>& node_ids) {
    // An id that is active again keeps its archived copy (and edges).
    std::vector<std::string> wanted;
    wanted.reserve(node_ids.size());
    for (const auto& id : node_ids) {
        if (nodes_.count(id) && engine.isArchived(id)) {
            log::get()->warn("Node {} is active again, leaving its archived copy in place", id);
            continue;
        }
        wanted.push_back(id);
    }

    RestoredArchive restored = engine.restoreNodes(wanted);

    size_t node_count = 0;
    for (auto& node : restored.nodes) {
        insertNode(std::move(node));
        node_count++;
    }

    size_t edge_count = 0;
    for (auto& edge : restored.edges) {
        if (edges_.count(edge.id)) continue;
        if (!nodes_.count(edge.source_id) || !nodes_.count(edge.target_id)) {
            log::get()->debug("Dropping archived edge {}: endpoint no longer present", edge.id);
            continue;
        }
        insertEdge(std::move(edge));
        edge_count++;
    }

    log::get()->debug("Restored {} node(s) and {} edge(s) into session {}",
                      node_count, edge_count, chat_id_);
    return node_count;
}

// ─── Error suppression ─────────────────────────────────────────

Correction GraphStore::suppressError(const std::string& error_id, const std::string& label,
                                     std::optional<std::string> description) {
    const Node* error = getNode(error_id);
    if (!error) throw NodeNotFoundError(error_id);
    if (error->type != NodeType::Error) {
        throw PolicyViolationError("Node must be an ERROR type: " + error_id);
    }

    Node suppressed = ErrorSuppression::suppressNode(*error);
    NodePatch patch;
    patch.metadata = suppressed.metadata;
    updateNode(error_id, patch);

    Correction correction = ErrorSuppression::createCorrection(error_id, label,
                                                               std::move(description));
    correction.correction_node = addNode(correction.correction_node);
    correction.correction_edge = addEdge(correction.correction_edge);
    return correction;
}

std::map<std::string, CorrectedError> GraphStore::correctedErrors() const {
    return ErrorSuppression::findCorrectedErrors(allNodes(), allEdges());
}

std::vector<Node> GraphStore::uncorrectedErrors() const {
    return ErrorSuppression::findUncorrectedErrors(allNodes(), allEdges());
}

// ─── Snapshots ─────────────────────────────────────────────────

GraphSnapshot GraphStore::snapshot() const {
    GraphSnapshot snap;
    for (const auto& [id, node] : nodes_) snap.nodes.emplace(id, node);
    for (const auto& [id, edge] : edges_) snap.edges.emplace(id, edge);
    snap.metadata.chat_id = chat_id_;
    snap.metadata.version = version_;
    snap.metadata.created_at = created_at_;
    snap.metadata.updated_at = updated_at_;
    snap.metadata.compression_threshold = compression_threshold_;
    return snap;
}

GraphStore GraphStore::restore(const GraphSnapshot& snapshot) {
    GraphStore store(snapshot.metadata.chat_id, snapshot.metadata.compression_threshold);
    try {
        for (const auto& [_, node] : snapshot.nodes) store.insertNode(node);
        for (const auto& [_, edge] : snapshot.edges) store.insertEdge(edge);
    } catch (const WeaveError& e) {
        throw SnapshotFormatError(e.what());
    }
    store.version_ = snapshot.metadata.version;
    store.created_at_ = snapshot.metadata.created_at;
    store.updated_at_ = snapshot.metadata.updated_at;
    return store;
}

void GraphStore::clear() {
    nodes_.clear();
    edges_.clear();
    nodes_by_label_.clear();
    nodes_by_type_.clear();
    edges_by_type_.clear();
    outgoing_.clear();
    incoming_.clear();
    touch();
}

} // namespace weave
