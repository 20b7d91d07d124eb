#include "persistence/persistence_manager.hpp"
#include "graph/errors.hpp"
#include "log/log.hpp"

namespace weave {

namespace {

const std::string kGraphPrefix = "graph:";

} // namespace

PersistenceManager::PersistenceManager(std::shared_ptr<Provider> provider)
    : provider_(std::move(provider)) {
    if (!provider_) {
        throw WeaveError("PersistenceManager requires a provider");
    }
}

void PersistenceManager::setProvider(std::shared_ptr<Provider> provider) {
    if (!provider) {
        throw WeaveError("PersistenceManager requires a provider");
    }
    provider_ = std::move(provider);
}

void PersistenceManager::saveGraph(const GraphStore& graph) {
    saveSnapshot(graph.snapshot());
}

void PersistenceManager::saveSnapshot(const GraphSnapshot& snapshot) {
    provider_->set(graphKey(snapshot.metadata.chat_id), snapshotToJson(snapshot));
    log::get()->debug("Saved session {} ({} nodes, {} edges) via {}",
                      snapshot.metadata.chat_id, snapshot.nodes.size(),
                      snapshot.edges.size(), provider_->name());
}

std::optional<GraphSnapshot> PersistenceManager::loadSnapshot(const std::string& chat_id) {
    std::optional<nlohmann::json> raw = provider_->get(graphKey(chat_id));
    if (!raw) return std::nullopt;
    GraphSnapshot snapshot = snapshotFromJson(*raw);
    log::get()->debug("Loaded session {} ({} nodes, {} edges) via {}", chat_id,
                      snapshot.nodes.size(), snapshot.edges.size(), provider_->name());
    return snapshot;
}

std::optional<GraphStore> PersistenceManager::loadGraph(const std::string& chat_id) {
    std::optional<GraphSnapshot> snapshot = loadSnapshot(chat_id);
    if (!snapshot) return std::nullopt;
    return GraphStore::restore(*snapshot);
}

GraphStore PersistenceManager::loadOrCreateGraph(const std::string& chat_id,
                                                 double compression_threshold) {
    std::optional<GraphStore> loaded = loadGraph(chat_id);
    if (loaded) return std::move(*loaded);
    return GraphStore(chat_id, compression_threshold);
}

bool PersistenceManager::graphExists(const std::string& chat_id) {
    return provider_->get(graphKey(chat_id)).has_value();
}

void PersistenceManager::deleteGraph(const std::string& chat_id) {
    provider_->remove(graphKey(chat_id));
}

std::vector<SessionInfo> PersistenceManager::listSessions() {
    std::vector<SessionInfo> sessions;
    for (const auto& key : provider_->list(kGraphPrefix)) {
        std::string chat_id = key.substr(kGraphPrefix.size());
        std::optional<GraphSnapshot> snapshot = loadSnapshot(chat_id);
        if (!snapshot) continue;

        SessionInfo info;
        info.chat_id = chat_id;
        info.created_at = snapshot->metadata.created_at;
        info.updated_at = snapshot->metadata.updated_at;
        info.node_count = snapshot->nodes.size();
        info.edge_count = snapshot->edges.size();
        sessions.push_back(std::move(info));
    }
    return sessions;
}

} // namespace weave
