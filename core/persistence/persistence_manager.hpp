#pragma once

#include "graph/graph_snapshot.hpp"
#include "graph/graph_store.hpp"
#include "persistence/provider.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weave {

struct SessionInfo {
    std::string chat_id;
    Timestamp created_at;
    Timestamp updated_at;
    size_t node_count = 0;
    size_t edge_count = 0;
};

// ─── PersistenceManager ────────────────────────────────────────
// Saves and loads session graphs through a Provider under the key
// "graph:<chatId>". The chat id is stored verbatim; physical naming is
// the provider's job.

class PersistenceManager {
public:
    explicit PersistenceManager(std::shared_ptr<Provider> provider);

    static std::string graphKey(const std::string& chat_id) { return "graph:" + chat_id; }

    void saveGraph(const GraphStore& graph);
    void saveSnapshot(const GraphSnapshot& snapshot);

    /// nullopt if nothing is stored. Throws SnapshotFormatError if the
    /// stored document is malformed.
    std::optional<GraphSnapshot> loadSnapshot(const std::string& chat_id);
    std::optional<GraphStore> loadGraph(const std::string& chat_id);
    GraphStore loadOrCreateGraph(const std::string& chat_id,
                                 double compression_threshold = 0.75);

    bool graphExists(const std::string& chat_id);
    /// No-op if absent.
    void deleteGraph(const std::string& chat_id);
    /// Sorted by chat id.
    std::vector<SessionInfo> listSessions();

    void setProvider(std::shared_ptr<Provider> provider);
    const std::shared_ptr<Provider>& provider() const { return provider_; }

private:
    std::shared_ptr<Provider> provider_;
};

} // namespace weave
