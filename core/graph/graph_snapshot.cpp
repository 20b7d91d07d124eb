#include "graph/graph_snapshot.hpp"
#include "graph/errors.hpp"
#include "log/log.hpp"

namespace weave {

using nlohmann::json;

namespace {

const json& field(const json& j, const char* key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw SnapshotFormatError(where + ": missing field \"" + key + "\"");
    }
    return j.at(key);
}

std::string stringField(const json& j, const char* key, const std::string& where) {
    const json& v = field(j, key, where);
    if (!v.is_string()) {
        throw SnapshotFormatError(where + ": field \"" + key + "\" must be a string");
    }
    return v.get<std::string>();
}

Timestamp timeField(const json& j, const char* key, const std::string& where) {
    std::string text = stringField(j, key, where);
    try {
        return fromIso8601(text);
    } catch (const WeaveError& e) {
        throw SnapshotFormatError(where + ": " + e.what());
    }
}

Metadata metadataField(const json& j, const std::string& where) {
    if (!j.contains("metadata") || j.at("metadata").is_null()) return Metadata::object();
    const json& m = j.at("metadata");
    if (!m.is_object()) {
        throw SnapshotFormatError(where + ": metadata must be an object");
    }
    return m;
}

} // namespace

// ─── Encoding ──────────────────────────────────────────────────

json nodeToJson(const Node& node) {
    json j = {
        {"id", node.id},
        {"type", toString(node.type)},
        {"label", node.label},
        {"metadata", node.metadata.is_object() ? node.metadata : Metadata::object()},
        {"frequency", node.frequency},
        {"createdAt", toIso8601(node.created_at)},
        {"updatedAt", toIso8601(node.updated_at)},
    };
    if (node.description) j["description"] = *node.description;
    return j;
}

json edgeToJson(const Edge& edge) {
    return {
        {"id", edge.id},
        {"sourceId", edge.source_id},
        {"targetId", edge.target_id},
        {"type", toString(edge.type)},
        {"weight", edge.weight},
        {"metadata", edge.metadata.is_object() ? edge.metadata : Metadata::object()},
        {"createdAt", toIso8601(edge.created_at)},
        {"updatedAt", toIso8601(edge.updated_at)},
    };
}

json snapshotToJson(const GraphSnapshot& snapshot) {
    json nodes = json::object();
    for (const auto& [id, node] : snapshot.nodes) nodes[id] = nodeToJson(node);

    json edges = json::object();
    for (const auto& [id, edge] : snapshot.edges) edges[id] = edgeToJson(edge);

    const SnapshotMetadata& m = snapshot.metadata;
    return {
        {"nodes", std::move(nodes)},
        {"edges", std::move(edges)},
        {"metadata", {
            {"chatId", m.chat_id},
            {"version", m.version},
            {"createdAt", toIso8601(m.created_at)},
            {"updatedAt", toIso8601(m.updated_at)},
            {"compressionThreshold", m.compression_threshold},
        }},
    };
}

// ─── Decoding ──────────────────────────────────────────────────

Node nodeFromJson(const json& j) {
    if (!j.is_object()) throw SnapshotFormatError("node must be an object");
    Node n;
    n.id = stringField(j, "id", "node");
    std::string where = "node " + n.id;

    try {
        n.type = parseNodeType(stringField(j, "type", where));
    } catch (const SnapshotFormatError&) {
        throw;
    } catch (const WeaveError& e) {
        throw SnapshotFormatError(where + ": " + e.what());
    }

    n.label = stringField(j, "label", where);
    if (j.contains("description") && !j.at("description").is_null()) {
        n.description = stringField(j, "description", where);
    }
    n.metadata = metadataField(j, where);

    if (j.contains("frequency") && !j.at("frequency").is_null()) {
        const json& f = j.at("frequency");
        if (f.is_number_unsigned()) {
            n.frequency = f.get<uint64_t>();
        } else if (f.is_number_integer() && f.get<int64_t>() >= 0) {
            n.frequency = static_cast<uint64_t>(f.get<int64_t>());
        } else {
            throw SnapshotFormatError(where + ": frequency must be a non-negative integer");
        }
    }

    n.created_at = timeField(j, "createdAt", where);
    n.updated_at = timeField(j, "updatedAt", where);
    return n;
}

Edge edgeFromJson(const json& j) {
    if (!j.is_object()) throw SnapshotFormatError("edge must be an object");
    Edge e;
    e.id = stringField(j, "id", "edge");
    std::string where = "edge " + e.id;

    e.source_id = stringField(j, "sourceId", where);
    e.target_id = stringField(j, "targetId", where);
    try {
        e.type = parseEdgeType(stringField(j, "type", where));
    } catch (const SnapshotFormatError&) {
        throw;
    } catch (const WeaveError& ex) {
        throw SnapshotFormatError(where + ": " + ex.what());
    }

    if (j.contains("weight") && !j.at("weight").is_null()) {
        const json& w = j.at("weight");
        if (!w.is_number()) throw SnapshotFormatError(where + ": weight must be a number");
        e.weight = w.get<double>();
    }
    e.metadata = metadataField(j, where);
    e.created_at = timeField(j, "createdAt", where);
    e.updated_at = timeField(j, "updatedAt", where);
    return e;
}

GraphSnapshot snapshotFromJson(const json& j) {
    try {
        if (!j.is_object()) throw SnapshotFormatError("top level must be an object");

        GraphSnapshot snap;

        const json& meta = field(j, "metadata", "snapshot");
        snap.metadata.chat_id = stringField(meta, "chatId", "metadata");
        if (meta.contains("version") && meta.at("version").is_string()) {
            snap.metadata.version = meta.at("version").get<std::string>();
        }
        snap.metadata.created_at = timeField(meta, "createdAt", "metadata");
        snap.metadata.updated_at = timeField(meta, "updatedAt", "metadata");

        const json& threshold = field(meta, "compressionThreshold", "metadata");
        if (!threshold.is_number()) {
            throw SnapshotFormatError("metadata: compressionThreshold must be a number");
        }
        snap.metadata.compression_threshold = threshold.get<double>();
        if (!(snap.metadata.compression_threshold > 0.0 &&
              snap.metadata.compression_threshold <= 1.0)) {
            throw SnapshotFormatError("metadata: compressionThreshold must be in (0, 1]");
        }

        const json& nodes = field(j, "nodes", "snapshot");
        if (!nodes.is_object()) throw SnapshotFormatError("nodes must be an id-keyed object");
        for (const auto& [key, value] : nodes.items()) {
            Node n = nodeFromJson(value);
            if (n.id != key) {
                throw SnapshotFormatError("node key " + key + " does not match id " + n.id);
            }
            snap.nodes.emplace(key, std::move(n));
        }

        const json& edges = field(j, "edges", "snapshot");
        if (!edges.is_object()) throw SnapshotFormatError("edges must be an id-keyed object");
        for (const auto& [key, value] : edges.items()) {
            Edge e = edgeFromJson(value);
            if (e.id != key) {
                throw SnapshotFormatError("edge key " + key + " does not match id " + e.id);
            }
            if (!snap.nodes.count(e.source_id) || !snap.nodes.count(e.target_id)) {
                throw SnapshotFormatError("edge " + e.id + " references a missing node");
            }
            snap.edges.emplace(key, std::move(e));
        }
        return snap;
    } catch (const SnapshotFormatError& e) {
        log::get()->warn("Rejecting snapshot: {}", e.what());
        throw;
    } catch (const json::exception& e) {
        log::get()->warn("Rejecting snapshot: {}", e.what());
        throw SnapshotFormatError(e.what());
    }
}

} // namespace weave
