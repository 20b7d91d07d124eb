#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace weave {

// ─── Provider ──────────────────────────────────────────────────
// Key-value storage contract for JSON documents. Keys are namespaced by
// convention ("graph:<chatId>") so several subsystems can share one store.
//
// - get() on a missing key returns nullopt
// - remove() on a missing key is a no-op
// - list()/clear() with an empty prefix cover every key
// - after close() every call throws ProviderClosedError
// - I/O and decoding failures throw StorageError

class Provider {
public:
    virtual ~Provider() = default;

    virtual std::optional<nlohmann::json> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const nlohmann::json& value) = 0;
    virtual void remove(const std::string& key) = 0;
    /// Sorted ascending.
    virtual std::vector<std::string> list(const std::string& prefix = "") = 0;
    virtual void clear(const std::string& prefix = "") = 0;
    virtual void close() = 0;

    virtual bool isClosed() const = 0;
    virtual std::string name() const = 0;
};

} // namespace weave
