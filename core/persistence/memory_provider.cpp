#include "persistence/memory_provider.hpp"
#include "graph/errors.hpp"

namespace weave {

void MemoryProvider::assertOpen() const {
    if (closed_) throw ProviderClosedError(name());
}

std::optional<nlohmann::json> MemoryProvider::get(const std::string& key) {
    assertOpen();
    auto it = store_.find(key);
    if (it == store_.end()) return std::nullopt;
    return it->second;
}

void MemoryProvider::set(const std::string& key, const nlohmann::json& value) {
    assertOpen();
    store_[key] = value;
}

void MemoryProvider::remove(const std::string& key) {
    assertOpen();
    store_.erase(key);
}

std::vector<std::string> MemoryProvider::list(const std::string& prefix) {
    assertOpen();
    std::vector<std::string> keys;
    for (auto it = store_.lower_bound(prefix); it != store_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        keys.push_back(it->first);
    }
    return keys;
}

void MemoryProvider::clear(const std::string& prefix) {
    assertOpen();
    if (prefix.empty()) {
        store_.clear();
        return;
    }
    auto it = store_.lower_bound(prefix);
    while (it != store_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = store_.erase(it);
    }
}

void MemoryProvider::close() {
    closed_ = true;
    store_.clear();
}

} // namespace weave
