#pragma once

#include "config/config.hpp"
#include "persistence/provider.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace weave {

using ProviderFactory = std::function<std::unique_ptr<Provider>(const PersistenceConfig&)>;

// ─── ProviderRegistry ──────────────────────────────────────────
// Name → factory. Names are case-insensitive. Built-ins:
//   "json"   → JsonFileProvider(data_dir)
//   "memory" → MemoryProvider
//   "sqlite" → SqliteProvider(data_dir / sqlite_file)

class ProviderRegistry {
public:
    ProviderRegistry();

    /// Adds or replaces the factory for `name`.
    void registerProvider(const std::string& name, ProviderFactory factory);
    bool has(const std::string& name) const;
    std::vector<std::string> names() const;

    /// Throws UnknownProviderError for an unregistered name.
    std::unique_ptr<Provider> create(const std::string& name,
                                     const PersistenceConfig& config) const;

    /// create() with the name taken from config.provider, falling back to
    /// WEAVE_PROVIDER and then "json".
    std::unique_ptr<Provider> resolve(const PersistenceConfig& config) const;

private:
    std::map<std::string, ProviderFactory> factories_;
};

} // namespace weave
