#include "persistence/provider_registry.hpp"
#include "graph/errors.hpp"
#include "log/log.hpp"
#include "persistence/json_file_provider.hpp"
#include "persistence/memory_provider.hpp"
#include "persistence/sqlite_provider.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace weave {

namespace {

std::string normalize(const std::string& name) {
    std::string out = name;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

ProviderRegistry::ProviderRegistry() {
    registerProvider("json", [](const PersistenceConfig& config) -> std::unique_ptr<Provider> {
        return std::make_unique<JsonFileProvider>(config.data_dir);
    });
    registerProvider("memory", [](const PersistenceConfig&) -> std::unique_ptr<Provider> {
        return std::make_unique<MemoryProvider>();
    });
    registerProvider("sqlite", [](const PersistenceConfig& config) -> std::unique_ptr<Provider> {
        std::filesystem::path file(config.sqlite_file);
        if (file.is_relative() && config.sqlite_file != ":memory:") {
            file = std::filesystem::path(config.data_dir) / file;
        }
        return std::make_unique<SqliteProvider>(file.string());
    });
}

void ProviderRegistry::registerProvider(const std::string& name, ProviderFactory factory) {
    if (!factory) {
        throw WeaveError("Provider factory for \"" + name + "\" is empty");
    }
    factories_[normalize(name)] = std::move(factory);
}

bool ProviderRegistry::has(const std::string& name) const {
    return factories_.count(normalize(name)) > 0;
}

std::vector<std::string> ProviderRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& [name, _] : factories_) result.push_back(name);
    return result;
}

std::unique_ptr<Provider> ProviderRegistry::create(const std::string& name,
                                                   const PersistenceConfig& config) const {
    auto it = factories_.find(normalize(name));
    if (it == factories_.end()) {
        throw UnknownProviderError(name);
    }
    return it->second(config);
}

std::unique_ptr<Provider> ProviderRegistry::resolve(const PersistenceConfig& config) const {
    std::string name = config.provider;
    if (name.empty()) {
        const char* env = std::getenv("WEAVE_PROVIDER");
        if (env && *env) {
            name = env;
        } else {
            name = "json";
            log::get()->info("No storage provider configured, defaulting to json in {}",
                             config.data_dir);
        }
    }
    log::get()->info("Using storage provider \"{}\"", normalize(name));
    return create(name, config);
}

} // namespace weave
