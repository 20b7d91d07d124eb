#include "config/config.hpp"
#include "graph/errors.hpp"
#include "log/log.hpp"

#include <cstdlib>
#include <fstream>

namespace weave {

namespace {

using nlohmann::json;

void readNumber(const json& section, const char* key, double& out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    if (!it->is_number()) {
        throw WeaveError(std::string("config: \"") + key + "\" must be a number");
    }
    out = it->get<double>();
}

template <typename Unsigned>
void readCount(const json& section, const char* key, Unsigned& out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    if (!it->is_number_unsigned()) {
        throw WeaveError(std::string("config: \"") + key +
                         "\" must be a non-negative integer");
    }
    out = it->get<Unsigned>();
}

void readString(const json& section, const char* key, std::string& out) {
    auto it = section.find(key);
    if (it == section.end()) return;
    if (!it->is_string()) {
        throw WeaveError(std::string("config: \"") + key + "\" must be a string");
    }
    out = it->get<std::string>();
}

const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) {
        throw WeaveError(std::string("config: section \"") + name + "\" must be an object");
    }
    return &*it;
}

std::string env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

WeaveConfig parseConfig(const json& j, WeaveConfig base) {
    if (!j.is_object()) {
        throw WeaveError("config: top level must be an object");
    }

    readString(j, "log_level", base.log_level);

    if (const json* s = section(j, "linker")) {
        readNumber(*s, "threshold", base.linker.threshold);
        readCount(*s, "max_connections", base.linker.max_connections);
        readCount(*s, "embed_workers", base.linker.embed_workers);
    }
    if (const json* s = section(j, "hebbian")) {
        readNumber(*s, "strength", base.hebbian.strength);
        readNumber(*s, "decay_rate", base.hebbian.decay_rate);
        readNumber(*s, "prune_threshold", base.hebbian.prune_threshold);
        readNumber(*s, "max_weight", base.hebbian.max_weight);
    }
    if (const json* s = section(j, "compression")) {
        CompressionConfig& c = base.compression;
        readNumber(*s, "max_context_bytes", c.max_context_bytes);
        readNumber(*s, "threshold", c.threshold);
        readNumber(*s, "target_reduction", c.target_reduction);
        readNumber(*s, "connection_weight", c.connection_weight);
        readNumber(*s, "error_penalty", c.error_penalty);
        readNumber(*s, "error_floor", c.error_floor);
        readNumber(*s, "stale_age_hours", c.stale_age_hours);
        readCount(*s, "stale_frequency", c.stale_frequency);
        readNumber(*s, "stale_factor", c.stale_factor);
    }
    if (const json* s = section(j, "persistence")) {
        readString(*s, "provider", base.persistence.provider);
        readString(*s, "data_dir", base.persistence.data_dir);
        readString(*s, "sqlite_file", base.persistence.sqlite_file);
    }

    if (!(base.compression.threshold > 0.0 && base.compression.threshold <= 1.0)) {
        throw WeaveError("config: compression.threshold must be in (0, 1]");
    }
    if (!(base.compression.target_reduction > 0.0 && base.compression.target_reduction <= 1.0)) {
        throw WeaveError("config: compression.target_reduction must be in (0, 1]");
    }
    if (!(base.compression.max_context_bytes > 0.0)) {
        throw WeaveError("config: compression.max_context_bytes must be positive");
    }
    return base;
}

WeaveConfig loadConfigFile(const std::string& path, WeaveConfig base) {
    std::ifstream in(path);
    if (!in) {
        throw WeaveError("config: cannot open " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::exception& e) {
        throw WeaveError("config: " + path + ": " + e.what());
    }
    return parseConfig(j, std::move(base));
}

void applyEnvironment(WeaveConfig& config) {
    std::string provider = env("WEAVE_PROVIDER");
    if (!provider.empty()) config.persistence.provider = provider;

    std::string data_dir = env("WEAVE_DATA_DIR");
    if (!data_dir.empty()) config.persistence.data_dir = data_dir;

    std::string level = env("WEAVE_LOG_LEVEL");
    if (!level.empty()) config.log_level = level;
}

WeaveConfig configure(const std::string& config_path) {
    WeaveConfig config;
    if (!config_path.empty()) config = loadConfigFile(config_path);
    applyEnvironment(config);
    log::setLevel(config.log_level);
    log::get()->debug("Configured: provider=\"{}\" data_dir={} log_level={}",
                      config.persistence.provider, config.persistence.data_dir,
                      config.log_level);
    return config;
}

} // namespace weave
