#pragma once

#include "compression/compression_engine.hpp"
#include "plasticity/hebbian_weights.hpp"
#include "synapse/synaptic_linker.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace weave {

struct PersistenceConfig {
    std::string provider;                   // empty: WEAVE_PROVIDER, then "json"
    std::string data_dir = "./weave-data";
    std::string sqlite_file = "weave.db";   // relative paths resolve under data_dir
};

// ─── WeaveConfig ───────────────────────────────────────────────
// Every tunable in one place. Precedence, lowest first:
//   built-in defaults → JSON config file → WEAVE_* environment variables
//
// File layout (all sections and keys optional, unknown keys ignored):
// {
//   "log_level": "info",
//   "linker":      { "threshold": 0.72, "max_connections": 20 },
//   "hebbian":     { "strength": 0.1, "decay_rate": 0.99, ... },
//   "compression": { "max_context_bytes": 100000, "threshold": 0.75, ... },
//   "persistence": { "provider": "json", "data_dir": "./weave-data", ... }
// }

struct WeaveConfig {
    LinkerConfig linker;
    HebbianConfig hebbian;
    CompressionConfig compression;
    PersistenceConfig persistence;
    std::string log_level = "info";
};

/// Overlay the keys present in `j` onto `base`.
/// Throws WeaveError on a value of the wrong type.
WeaveConfig parseConfig(const nlohmann::json& j, WeaveConfig base = {});

/// parseConfig() over the file at `path`. Throws WeaveError if the file
/// cannot be read or is not valid JSON.
WeaveConfig loadConfigFile(const std::string& path, WeaveConfig base = {});

/// WEAVE_PROVIDER, WEAVE_DATA_DIR and WEAVE_LOG_LEVEL override their fields
/// when set and non-empty.
void applyEnvironment(WeaveConfig& config);

/// Startup path: defaults, then the file at `config_path` (skipped when
/// empty), then the environment. Applies log_level to the shared logger.
WeaveConfig configure(const std::string& config_path = "");

} // namespace weave
