#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace weave {
namespace log {

/// The shared "weave" logger (stderr, colour). Created on first use.
std::shared_ptr<spdlog::logger> get();

/// Accepts trace|debug|info|warn|error|off; unknown names are treated as info.
void setLevel(const std::string& level);

} // namespace log
} // namespace weave
