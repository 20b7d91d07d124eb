#include "log/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace weave {
namespace log {

std::shared_ptr<spdlog::logger> get() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto existing = spdlog::get("weave");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("weave");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return logger;
}

void setLevel(const std::string& level) {
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only honour "off" when asked for.
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    get()->set_level(parsed);
}

} // namespace log
} // namespace weave
