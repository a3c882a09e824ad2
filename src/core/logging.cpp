#include <wirebind/core/logging.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace wirebind::logging {

std::optional<spdlog::level::level_enum> parseLevel(std::string_view level) {
    std::string v;
    v.reserve(level.size());
    for (char c : level)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical")
        return spdlog::level::critical;
    if (v == "off")
        return spdlog::level::off;
    return std::nullopt;
}

bool configure(std::string_view level) {
    auto lvl = parseLevel(level);
    if (!lvl) {
        spdlog::warn("Ignoring unknown log level '{}'", level);
        return false;
    }
    spdlog::set_level(*lvl);
    return true;
}

void configureFromEnvironment(std::string_view fallback) {
    if (const char* envLvl = std::getenv("WIREBIND_LOG_LEVEL"); envLvl && *envLvl) {
        if (configure(envLvl)) {
            return;
        }
    }
    if (!fallback.empty()) {
        configure(fallback);
    }
}

} // namespace wirebind::logging
