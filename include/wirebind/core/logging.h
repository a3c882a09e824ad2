#pragma once

#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

namespace wirebind::logging {

// Accepts trace|debug|info|warn|warning|error|err|critical|off, case-insensitive.
std::optional<spdlog::level::level_enum> parseLevel(std::string_view level);

// Apply a textual level to the default logger. Unknown levels leave it untouched.
bool configure(std::string_view level);

// Precedence: env WIREBIND_LOG_LEVEL > fallback (when non-empty) > logger default.
void configureFromEnvironment(std::string_view fallback = {});

} // namespace wirebind::logging
