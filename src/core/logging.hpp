#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace mcpterm {

// Map a level name ("trace", "debug", "info", "warn", "error", "critical", "off")
// to a spdlog level. Unknown names log a warning and yield `fallback`.
spdlog::level::level_enum parse_log_level(const std::string &name,
                                          spdlog::level::level_enum fallback = spdlog::level::info);

}  // namespace mcpterm
