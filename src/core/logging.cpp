#include "core/logging.hpp"

#include <algorithm>
#include <cctype>

namespace mcpterm {

spdlog::level::level_enum parse_log_level(const std::string &name, spdlog::level::level_enum fallback) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  // from_str answers "off" for anything it does not know
  auto level = spdlog::level::from_str(lower);
  if (level == spdlog::level::off && lower != "off") {
    spdlog::warn("[Config] Unknown log level '{}', using '{}'", name,
                 spdlog::level::to_string_view(fallback));
    return fallback;
  }
  return level;
}

}  // namespace mcpterm
