#pragma once

namespace mcpterm {

inline constexpr const char *kClientName = "mcp-terminal";
inline constexpr const char *kClientVersion = "1.0.0";

// MCP protocol revision announced during initialize
inline constexpr const char *kProtocolVersion = "2024-11-05";

}  // namespace mcpterm
