#include "core/types.hpp"

namespace mcpterm {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Transport:
      return "transport error";
    case ErrorKind::Protocol:
      return "protocol error";
    case ErrorKind::NotFound:
      return "not found";
    case ErrorKind::Ambiguous:
      return "ambiguous";
    case ErrorKind::Configuration:
      return "configuration error";
    case ErrorKind::Usage:
      return "usage error";
  }
  return "unknown error";
}

std::string Error::describe() const {
  std::string out = to_string(kind);

  if (!server.empty() || !tool.empty()) {
    out += " [";
    out += server;
    if (!server.empty() && !tool.empty()) out += ":";
    out += tool;
    out += "]";
  }

  out += ": " + message;

  if (!candidates.empty()) {
    out += " (candidates: ";
    for (size_t i = 0; i < candidates.size(); ++i) {
      if (i > 0) out += ", ";
      out += candidates[i];
    }
    out += ")";
  }
  return out;
}

}  // namespace mcpterm
