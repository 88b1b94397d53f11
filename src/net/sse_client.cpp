#include "net/sse_client.hpp"

namespace mcpterm::net {

bool SseParser::feed(std::string_view chunk) {
  if (stopped_) return false;
  buffer_.append(chunk);

  size_t start = 0;
  while (true) {
    size_t eol = buffer_.find('\n', start);
    if (eol == std::string::npos) break;

    std::string_view line(buffer_.data() + start, eol - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    start = eol + 1;

    if (line.empty()) {
      if (!dispatch()) {
        buffer_.clear();
        return false;
      }
    } else {
      process_line(line);
    }
  }

  buffer_.erase(0, start);
  return true;
}

bool SseParser::flush() {
  if (stopped_) return false;

  if (!buffer_.empty()) {
    std::string rest;
    rest.swap(buffer_);
    std::string_view line(rest);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    if (!line.empty()) process_line(line);
  }
  return dispatch();
}

void SseParser::process_line(std::string_view line) {
  // Comment
  if (line.front() == ':') return;

  std::string_view field = line;
  std::string_view value;
  if (auto colon = line.find(':'); colon != std::string_view::npos) {
    field = line.substr(0, colon);
    value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') value.remove_prefix(1);
  }

  if (field == "data") {
    if (has_data_) current_.data += '\n';
    current_.data.append(value);
    current_.data_lines.emplace_back(value);
    has_data_ = true;
  } else if (field == "event") {
    current_.event = std::string(value);
  } else if (field == "id") {
    current_.id = std::string(value);
  }
  // "retry" and unknown fields are ignored
}

bool SseParser::dispatch() {
  if (!has_data_) {
    current_ = SseEvent{};
    return true;
  }

  SseEvent event = std::move(current_);
  current_ = SseEvent{};
  has_data_ = false;

  if (handler_ && !handler_(event)) {
    stopped_ = true;
    return false;
  }
  return true;
}

}  // namespace mcpterm::net
