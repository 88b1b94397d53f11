#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpterm::net {

struct SseEvent {
  std::string event = "message";
  std::string data;  // data: lines joined with '\n'
  std::string id;

  // The individual data: lines of this event
  std::vector<std::string> data_lines;
};

// Incremental text/event-stream parser. Feed raw body chunks as they
// arrive; complete events are delivered on each blank line.
class SseParser {
 public:
  // Return false to stop parsing
  using EventHandler = std::function<bool(const SseEvent &event)>;

  explicit SseParser(EventHandler handler) : handler_(std::move(handler)) {}

  // Returns false once the handler asked to stop
  bool feed(std::string_view chunk);

  // Dispatch a trailing event that was not terminated by a blank line
  bool flush();

  bool stopped() const {
    return stopped_;
  }

 private:
  void process_line(std::string_view line);
  bool dispatch();

  EventHandler handler_;
  std::string buffer_;
  SseEvent current_;
  bool has_data_ = false;
  bool stopped_ = false;
};

}  // namespace mcpterm::net
