#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace safs {

enum class EventKind {
  Started,
  ItemSucceeded,
  ItemFailed,
  ItemSkipped,
  Progress,
  Finished
};

const char* to_string(EventKind k);

// One immutable progress record. Components emit these instead of touching
// any front-end state.
struct ProgressEvent {
  uint64_t    sequence = 0;
  int64_t     at_ms = 0;        // unix epoch, milliseconds
  std::string component;        // "scan", "validate", "assemble", "upload"
  EventKind   kind = EventKind::Progress;
  std::string subject;          // directory, package id or object key
  uint64_t    processed = 0;
  uint64_t    total = 0;
  bool        ok = true;
  std::string message;
};

nlohmann::json to_json(const ProgressEvent& e);

using EventSink = std::function<void(const ProgressEvent&)>;

// Fan-out of progress events to any number of subscribers. Safe to emit from
// worker threads; subscribers are called under the bus lock in emission order.
class EventBus {
public:
  void subscribe(EventSink sink);

  void emit(const std::string& component,
            EventKind kind,
            const std::string& subject,
            uint64_t processed = 0,
            uint64_t total = 0,
            bool ok = true,
            const std::string& message = {});

private:
  std::mutex mu_;
  std::vector<EventSink> sinks_;
  uint64_t next_ = 1;
};

// Append-only JSON-lines progress log.
class JsonlEventLog {
public:
  explicit JsonlEventLog(const std::filesystem::path& file);
  void operator()(const ProgressEvent& e);

private:
  std::mutex mu_;
  std::ofstream out_;
};

} // namespace safs
