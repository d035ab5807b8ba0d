#include "ProgressEvent.hpp"

#include <chrono>

#include "core/errors/Errors.hpp"

namespace safs {

const char* to_string(EventKind k) {
  switch (k) {
    case EventKind::Started:       return "started";
    case EventKind::ItemSucceeded: return "item_succeeded";
    case EventKind::ItemFailed:    return "item_failed";
    case EventKind::ItemSkipped:   return "item_skipped";
    case EventKind::Progress:      return "progress";
    case EventKind::Finished:      return "finished";
  }
  return "unknown";
}

nlohmann::json to_json(const ProgressEvent& e) {
  return {
    {"seq", e.sequence},
    {"at_ms", e.at_ms},
    {"component", e.component},
    {"kind", to_string(e.kind)},
    {"subject", e.subject},
    {"processed", e.processed},
    {"total", e.total},
    {"ok", e.ok},
    {"message", e.message}
  };
}

void EventBus::subscribe(EventSink sink) {
  std::lock_guard<std::mutex> lk(mu_);
  sinks_.push_back(std::move(sink));
}

void EventBus::emit(const std::string& component,
                    EventKind kind,
                    const std::string& subject,
                    uint64_t processed,
                    uint64_t total,
                    bool ok,
                    const std::string& message) {
  using namespace std::chrono;
  std::lock_guard<std::mutex> lk(mu_);
  ProgressEvent e;
  e.sequence  = next_++;
  e.at_ms     = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  e.component = component;
  e.kind      = kind;
  e.subject   = subject;
  e.processed = processed;
  e.total     = total;
  e.ok        = ok;
  e.message   = message;
  for (const auto& s : sinks_) s(e);
}

JsonlEventLog::JsonlEventLog(const std::filesystem::path& file) {
  if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path());
  out_.open(file, std::ios::out | std::ios::app);
  if (!out_) throw FilesystemError("cannot open progress log: " + file.string());
}

void JsonlEventLog::operator()(const ProgressEvent& e) {
  std::lock_guard<std::mutex> lk(mu_);
  out_ << to_json(e).dump() << '\n';
  out_.flush();
}

} // namespace safs
