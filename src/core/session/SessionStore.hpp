#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/upload/UploadSession.hpp"

namespace safs {

struct SessionHistoryEntry {
  std::string session_id;
  std::string event;
  std::string details_json;
  int64_t     at = 0;
  std::string actor;
};

// Durable upload-session state in SQLite. The schema must already be applied
// (initDatabase). All methods throw StorageError on SQLite failures.
class SessionStore {
public:
  explicit SessionStore(const std::string& dbPath);
  ~SessionStore();

  SessionStore(const SessionStore&) = delete;
  SessionStore& operator=(const SessionStore&) = delete;

  void insertSession(const UploadSession& s);

  // Rewrites the session row and its full segment set in one transaction.
  void saveSession(const UploadSession& s);

  void commitSegment(const std::string& sessionId,
                     uint64_t index,
                     const SegmentRecord& seg,
                     int64_t at);

  std::optional<UploadSession> load(const std::string& sessionId);
  std::vector<UploadSession> list();

  // Deletes the session row and its segments; history is kept.
  void removeSession(const std::string& sessionId);

  void appendHistory(const std::string& session_id,
                     const std::string& event,
                     const std::string& details_json,
                     int64_t at,
                     const std::string& actor);

  std::vector<SessionHistoryEntry> history(const std::string& session_id);

  const std::string& path() const { return path_; }

private:
  void exec(const char* sql);
  void writeSessionRow(const UploadSession& s, bool insert);
  void loadSegments(UploadSession& s);

  std::string path_;
  std::mutex mu_;
  void* db_; // sqlite3*
};

} // namespace safs
