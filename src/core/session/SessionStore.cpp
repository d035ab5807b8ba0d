#include "SessionStore.hpp"
#include <sqlite3.h>

#include "core/errors/Errors.hpp"

namespace safs {

namespace {

// Owns one prepared statement for the duration of a call.
class Stmt {
public:
  Stmt(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK)
      throw StorageError(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  ~Stmt() { sqlite3_finalize(st_); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  void text(int i, const std::string& v) { sqlite3_bind_text(st_, i, v.c_str(), -1, SQLITE_TRANSIENT); }
  void i64(int i, int64_t v) { sqlite3_bind_int64(st_, i, v); }
  void null(int i) { sqlite3_bind_null(st_, i); }

  // true while a row is available
  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError(std::string("step failed: ") + sqlite3_errmsg(db_));
  }

  void done(const char* what) {
    if (sqlite3_step(st_) != SQLITE_DONE)
      throw StorageError(std::string(what) + " failed: " + sqlite3_errmsg(db_));
  }

  std::string colText(int i) const {
    auto* p = sqlite3_column_text(st_, i);
    return p ? reinterpret_cast<const char*>(p) : std::string();
  }
  bool colNull(int i) const { return sqlite3_column_type(st_, i) == SQLITE_NULL; }
  int64_t colI64(int i) const { return sqlite3_column_int64(st_, i); }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

const char* kSelectSession = R"SQL(
  SELECT id, container, segment_container, object_key, source_path, total_bytes,
         chunk_size, manifest_committed, state, created_at, updated_at
  FROM upload_sessions
)SQL";

UploadSession read_session_row(const Stmt& st) {
  UploadSession s;
  s.id = st.colText(0);
  s.container = st.colText(1);
  s.segmentContainer = st.colText(2);
  s.objectKey = st.colText(3);
  if (!st.colNull(4)) s.sourcePath = st.colText(4);
  s.totalBytes = static_cast<uint64_t>(st.colI64(5));
  s.chunkSize = static_cast<uint64_t>(st.colI64(6));
  s.manifestCommitted = st.colI64(7) != 0;
  auto state = session_state_from_string(st.colText(8));
  if (!state) throw StorageError("session " + s.id + " has unknown state '" + st.colText(8) + "'");
  s.state = *state;
  s.createdAt = st.colI64(9);
  s.updatedAt = st.colI64(10);
  return s;
}

} // namespace

SessionStore::SessionStore(const std::string& dbPath) : path_(dbPath), db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StorageError("failed to open session db " + dbPath + ": " + msg);
  }
  db_ = db;
  sqlite3_busy_timeout(db, 5000);
  exec("PRAGMA foreign_keys=ON;");
}

SessionStore::~SessionStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void SessionStore::exec(const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(static_cast<sqlite3*>(db_), sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StorageError(std::string("exec failed: ") + msg);
  }
}

void SessionStore::writeSessionRow(const UploadSession& s, bool insert) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = insert ? R"SQL(
    INSERT INTO upload_sessions
      (container, segment_container, object_key, source_path, total_bytes, chunk_size,
       manifest_committed, state, created_at, updated_at, id)
    VALUES (?,?,?,?,?,?,?,?,?,?,?)
  )SQL" : R"SQL(
    UPDATE upload_sessions SET
      container=?, segment_container=?, object_key=?, source_path=?, total_bytes=?, chunk_size=?,
      manifest_committed=?, state=?, created_at=?, updated_at=?
    WHERE id=?
  )SQL";
  Stmt st(db, sql);
  int i = 1;
  st.text(i++, s.container);
  st.text(i++, s.segmentContainer);
  st.text(i++, s.objectKey);
  if (s.sourcePath) st.text(i++, *s.sourcePath); else st.null(i++);
  st.i64(i++, static_cast<int64_t>(s.totalBytes));
  st.i64(i++, static_cast<int64_t>(s.chunkSize));
  st.i64(i++, s.manifestCommitted ? 1 : 0);
  st.text(i++, to_string(s.state));
  st.i64(i++, s.createdAt);
  st.i64(i++, s.updatedAt);
  st.text(i++, s.id);
  st.done(insert ? "insertSession" : "updateSession");
  if (!insert && sqlite3_changes(db) == 0) throw StorageError("no such session: " + s.id);
}

void SessionStore::insertSession(const UploadSession& s) {
  std::lock_guard<std::mutex> lk(mu_);
  writeSessionRow(s, true);
}

void SessionStore::saveSession(const UploadSession& s) {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  exec("BEGIN IMMEDIATE;");
  try {
    writeSessionRow(s, false);
    {
      Stmt del(db, "DELETE FROM session_segments WHERE session_id=?");
      del.text(1, s.id);
      del.done("clearSegments");
    }
    for (const auto& [idx, seg] : s.committed) {
      Stmt ins(db, "INSERT INTO session_segments (session_id, seg_index, size, etag, committed_at) VALUES (?,?,?,?,?)");
      ins.text(1, s.id);
      ins.i64(2, static_cast<int64_t>(idx));
      ins.i64(3, static_cast<int64_t>(seg.size));
      ins.text(4, seg.etag);
      ins.i64(5, s.updatedAt);
      ins.done("saveSegment");
    }
    exec("COMMIT;");
  } catch (...) {
    sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

void SessionStore::commitSegment(const std::string& sessionId,
                                 uint64_t index,
                                 const SegmentRecord& seg,
                                 int64_t at) {
  std::lock_guard<std::mutex> lk(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt st(db, R"SQL(
    INSERT INTO session_segments (session_id, seg_index, size, etag, committed_at)
    VALUES (?,?,?,?,?)
    ON CONFLICT(session_id, seg_index) DO UPDATE SET
      size=excluded.size, etag=excluded.etag, committed_at=excluded.committed_at
  )SQL");
  st.text(1, sessionId);
  st.i64(2, static_cast<int64_t>(index));
  st.i64(3, static_cast<int64_t>(seg.size));
  st.text(4, seg.etag);
  st.i64(5, at);
  st.done("commitSegment");

  Stmt touch(db, "UPDATE upload_sessions SET updated_at=? WHERE id=?");
  touch.i64(1, at);
  touch.text(2, sessionId);
  touch.done("touchSession");
}

void SessionStore::loadSegments(UploadSession& s) {
  Stmt st(static_cast<sqlite3*>(db_),
          "SELECT seg_index, size, etag FROM session_segments WHERE session_id=? ORDER BY seg_index");
  st.text(1, s.id);
  while (st.step()) {
    SegmentRecord seg;
    seg.size = static_cast<uint64_t>(st.colI64(1));
    seg.etag = st.colText(2);
    s.committed[static_cast<uint64_t>(st.colI64(0))] = seg;
  }
}

std::optional<UploadSession> SessionStore::load(const std::string& sessionId) {
  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(db_), (std::string(kSelectSession) + " WHERE id=?").c_str());
  st.text(1, sessionId);
  if (!st.step()) return std::nullopt;
  UploadSession s = read_session_row(st);
  loadSegments(s);
  return s;
}

std::vector<UploadSession> SessionStore::list() {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<UploadSession> out;
  {
    Stmt st(static_cast<sqlite3*>(db_), (std::string(kSelectSession) + " ORDER BY created_at, id").c_str());
    while (st.step()) out.push_back(read_session_row(st));
  }
  for (auto& s : out) loadSegments(s);
  return out;
}

void SessionStore::removeSession(const std::string& sessionId) {
  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(db_), "DELETE FROM upload_sessions WHERE id=?");
  st.text(1, sessionId);
  st.done("removeSession");
}

void SessionStore::appendHistory(const std::string& session_id,
                                 const std::string& event,
                                 const std::string& details_json,
                                 int64_t at,
                                 const std::string& actor) {
  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    INSERT INTO session_history (session_id, event, details, at, actor)
    VALUES (?,?,?,?,?)
  )SQL");
  st.text(1, session_id);
  st.text(2, event);
  st.text(3, details_json);
  st.i64(4, at);
  st.text(5, actor);
  st.done("appendHistory");
}

std::vector<SessionHistoryEntry> SessionStore::history(const std::string& session_id) {
  std::lock_guard<std::mutex> lk(mu_);
  Stmt st(static_cast<sqlite3*>(db_),
          "SELECT session_id, event, details, at, actor FROM session_history WHERE session_id=? ORDER BY id");
  st.text(1, session_id);
  std::vector<SessionHistoryEntry> out;
  while (st.step()) {
    SessionHistoryEntry e;
    e.session_id = st.colText(0);
    e.event = st.colText(1);
    e.details_json = st.colText(2);
    e.at = st.colI64(3);
    e.actor = st.colText(4);
    out.push_back(std::move(e));
  }
  return out;
}

} // namespace safs
