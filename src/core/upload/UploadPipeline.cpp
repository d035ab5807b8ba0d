#include "UploadPipeline.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <ctime>
#include <fstream>
#include <set>

#include "core/errors/Errors.hpp"
#include "core/session/SessionStore.hpp"
#include "core/util/Digest.hpp"
#include "core/util/WorkerPool.hpp"

using nlohmann::json;

namespace safs {

namespace fs = std::filesystem;

const char* to_string(ChunkStatus s) {
  switch (s) {
    case ChunkStatus::Committed:      return "committed";
    case ChunkStatus::RetryableError: return "retryable_error";
    case ChunkStatus::FatalError:     return "fatal_error";
  }
  return "unknown";
}

const char* to_string(FinalizeStatus s) {
  switch (s) {
    case FinalizeStatus::ManifestCommitted: return "manifest_committed";
    case FinalizeStatus::Incomplete:        return "incomplete";
  }
  return "unknown";
}

const char* to_string(FileUploadStatus s) {
  switch (s) {
    case FileUploadStatus::Completed:  return "completed";
    case FileUploadStatus::Incomplete: return "incomplete";
    case FileUploadStatus::Cancelled:  return "cancelled";
    case FileUploadStatus::Failed:     return "failed";
  }
  return "unknown";
}

json to_json(const FileUploadResult& r) {
  json j = {
    {"status", to_string(r.status)},
    {"object_key", r.objectKey},
    {"bytes", r.bytes},
    {"segments", r.segments},
    {"transport", to_string(r.transport)},
    {"message", r.message}
  };
  j["session_id"] = r.sessionId ? json(*r.sessionId) : json(nullptr);
  return j;
}

static int64_t now_s() { return static_cast<int64_t>(std::time(nullptr)); }

static std::string read_range(const fs::path& file, uint64_t offset, uint64_t len) {
  std::ifstream in(file, std::ios::binary);
  if (!in) throw FilesystemError("cannot open " + file.string());
  in.seekg(static_cast<std::streamoff>(offset));
  std::string buf(static_cast<size_t>(len), '\0');
  in.read(buf.data(), static_cast<std::streamsize>(len));
  if (static_cast<uint64_t>(in.gcount()) != len)
    throw FilesystemError("short read of " + file.string() + " at offset " + std::to_string(offset));
  return buf;
}

static void throw_for(const TransportResult& r, const std::string& what) {
  const std::string msg = what + ": " + r.message;
  switch (r.status) {
    case TransportStatus::Ok:
      return;
    case TransportStatus::Transient:
      throw TransientTransportError(msg, r.httpStatus);
    case TransportStatus::AuthFailed:
    case TransportStatus::NotFound:
    case TransportStatus::Fatal:
      throw FatalTransportError(msg, r.httpStatus);
  }
}

UploadPipeline::UploadPipeline(ObjectStore& store,
                               SessionStore& sessions,
                               UploadOptions opts,
                               RetryPolicy retry,
                               Sleeper* sleeper,
                               EventBus* events)
  : store_(store), sessions_(sessions), opts_(std::move(opts)), retry_(retry),
    sleeper_(sleeper ? sleeper : &systemSleeper_), events_(events),
    rng_(std::random_device{}()) {
  if (opts_.chunkSize == 0) throw ConfigError("upload chunk size must be positive");
  if (opts_.maxInFlight == 0) opts_.maxInFlight = 1;
  if (retry_.maxAttempts < 1) retry_.maxAttempts = 1;
}

void UploadPipeline::emit(EventKind kind, const std::string& subject, uint64_t processed,
                          uint64_t total, bool ok, const std::string& message) {
  if (events_) events_->emit("upload", kind, subject, processed, total, ok, message);
}

std::string UploadPipeline::segmentContainerFor(const std::string& container) const {
  if (!opts_.segmentContainer.empty()) return opts_.segmentContainer;
  return container + opts_.segmentSuffix;
}

std::shared_ptr<UploadPipeline::SessionLocks> UploadPipeline::locksFor(const std::string& sessionId) {
  std::lock_guard<std::mutex> lk(locksMu_);
  auto& slot = locks_[sessionId];
  if (!slot) slot = std::make_shared<SessionLocks>();
  return slot;
}

void UploadPipeline::releaseLocks(const std::string& sessionId, const std::shared_ptr<SessionLocks>& locks) {
  std::lock_guard<std::mutex> lk(locksMu_);
  auto it = locks_.find(sessionId);
  if (it != locks_.end() && it->second == locks) locks_.erase(it);
}

size_t UploadPipeline::trackedSessions() const {
  std::lock_guard<std::mutex> lk(locksMu_);
  return locks_.size();
}

TransportResult UploadPipeline::withRetry(const std::string& what,
                                          const std::string& container,
                                          const std::function<TransportResult()>& op,
                                          int* attempts) {
  bool containerCreated = false;
  int n = 0;
  TransportResult r;
  for (int attempt = 1; attempt <= retry_.maxAttempts; ++attempt) {
    ++n;
    r = op();
    if (r.ok() || r.status == TransportStatus::AuthFailed || r.status == TransportStatus::Fatal) break;

    if (r.status == TransportStatus::NotFound) {
      if (container.empty() || containerCreated) break;
      containerCreated = true;
      spdlog::warn("{}: container '{}' missing, creating it", what, container);
      auto c = store_.createContainer(container);
      if (!c.ok()) { r = c; break; }
      ++n;
      r = op();
      break;
    }

    // Transient
    if (attempt == retry_.maxAttempts) break;
    std::chrono::milliseconds delay;
    {
      std::lock_guard<std::mutex> lk(rngMu_);
      delay = retry_.delayFor(attempt, &rng_);
    }
    spdlog::warn("{}: attempt {}/{} failed ({}), retrying in {} ms",
                 what, attempt, retry_.maxAttempts, r.message, delay.count());
    sleeper_->sleep(delay);
  }
  if (attempts) *attempts = n;
  return r;
}

TransportResult UploadPipeline::verifyAccess() {
  auto r = withRetry("verify access", {}, [&] { return store_.verifyAccess(); });
  if (r.ok()) spdlog::info("object store access verified");
  else spdlog::error("object store access check failed: {} ({})", r.message, to_string(r.status));
  return r;
}

void UploadPipeline::ensureContainer(const std::string& container) {
  auto r = withRetry("HEAD " + container, {}, [&] { return store_.headContainer(container); });
  if (r.ok()) return;
  if (r.status == TransportStatus::NotFound) {
    r = withRetry("create " + container, {}, [&] { return store_.createContainer(container); });
    if (r.ok()) return;
  }
  if (r.status == TransportStatus::AuthFailed)
    throw FatalTransportError("not authorized for container " + container + ": " + r.message, r.httpStatus);
  throw_for(r, "container " + container);
}

UploadSession UploadPipeline::beginSession(const std::string& container,
                                           const std::string& objectKey,
                                           uint64_t sizeBytes,
                                           uint64_t chunkSize,
                                           std::optional<std::string> sourcePath) {
  if (container.empty() || objectKey.empty())
    throw Error(ErrorCategory::Validation, "container and object key are required");
  if (chunkSize == 0) throw Error(ErrorCategory::Validation, "chunk size must be positive");
  if (sizeBytes == 0) throw Error(ErrorCategory::Validation, "cannot segment an empty object");

  UploadSession s;
  s.id = uuid4();
  s.container = container;
  s.segmentContainer = segmentContainerFor(container);
  s.objectKey = objectKey;
  s.sourcePath = std::move(sourcePath);
  s.totalBytes = sizeBytes;
  s.chunkSize = chunkSize;
  s.createdAt = s.updatedAt = now_s();

  sessions_.insertSession(s);
  sessions_.appendHistory(s.id, "BEGIN",
                          json({{"container", container}, {"object_key", objectKey},
                                {"total_bytes", sizeBytes}, {"chunk_size", chunkSize}}).dump(),
                          s.createdAt, "pipeline");
  locksFor(s.id);
  spdlog::info("session {} opened for {}/{} ({} bytes, {} segments)",
               s.id, container, objectKey, sizeBytes, s.segmentCount());
  emit(EventKind::Started, objectKey, 0, sizeBytes);
  return s;
}

ChunkResult UploadPipeline::uploadChunk(UploadSession& s, uint64_t index, std::string_view bytes) {
  ChunkResult out;
  auto locks = locksFor(s.id);
  const std::string md5 = md5_hex(bytes);
  std::string key;
  {
    std::lock_guard<std::mutex> lk(locks->state);
    if (s.state != SessionState::Open || s.manifestCommitted || locks->manifestCommitted) {
      out.status = ChunkStatus::FatalError;
      out.message = "session " + s.id + " is no longer open";
      return out;
    }
    if (index >= s.segmentCount()) {
      out.status = ChunkStatus::FatalError;
      out.message = "segment index " + std::to_string(index) + " out of range [0, " +
                    std::to_string(s.segmentCount()) + ")";
      return out;
    }
    if (bytes.size() != s.expectedSize(index)) {
      out.status = ChunkStatus::FatalError;
      out.message = "segment " + std::to_string(index) + " has " + std::to_string(bytes.size()) +
                    " bytes, expected " + std::to_string(s.expectedSize(index));
      return out;
    }
    if (auto it = s.committed.find(index); it != s.committed.end()) {
      if (it->second.etag == md5) {
        out.alreadyCommitted = true;
        return out;
      }
      out.status = ChunkStatus::FatalError;
      out.message = "segment " + std::to_string(index) + " already committed with different content";
      return out;
    }
    key = s.segmentKey(index);
  }

  const std::string container = s.segmentContainer;
  auto r = withRetry("PUT " + container + "/" + key, container,
                     [&] { return store_.putObject(container, key, bytes, md5); },
                     &out.attempts);
  out.transport = r.status;
  if (!r.ok()) {
    out.status = r.status == TransportStatus::Transient ? ChunkStatus::RetryableError
                                                        : ChunkStatus::FatalError;
    out.message = r.message;
    spdlog::error("session {} segment {} failed after {} attempt(s): {}",
                  s.id, index, out.attempts, r.message);
    emit(EventKind::ItemFailed, key, index, s.segmentCount(), false, r.message);
    return out;
  }

  SegmentRecord seg{static_cast<uint64_t>(bytes.size()), md5};
  uint64_t done = 0;
  {
    std::lock_guard<std::mutex> lk(locks->state);
    s.committed[index] = seg;
    s.updatedAt = now_s();
    sessions_.commitSegment(s.id, index, seg, s.updatedAt);
    done = s.committed.size();
  }
  spdlog::debug("session {} segment {} committed ({} bytes)", s.id, index, seg.size);
  emit(EventKind::Progress, s.objectKey, done, s.segmentCount());
  return out;
}

FinalizeResult UploadPipeline::finalize(UploadSession& s) {
  FinalizeResult out;
  auto locks = locksFor(s.id);
  std::lock_guard<std::mutex> fin(locks->finalize);

  std::string manifest;
  {
    std::lock_guard<std::mutex> lk(locks->state);
    if (s.manifestCommitted || locks->manifestCommitted) {
      s.manifestCommitted = true;
      s.state = SessionState::Committed;
      out.status = FinalizeStatus::ManifestCommitted;
      releaseLocks(s.id, locks);
      return out;
    }
    out.missing = s.missing();
    if (!out.missing.empty()) {
      spdlog::info("session {}: finalize deferred, {} of {} segments missing",
                   s.id, out.missing.size(), s.segmentCount());
      return out;
    }
    manifest = build_slo_manifest(s);
  }

  auto r = withRetry("PUT manifest " + s.container + "/" + s.objectKey, s.container,
                     [&] { return store_.putManifest(s.container, s.objectKey, manifest); });
  if (!r.ok()) {
    spdlog::error("session {}: manifest write failed: {}", s.id, r.message);
    sessions_.appendHistory(s.id, "FINALIZE_FAILED", json({{"message", r.message}}).dump(), now_s(), "pipeline");
    throw_for(r, "manifest " + s.container + "/" + s.objectKey);
  }

  {
    std::lock_guard<std::mutex> lk(locks->state);
    s.manifestCommitted = true;
    s.state = SessionState::Committed;
    s.updatedAt = now_s();
    locks->manifestCommitted = true;
  }
  sessions_.saveSession(s);
  sessions_.appendHistory(s.id, "COMMITTED",
                          json({{"segments", s.segmentCount()}, {"bytes", s.totalBytes}}).dump(),
                          s.updatedAt, "pipeline");
  sessions_.removeSession(s.id);
  releaseLocks(s.id, locks);

  out.status = FinalizeStatus::ManifestCommitted;
  out.wroteManifest = true;
  spdlog::info("session {}: manifest committed for {}/{} ({} segments)",
               s.id, s.container, s.objectKey, s.segmentCount());
  emit(EventKind::ItemSucceeded, s.objectKey, s.segmentCount(), s.segmentCount());
  return out;
}

UploadSession UploadPipeline::resume(const std::string& sessionId) {
  return resumeSession(sessionId, nullptr);
}

UploadSession UploadPipeline::resumeSession(const std::string& sessionId, std::vector<uint64_t>* adoptedOut) {
  auto loaded = sessions_.load(sessionId);
  if (!loaded) throw StorageError("no upload session " + sessionId);
  UploadSession s = std::move(*loaded);

  if (s.state == SessionState::Abandoned)
    throw StateInconsistencyError("session " + sessionId + " was abandoned");

  if (s.manifestCommitted) {
    auto r = withRetry("HEAD " + s.container + "/" + s.objectKey, {},
                       [&] { return store_.headObject(s.container, s.objectKey); });
    if (r.status == TransportStatus::NotFound)
      throw StateInconsistencyError("session " + sessionId + " records a committed manifest but " +
                                    s.container + "/" + s.objectKey + " does not exist");
    throw_for(r, "HEAD " + s.objectKey);
    return s;
  }

  std::vector<RemoteObject> listing;
  auto r = withRetry("list " + s.segmentContainer, {},
                     [&] { listing.clear(); return store_.listObjects(s.segmentContainer, s.segmentPrefix(), listing); });
  if (r.status == TransportStatus::NotFound) listing.clear();
  else throw_for(r, "list " + s.segmentContainer);

  std::map<uint64_t, RemoteObject> remote;
  for (auto& o : listing) {
    auto idx = parse_segment_key(s.objectKey, o.name);
    if (!idx) continue;
    if (*idx >= s.segmentCount())
      throw StateInconsistencyError("remote segment " + o.name + " is outside the session's " +
                                    std::to_string(s.segmentCount()) + " segments");
    remote[*idx] = std::move(o);
  }

  for (const auto& [idx, seg] : s.committed) {
    auto it = remote.find(idx);
    if (it == remote.end())
      throw StateInconsistencyError("segment " + std::to_string(idx) + " is committed locally but absent remotely");
    if (it->second.bytes != seg.size || (!it->second.etag.empty() && it->second.etag != seg.etag))
      throw StateInconsistencyError("segment " + std::to_string(idx) + " differs remotely (size " +
                                    std::to_string(it->second.bytes) + ", etag " + it->second.etag + ")");
  }

  size_t adopted = 0;
  for (const auto& [idx, o] : remote) {
    if (s.committed.count(idx)) continue;
    if (o.bytes != s.expectedSize(idx)) {
      spdlog::warn("session {}: remote {} has {} bytes, expected {}; it will be re-uploaded",
                   s.id, o.name, o.bytes, s.expectedSize(idx));
      continue;
    }
    s.committed[idx] = SegmentRecord{o.bytes, o.etag};
    if (adoptedOut) adoptedOut->push_back(idx);
    ++adopted;
  }

  s.updatedAt = now_s();
  sessions_.saveSession(s);
  sessions_.appendHistory(s.id, "RESUMED",
                          json({{"adopted", adopted}, {"committed", s.committed.size()},
                                {"segments", s.segmentCount()}}).dump(),
                          s.updatedAt, "pipeline");
  locksFor(s.id);
  spdlog::info("session {} resumed: {}/{} segments committed ({} adopted from remote)",
               s.id, s.committed.size(), s.segmentCount(), adopted);
  return s;
}

void UploadPipeline::abandon(const std::string& sessionId, bool deleteRemote) {
  auto loaded = sessions_.load(sessionId);
  if (!loaded) throw StorageError("no upload session " + sessionId);
  const UploadSession& s = *loaded;

  size_t deleted = 0;
  if (deleteRemote) {
    std::vector<RemoteObject> listing;
    auto r = withRetry("list " + s.segmentContainer, {},
                       [&] { listing.clear(); return store_.listObjects(s.segmentContainer, s.segmentPrefix(), listing); });
    if (r.status != TransportStatus::NotFound) throw_for(r, "list " + s.segmentContainer);
    for (const auto& o : listing) {
      if (!parse_segment_key(s.objectKey, o.name)) continue;
      auto d = withRetry("DELETE " + o.name, {},
                         [&] { return store_.deleteObject(s.segmentContainer, o.name); });
      if (d.status == TransportStatus::NotFound) continue;
      throw_for(d, "DELETE " + s.segmentContainer + "/" + o.name);
      ++deleted;
    }
  }

  sessions_.appendHistory(sessionId, "ABANDONED",
                          json({{"delete_remote", deleteRemote}, {"segments_deleted", deleted}}).dump(),
                          now_s(), "pipeline");
  sessions_.removeSession(sessionId);
  {
    std::lock_guard<std::mutex> lk(locksMu_);
    locks_.erase(sessionId);
  }
  spdlog::info("session {} abandoned ({} remote segments deleted)", sessionId, deleted);
}

FileUploadResult UploadPipeline::uploadFile(const std::string& container,
                                            const std::string& objectKey,
                                            const fs::path& file,
                                            const CancellationToken& cancel) {
  FileUploadResult out;
  out.objectKey = objectKey;

  std::error_code ec;
  const auto size = fs::file_size(file, ec);
  if (ec) {
    out.message = "cannot stat " + file.string() + ": " + ec.message();
    spdlog::error("{}", out.message);
    return out;
  }
  out.bytes = size;

  if (cancel.cancelled()) {
    out.status = FileUploadStatus::Cancelled;
    return out;
  }

  if (size <= opts_.segmentThreshold) {
    std::string bytes;
    try {
      bytes = read_range(file, 0, size);
    } catch (const FilesystemError& e) {
      out.message = e.what();
      spdlog::error("{}", out.message);
      return out;
    }
    const std::string md5 = md5_hex(bytes);
    auto r = withRetry("PUT " + container + "/" + objectKey, container,
                       [&] { return store_.putObject(container, objectKey, bytes, md5); });
    out.transport = r.status;
    if (r.ok()) {
      out.status = FileUploadStatus::Completed;
      spdlog::info("uploaded {} -> {}/{} ({} bytes)", file.string(), container, objectKey, size);
      emit(EventKind::ItemSucceeded, objectKey, size, size);
    } else {
      out.message = r.message;
      spdlog::error("upload of {} failed: {}", file.string(), r.message);
      emit(EventKind::ItemFailed, objectKey, 0, size, false, r.message);
    }
    return out;
  }

  UploadSession s = beginSession(container, objectKey, size, opts_.chunkSize, file.string());
  return runSession(s, file, cancel);
}

FileUploadResult UploadPipeline::resumeFile(const std::string& sessionId, const CancellationToken& cancel) {
  std::vector<uint64_t> adopted;
  UploadSession s = resumeSession(sessionId, &adopted);
  if (s.manifestCommitted) {
    FileUploadResult out;
    out.status = FileUploadStatus::Completed;
    out.objectKey = s.objectKey;
    out.sessionId = s.id;
    out.bytes = s.totalBytes;
    out.segments = s.segmentCount();
    sessions_.removeSession(s.id);
    return out;
  }
  if (!s.sourcePath)
    throw StateInconsistencyError("session " + sessionId + " has no recorded source file");

  std::error_code ec;
  const auto size = fs::file_size(*s.sourcePath, ec);
  if (ec) throw FilesystemError("cannot stat " + *s.sourcePath + ": " + ec.message());
  if (size != s.totalBytes)
    throw StateInconsistencyError("source " + *s.sourcePath + " is " + std::to_string(size) +
                                  " bytes, session expects " + std::to_string(s.totalBytes));

  // Segments taken over from the remote listing matched on size only.
  std::vector<uint64_t> rejected;
  for (auto idx : adopted) {
    const auto& rec = s.committed.at(idx);
    if (rec.etag.empty()) continue;
    const std::string md5 = md5_hex(read_range(*s.sourcePath, idx * s.chunkSize, s.expectedSize(idx)));
    if (md5 == rec.etag) continue;
    spdlog::warn("session {}: remote segment {} does not match the source (etag {}, local {}); it will be re-uploaded",
                 s.id, idx, rec.etag, md5);
    s.committed.erase(idx);
    rejected.push_back(idx);
  }
  if (!rejected.empty()) {
    s.updatedAt = now_s();
    sessions_.saveSession(s);
    sessions_.appendHistory(s.id, "ADOPTION_REJECTED", json({{"segments", rejected}}).dump(),
                            s.updatedAt, "pipeline");
  }
  return runSession(s, *s.sourcePath, cancel);
}

FileUploadResult UploadPipeline::runSession(UploadSession& s, const fs::path& file, const CancellationToken& cancel) {
  FileUploadResult out;
  out.objectKey = s.objectKey;
  out.sessionId = s.id;
  out.bytes = s.totalBytes;
  out.segments = s.segmentCount();

  std::atomic<bool> fatal{false};
  std::atomic<size_t> retryable{0};
  std::mutex errMu;
  std::string firstError;
  TransportStatus firstTransport = TransportStatus::Ok;

  const auto pending = s.missing();
  {
    WorkerPool pool(opts_.maxInFlight, opts_.maxInFlight);
    for (uint64_t idx : pending) {
      if (cancel.cancelled() || fatal.load()) break;
      pool.submit([&, idx] {
        if (cancel.cancelled() || fatal.load()) return;
        ChunkResult r;
        try {
          const std::string bytes = read_range(file, idx * s.chunkSize, s.expectedSize(idx));
          r = uploadChunk(s, idx, bytes);
        } catch (const std::exception& e) {
          r.status = ChunkStatus::FatalError;
          r.transport = TransportStatus::Fatal;
          r.message = e.what();
        }
        if (r.status == ChunkStatus::Committed) return;
        if (r.status == ChunkStatus::FatalError) fatal.store(true);
        else ++retryable;
        std::lock_guard<std::mutex> lk(errMu);
        if (firstError.empty()) {
          firstError = "segment " + std::to_string(idx) + ": " + r.message;
          firstTransport = r.transport;
        }
      });
    }
    pool.wait();
  }

  out.transport = firstTransport;
  out.message = firstError;
  if (fatal.load()) {
    out.status = FileUploadStatus::Failed;
    spdlog::error("session {} stopped: {}", s.id, firstError);
    return out;
  }
  if (retryable.load() > 0) {
    out.status = FileUploadStatus::Incomplete;
    spdlog::warn("session {}: {} segment(s) still pending, resume with session id", s.id, retryable.load());
    return out;
  }
  if (cancel.cancelled() && !s.allCommitted()) {
    out.status = FileUploadStatus::Cancelled;
    spdlog::info("session {} cancelled with {}/{} segments committed", s.id, s.committed.size(), s.segmentCount());
    return out;
  }

  try {
    auto fin = finalize(s);
    if (fin.status == FinalizeStatus::ManifestCommitted) {
      out.status = FileUploadStatus::Completed;
    } else {
      out.status = FileUploadStatus::Incomplete;
      out.message = std::to_string(fin.missing.size()) + " segment(s) missing";
    }
  } catch (const TransportError& e) {
    out.status = e.category() == ErrorCategory::TransientTransport ? FileUploadStatus::Incomplete
                                                                    : FileUploadStatus::Failed;
    out.transport = e.category() == ErrorCategory::TransientTransport ? TransportStatus::Transient
                                                                       : TransportStatus::Fatal;
    if (e.httpStatus() == 401 || e.httpStatus() == 403) out.transport = TransportStatus::AuthFailed;
    out.message = e.what();
  }
  return out;
}

} // namespace safs
