#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/events/ProgressEvent.hpp"
#include "core/upload/ObjectStore.hpp"
#include "core/upload/RetryPolicy.hpp"
#include "core/upload/UploadSession.hpp"
#include "core/util/Cancellation.hpp"

namespace safs {

class SessionStore;

struct UploadOptions {
  uint64_t segmentThreshold = 256ull << 20;  // larger files are segmented
  uint64_t chunkSize = 128ull << 20;
  size_t   maxInFlight = 4;
  // Empty: "<container>" + segmentSuffix.
  std::string segmentContainer;
  std::string segmentSuffix = "_segments";
};

enum class ChunkStatus { Committed, RetryableError, FatalError };
const char* to_string(ChunkStatus s);

struct ChunkResult {
  ChunkStatus status = ChunkStatus::Committed;
  bool        alreadyCommitted = false;  // identical content was already there
  int         attempts = 0;
  TransportStatus transport = TransportStatus::Ok;
  std::string message;
};

enum class FinalizeStatus { ManifestCommitted, Incomplete };
const char* to_string(FinalizeStatus s);

struct FinalizeResult {
  FinalizeStatus status = FinalizeStatus::Incomplete;
  bool wroteManifest = false;     // false when another call already committed it
  std::vector<uint64_t> missing;
};

enum class FileUploadStatus { Completed, Incomplete, Cancelled, Failed };
const char* to_string(FileUploadStatus s);

struct FileUploadResult {
  FileUploadStatus status = FileUploadStatus::Failed;
  std::string objectKey;
  std::optional<std::string> sessionId;  // set for segmented uploads
  uint64_t    bytes = 0;
  uint64_t    segments = 0;              // 0 for a single PUT
  TransportStatus transport = TransportStatus::Ok;
  std::string message;

  bool ok() const { return status == FileUploadStatus::Completed; }
};

nlohmann::json to_json(const FileUploadResult& r);

// Segmented, resumable transfer of objects into an ObjectStore. Session state
// is persisted through SessionStore after every committed segment.
class UploadPipeline {
public:
  UploadPipeline(ObjectStore& store,
                 SessionStore& sessions,
                 UploadOptions opts = {},
                 RetryPolicy retry = {},
                 Sleeper* sleeper = nullptr,
                 EventBus* events = nullptr);

  TransportResult verifyAccess();

  // HEAD the container and create it when absent. Throws on auth or fatal errors.
  void ensureContainer(const std::string& container);

  UploadSession beginSession(const std::string& container,
                             const std::string& objectKey,
                             uint64_t sizeBytes,
                             uint64_t chunkSize,
                             std::optional<std::string> sourcePath = std::nullopt);

  // Safe to call concurrently for different indices of the same session.
  ChunkResult uploadChunk(UploadSession& s, uint64_t index, std::string_view bytes);

  // Writes the manifest once every segment is committed. At most one finalize
  // runs per session; late callers observe the committed manifest.
  // Throws FatalTransportError / TransientTransportError when the manifest PUT fails.
  FinalizeResult finalize(UploadSession& s);

  // Reloads a persisted session and reconciles it with the remote segment
  // listing. Throws StateInconsistencyError when the two disagree.
  UploadSession resume(const std::string& sessionId);

  // Drops local state; with deleteRemote also removes uploaded segments.
  void abandon(const std::string& sessionId, bool deleteRemote = false);

  FileUploadResult uploadFile(const std::string& container,
                              const std::string& objectKey,
                              const std::filesystem::path& file,
                              const CancellationToken& cancel = {});

  FileUploadResult resumeFile(const std::string& sessionId, const CancellationToken& cancel = {});

  // Sessions with live lock state; committed and abandoned sessions are released.
  size_t trackedSessions() const;

  const UploadOptions& options() const { return opts_; }
  const RetryPolicy& retryPolicy() const { return retry_; }

private:
  struct SessionLocks {
    std::mutex state;
    std::mutex finalize;
    bool manifestCommitted = false;
  };

  std::shared_ptr<SessionLocks> locksFor(const std::string& sessionId);
  void releaseLocks(const std::string& sessionId, const std::shared_ptr<SessionLocks>& locks);

  // resume() body; adopted receives the indices taken over from the remote listing.
  UploadSession resumeSession(const std::string& sessionId, std::vector<uint64_t>* adopted);

  // Runs op under the retry policy. A NotFound on a write triggers one
  // createContainer(container) followed by one more attempt.
  TransportResult withRetry(const std::string& what,
                            const std::string& container,
                            const std::function<TransportResult()>& op,
                            int* attempts = nullptr);

  FileUploadResult runSession(UploadSession& s,
                              const std::filesystem::path& file,
                              const CancellationToken& cancel);

  std::string segmentContainerFor(const std::string& container) const;
  void emit(EventKind kind, const std::string& subject, uint64_t processed, uint64_t total,
            bool ok = true, const std::string& message = {});

  ObjectStore& store_;
  SessionStore& sessions_;
  UploadOptions opts_;
  RetryPolicy retry_;
  SystemSleeper systemSleeper_;
  Sleeper* sleeper_;
  EventBus* events_;

  std::mutex rngMu_;
  std::mt19937_64 rng_;

  mutable std::mutex locksMu_;
  std::map<std::string, std::shared_ptr<SessionLocks>> locks_;
};

} // namespace safs
