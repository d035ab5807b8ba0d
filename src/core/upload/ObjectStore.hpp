#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace safs {

enum class TransportStatus {
  Ok,
  NotFound,    // container (or object) does not exist
  AuthFailed,  // 401/403, never retried
  Transient,   // network error, timeout, 408/422/429/5xx
  Fatal        // anything else
};

const char* to_string(TransportStatus s);

struct TransportResult {
  TransportStatus status = TransportStatus::Ok;
  int httpStatus = 0;
  std::string etag;
  std::string message;

  bool ok() const { return status == TransportStatus::Ok; }

  static TransportResult fromHttpStatus(int status, std::string message = {});
};

struct RemoteObject {
  std::string name;
  uint64_t bytes = 0;
  std::string etag;
};

// The slice of an object-storage API the upload protocol needs. One call is
// one attempt; retries live in the pipeline.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  virtual TransportResult verifyAccess() = 0;
  virtual TransportResult headContainer(const std::string& container) = 0;
  virtual TransportResult createContainer(const std::string& container) = 0;

  // md5 is the hex digest of bytes; the store verifies it on arrival.
  virtual TransportResult putObject(const std::string& container,
                                    const std::string& key,
                                    std::string_view bytes,
                                    const std::string& md5) = 0;

  // Writes a large-object manifest (JSON list of {path, etag, size_bytes}).
  virtual TransportResult putManifest(const std::string& container,
                                      const std::string& key,
                                      const std::string& manifestJson) = 0;

  virtual TransportResult headObject(const std::string& container, const std::string& key) = 0;

  virtual TransportResult listObjects(const std::string& container,
                                      const std::string& prefix,
                                      std::vector<RemoteObject>& out) = 0;

  virtual TransportResult deleteObject(const std::string& container, const std::string& key) = 0;
};

} // namespace safs
