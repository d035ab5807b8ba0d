#pragma once
#include <memory>
#include <string>

#include "core/upload/Credentials.hpp"
#include "core/upload/ObjectStore.hpp"

namespace httplib { class Client; }

namespace safs {

struct SwiftOptions {
  int connectTimeoutSec = 10;
  int readTimeoutSec = 300;    // per request attempt
  int writeTimeoutSec = 300;   // per request attempt
  int listLimit = 10000;
};

// OpenStack Swift v1 over cpp-httplib. Every call builds its own client so
// concurrent segment uploads never share a connection.
class SwiftObjectStore : public ObjectStore {
public:
  SwiftObjectStore(Credentials creds, SwiftOptions opts = {});

  TransportResult verifyAccess() override;
  TransportResult headContainer(const std::string& container) override;
  TransportResult createContainer(const std::string& container) override;
  TransportResult putObject(const std::string& container,
                            const std::string& key,
                            std::string_view bytes,
                            const std::string& md5) override;
  TransportResult putManifest(const std::string& container,
                              const std::string& key,
                              const std::string& manifestJson) override;
  TransportResult headObject(const std::string& container, const std::string& key) override;
  TransportResult listObjects(const std::string& container,
                              const std::string& prefix,
                              std::vector<RemoteObject>& out) override;
  TransportResult deleteObject(const std::string& container, const std::string& key) override;

  const std::string& baseUrl() const { return schemeHost_; }
  const std::string& basePath() const { return basePath_; }

  // Percent-encodes everything but unreserved characters and '/'.
  static std::string encodePath(const std::string& s);

private:
  std::unique_ptr<httplib::Client> client() const;
  std::string objectPath(const std::string& container, const std::string& key) const;

  Credentials creds_;
  SwiftOptions opts_;
  std::string schemeHost_;
  std::string basePath_;
};

} // namespace safs
