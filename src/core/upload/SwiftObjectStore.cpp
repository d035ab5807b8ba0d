#include "SwiftObjectStore.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>

#include "core/errors/Errors.hpp"

using nlohmann::json;

namespace safs {

static TransportResult from_result(const httplib::Result& res, const char* what) {
  if (!res) {
    TransportResult r;
    r.status = TransportStatus::Transient;
    r.message = std::string(what) + ": " + httplib::to_string(res.error());
    return r;
  }
  auto r = TransportResult::fromHttpStatus(res->status);
  r.etag = res->get_header_value("ETag");
  if (!r.ok()) {
    r.message = std::string(what) + ": HTTP " + std::to_string(res->status);
    if (!res->body.empty() && res->body.size() < 512) r.message += " " + res->body;
  }
  return r;
}

std::string SwiftObjectStore::encodePath(const std::string& s) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(k[c >> 4]);
      out.push_back(k[c & 0xF]);
    }
  }
  return out;
}

SwiftObjectStore::SwiftObjectStore(Credentials creds, SwiftOptions opts)
  : creds_(std::move(creds)), opts_(opts) {
  require_credentials(creds_);
  const auto scheme = creds_.endpoint.find("://");
  if (scheme == std::string::npos) throw ConfigError("storage endpoint has no scheme: " + creds_.endpoint);
  const auto slash = creds_.endpoint.find('/', scheme + 3);
  schemeHost_ = creds_.endpoint.substr(0, slash);
  basePath_ = slash == std::string::npos ? std::string() : creds_.endpoint.substr(slash);
  while (!basePath_.empty() && basePath_.back() == '/') basePath_.pop_back();
}

std::unique_ptr<httplib::Client> SwiftObjectStore::client() const {
  auto cli = std::make_unique<httplib::Client>(schemeHost_);
  cli->set_connection_timeout(opts_.connectTimeoutSec, 0);
  cli->set_read_timeout(opts_.readTimeoutSec, 0);
  cli->set_write_timeout(opts_.writeTimeoutSec, 0);
  cli->set_default_headers({{"X-Auth-Token", creds_.token}});
  return cli;
}

std::string SwiftObjectStore::objectPath(const std::string& container, const std::string& key) const {
  std::string p = basePath_ + "/" + encodePath(container);
  if (!key.empty()) p += "/" + encodePath(key);
  return p;
}

TransportResult SwiftObjectStore::verifyAccess() {
  auto cli = client();
  auto res = cli->Head(basePath_.empty() ? "/" : basePath_);
  return from_result(res, "HEAD account");
}

TransportResult SwiftObjectStore::headContainer(const std::string& container) {
  auto cli = client();
  auto res = cli->Head(objectPath(container, {}));
  return from_result(res, "HEAD container");
}

TransportResult SwiftObjectStore::createContainer(const std::string& container) {
  auto cli = client();
  auto res = cli->Put(objectPath(container, {}), httplib::Headers{}, std::string(), "text/plain");
  auto r = from_result(res, "PUT container");
  if (r.ok()) spdlog::info("container '{}' created", container);
  return r;
}

TransportResult SwiftObjectStore::putObject(const std::string& container,
                                            const std::string& key,
                                            std::string_view bytes,
                                            const std::string& md5) {
  auto cli = client();
  httplib::Headers h;
  if (!md5.empty()) h.emplace("ETag", md5);
  auto res = cli->Put(objectPath(container, key), h, bytes.data(), bytes.size(), "application/octet-stream");
  return from_result(res, "PUT object");
}

TransportResult SwiftObjectStore::putManifest(const std::string& container,
                                              const std::string& key,
                                              const std::string& manifestJson) {
  auto cli = client();
  auto res = cli->Put(objectPath(container, key) + "?multipart-manifest=put", httplib::Headers{},
                      manifestJson, "application/json");
  return from_result(res, "PUT manifest");
}

TransportResult SwiftObjectStore::headObject(const std::string& container, const std::string& key) {
  auto cli = client();
  auto res = cli->Head(objectPath(container, key));
  return from_result(res, "HEAD object");
}

TransportResult SwiftObjectStore::listObjects(const std::string& container,
                                              const std::string& prefix,
                                              std::vector<RemoteObject>& out) {
  auto cli = client();
  std::string marker;
  for (;;) {
    std::string path = objectPath(container, {}) + "?format=json&limit=" + std::to_string(opts_.listLimit) +
                       "&prefix=" + encodePath(prefix);
    if (!marker.empty()) path += "&marker=" + encodePath(marker);

    auto res = cli->Get(path);
    auto r = from_result(res, "GET container listing");
    if (!r.ok()) return r;
    if (res->status == 204 || res->body.empty()) return r;

    size_t page = 0;
    try {
      for (const auto& item : json::parse(res->body)) {
        RemoteObject o;
        o.name = item.value("name", "");
        o.bytes = item.value("bytes", uint64_t{0});
        o.etag = item.value("hash", "");
        marker = o.name;
        out.push_back(std::move(o));
        ++page;
      }
    } catch (const json::exception& e) {
      TransportResult bad;
      bad.status = TransportStatus::Transient;
      bad.httpStatus = res->status;
      bad.message = std::string("unparseable container listing: ") + e.what();
      return bad;
    }
    if (page < static_cast<size_t>(opts_.listLimit)) return r;
  }
}

TransportResult SwiftObjectStore::deleteObject(const std::string& container, const std::string& key) {
  auto cli = client();
  auto res = cli->Delete(objectPath(container, key));
  return from_result(res, "DELETE object");
}

} // namespace safs
