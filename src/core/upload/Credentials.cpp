#include "Credentials.hpp"

#include <cstdlib>

#include "core/errors/Errors.hpp"

namespace safs {

static std::string env_or_empty(const char* key) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return {};
}

std::optional<Credentials> credentials_from_env() {
  Credentials c;
  c.endpoint = env_or_empty("OS_STORAGE_URL");
  c.project  = env_or_empty("OS_PROJECT_NAME");
  c.token    = env_or_empty("OS_AUTH_TOKEN");
  if (!c.complete()) return std::nullopt;
  return c;
}

const Credentials& require_credentials(const std::optional<Credentials>& creds) {
  if (!creds) throw AuthUnavailableError("no object-store credentials available");
  if (creds->endpoint.empty()) throw AuthUnavailableError("credentials have no storage endpoint");
  if (creds->token.empty()) throw AuthUnavailableError("credentials have no auth token");
  return *creds;
}

} // namespace safs
