#pragma once
#include <optional>
#include <string>

namespace safs {

// Resolved object-store credentials. Produced by a loader outside the core;
// the core only passes it along and never persists it.
struct Credentials {
  std::string endpoint;  // storage URL, e.g. https://swift.example.org/v1/AUTH_project
  std::string project;
  std::string token;

  bool complete() const { return !endpoint.empty() && !token.empty(); }
};

// OS_STORAGE_URL, OS_PROJECT_NAME, OS_AUTH_TOKEN; nullopt if any required one is unset.
std::optional<Credentials> credentials_from_env();

// Throws AuthUnavailableError when creds are absent or incomplete.
const Credentials& require_credentials(const std::optional<Credentials>& creds);

} // namespace safs
