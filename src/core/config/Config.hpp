#pragma once
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/package/BatchAssembler.hpp"
#include "core/package/PackageAssembler.hpp"
#include "core/scan/DirectoryScanner.hpp"
#include "core/upload/RetryPolicy.hpp"
#include "core/upload/SwiftObjectStore.hpp"
#include "core/upload/UploadPipeline.hpp"
#include "core/validation/ConsistencyValidator.hpp"

namespace safs {

struct StorageConfig {
  std::string dbPath = "data/saf-sessions.db";
  std::string schemaPath;   // empty: searched next to the binary and in the source tree
};

struct ServerConfig {
  int port = 8080;
  std::string apiKey;       // empty disables the X-API-Key check
};

struct LoggingConfig {
  std::string level = "info";
  std::string file;         // empty: stdout only
  std::string eventsFile;   // JSON-lines progress log; empty disables it
};

struct AppConfig {
  ScanOptions scan;
  ValidationOptions validation;
  std::vector<std::string> schemas {"dc", "dcterms", "local"};
  PackageOptions package;
  BatchOptions batch;
  UploadOptions upload;
  RetryPolicy retry;
  SwiftOptions swift;
  StorageConfig storage;
  ServerConfig server;
  LoggingConfig logging;
};

std::string get_env_or(const char* key, const std::string& defval);

// Built-in defaults, then the JSON file (when path is non-empty), then SAFS_*
// environment variables. Throws ConfigError on unreadable or invalid input.
AppConfig load_config(const std::string& path);

// Applies the keys present in j onto cfg.
void apply_json(AppConfig& cfg, const nlohmann::json& j);
void apply_env(AppConfig& cfg);
void validate_config(const AppConfig& cfg);

nlohmann::json to_json(const AppConfig& cfg);

} // namespace safs
