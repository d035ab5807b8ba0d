#include "Config.hpp"

#include <cstdlib>
#include <fstream>

#include "core/errors/Errors.hpp"

using nlohmann::json;

namespace safs {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

template <typename T>
static void take(const json& j, const char* key, T& out) {
  if (!j.contains(key)) return;
  try {
    out = j.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("config key '") + key + "': " + e.what());
  }
}

static void take_ms(const json& j, const char* key, std::chrono::milliseconds& out) {
  int64_t v = out.count();
  take(j, key, v);
  out = std::chrono::milliseconds(v);
}

static uint64_t env_u64(const char* key, uint64_t defval) {
  const std::string s = get_env_or(key, "");
  if (s.empty()) return defval;
  try {
    size_t pos = 0;
    const auto v = std::stoull(s, &pos);
    if (pos != s.size()) throw std::invalid_argument(s);
    return v;
  } catch (const std::exception&) {
    throw ConfigError(std::string(key) + " is not a non-negative integer: " + s);
  }
}

static bool env_bool(const char* key, bool defval) {
  const std::string s = get_env_or(key, "");
  if (s.empty()) return defval;
  if (s == "1" || s == "true" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "no") return false;
  throw ConfigError(std::string(key) + " is not a boolean: " + s);
}

void apply_json(AppConfig& cfg, const json& j) {
  if (!j.is_object()) throw ConfigError("config root must be a JSON object");

  if (auto it = j.find("scan"); it != j.end()) {
    take(*it, "metadata_extensions", cfg.scan.metadataExtensions);
    take(*it, "document_extensions", cfg.scan.documentExtensions);
    take(*it, "recursive", cfg.scan.recursive);
    take(*it, "skip_hidden", cfg.scan.skipHidden);
    take(*it, "skip_dir_names", cfg.scan.skipDirNames);
  }
  if (auto it = j.find("validation"); it != j.end()) {
    take(*it, "orphans_block", cfg.validation.gate.orphansBlock);
    take(*it, "duplicates_block", cfg.validation.gate.duplicatesBlock);
    take(*it, "schemas", cfg.schemas);
  }
  if (auto it = j.find("package"); it != j.end()) {
    take(*it, "id_prefix", cfg.package.idPrefix);
    take(*it, "id_width", cfg.package.idWidth);
    take(*it, "id_base", cfg.package.idBase);
    take(*it, "compute_digest", cfg.package.computeDigest);
    take(*it, "zip", cfg.batch.zip);
    std::string existing;
    take(*it, "existing", existing);
    if (existing == "skip") cfg.package.existing = ExistingPackagePolicy::Skip;
    else if (existing == "fail") cfg.package.existing = ExistingPackagePolicy::Fail;
    else if (!existing.empty()) throw ConfigError("package.existing must be 'skip' or 'fail'");
  }
  if (auto it = j.find("batch"); it != j.end()) {
    take(*it, "workers", cfg.batch.workers);
    take(*it, "output_dir_name", cfg.batch.outputDirName);
    take(*it, "write_report", cfg.batch.writeReport);
  }
  if (auto it = j.find("upload"); it != j.end()) {
    take(*it, "segment_threshold", cfg.upload.segmentThreshold);
    take(*it, "chunk_size", cfg.upload.chunkSize);
    take(*it, "max_in_flight", cfg.upload.maxInFlight);
    take(*it, "segment_container", cfg.upload.segmentContainer);
    take(*it, "segment_suffix", cfg.upload.segmentSuffix);
    if (auto r = it->find("retry"); r != it->end()) {
      take(*r, "max_attempts", cfg.retry.maxAttempts);
      take_ms(*r, "base_delay_ms", cfg.retry.baseDelay);
      take_ms(*r, "max_delay_ms", cfg.retry.maxDelay);
      take(*r, "jitter", cfg.retry.jitter);
    }
    if (auto t = it->find("timeouts"); t != it->end()) {
      take(*t, "connect_sec", cfg.swift.connectTimeoutSec);
      take(*t, "read_sec", cfg.swift.readTimeoutSec);
      take(*t, "write_sec", cfg.swift.writeTimeoutSec);
    }
  }
  if (auto it = j.find("storage"); it != j.end()) {
    take(*it, "db_path", cfg.storage.dbPath);
    take(*it, "schema_path", cfg.storage.schemaPath);
  }
  if (auto it = j.find("server"); it != j.end()) {
    take(*it, "port", cfg.server.port);
    take(*it, "api_key", cfg.server.apiKey);
  }
  if (auto it = j.find("logging"); it != j.end()) {
    take(*it, "level", cfg.logging.level);
    take(*it, "file", cfg.logging.file);
    take(*it, "events_file", cfg.logging.eventsFile);
  }
}

void apply_env(AppConfig& cfg) {
  cfg.storage.dbPath     = get_env_or("SAFS_DB_PATH", cfg.storage.dbPath);
  cfg.storage.schemaPath = get_env_or("SAFS_SCHEMA_PATH", cfg.storage.schemaPath);
  cfg.server.apiKey      = get_env_or("SAFS_API_KEY", cfg.server.apiKey);
  cfg.server.port        = static_cast<int>(env_u64("SAFS_PORT", static_cast<uint64_t>(cfg.server.port)));
  cfg.logging.level      = get_env_or("SAFS_LOG_LEVEL", cfg.logging.level);
  cfg.logging.file       = get_env_or("SAFS_LOG_FILE", cfg.logging.file);
  cfg.logging.eventsFile = get_env_or("SAFS_EVENTS_FILE", cfg.logging.eventsFile);
  cfg.batch.workers      = static_cast<size_t>(env_u64("SAFS_WORKERS", cfg.batch.workers));
  cfg.batch.zip          = env_bool("SAFS_ZIP", cfg.batch.zip);
  cfg.upload.segmentThreshold = env_u64("SAFS_SEGMENT_THRESHOLD", cfg.upload.segmentThreshold);
  cfg.upload.chunkSize   = env_u64("SAFS_CHUNK_SIZE", cfg.upload.chunkSize);
  cfg.upload.maxInFlight = static_cast<size_t>(env_u64("SAFS_MAX_IN_FLIGHT", cfg.upload.maxInFlight));
  cfg.upload.segmentContainer = get_env_or("SAFS_SEGMENT_CONTAINER", cfg.upload.segmentContainer);
  cfg.retry.maxAttempts  = static_cast<int>(env_u64("SAFS_MAX_ATTEMPTS", static_cast<uint64_t>(cfg.retry.maxAttempts)));
  cfg.validation.gate.orphansBlock = env_bool("SAFS_ORPHANS_BLOCK", cfg.validation.gate.orphansBlock);
  cfg.validation.gate.duplicatesBlock = env_bool("SAFS_DUPLICATES_BLOCK", cfg.validation.gate.duplicatesBlock);
}

void validate_config(const AppConfig& cfg) {
  if (cfg.batch.workers == 0) throw ConfigError("batch.workers must be at least 1");
  if (cfg.upload.chunkSize == 0) throw ConfigError("upload.chunk_size must be positive");
  if (cfg.upload.maxInFlight == 0) throw ConfigError("upload.max_in_flight must be at least 1");
  if (cfg.retry.maxAttempts < 1) throw ConfigError("upload.retry.max_attempts must be at least 1");
  if (cfg.retry.jitter < 0.0 || cfg.retry.jitter > 1.0) throw ConfigError("upload.retry.jitter must be within [0, 1]");
  if (cfg.retry.baseDelay.count() < 0 || cfg.retry.maxDelay < cfg.retry.baseDelay)
    throw ConfigError("upload.retry delays must satisfy 0 <= base_delay_ms <= max_delay_ms");
  if (cfg.package.idWidth < 1 || cfg.package.idWidth > 12) throw ConfigError("package.id_width must be within [1, 12]");
  if (cfg.server.port <= 0 || cfg.server.port > 65535) throw ConfigError("server.port out of range");
  if (cfg.scan.metadataExtensions.empty()) throw ConfigError("scan.metadata_extensions must not be empty");
  if (cfg.schemas.empty()) throw ConfigError("validation.schemas must not be empty");
}

AppConfig load_config(const std::string& path) {
  AppConfig cfg;
  if (!path.empty()) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot open config file " + path);
    json j;
    try {
      in >> j;
    } catch (const json::exception& e) {
      throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    apply_json(cfg, j);
  }
  apply_env(cfg);

  // Validator and scanner filter documents the same way.
  cfg.validation.metadataExtensions = cfg.scan.metadataExtensions;
  cfg.validation.documentExtensions = cfg.scan.documentExtensions;
  validate_config(cfg);
  return cfg;
}

json to_json(const AppConfig& cfg) {
  return {
    {"scan", {
      {"metadata_extensions", cfg.scan.metadataExtensions},
      {"document_extensions", cfg.scan.documentExtensions},
      {"recursive", cfg.scan.recursive},
      {"skip_hidden", cfg.scan.skipHidden},
      {"skip_dir_names", cfg.scan.skipDirNames}}},
    {"validation", {
      {"orphans_block", cfg.validation.gate.orphansBlock},
      {"duplicates_block", cfg.validation.gate.duplicatesBlock},
      {"schemas", cfg.schemas}}},
    {"package", {
      {"id_prefix", cfg.package.idPrefix},
      {"id_width", cfg.package.idWidth},
      {"id_base", cfg.package.idBase},
      {"existing", cfg.package.existing == ExistingPackagePolicy::Skip ? "skip" : "fail"},
      {"compute_digest", cfg.package.computeDigest},
      {"zip", cfg.batch.zip}}},
    {"batch", {
      {"workers", cfg.batch.workers},
      {"output_dir_name", cfg.batch.outputDirName},
      {"write_report", cfg.batch.writeReport}}},
    {"upload", {
      {"segment_threshold", cfg.upload.segmentThreshold},
      {"chunk_size", cfg.upload.chunkSize},
      {"max_in_flight", cfg.upload.maxInFlight},
      {"segment_container", cfg.upload.segmentContainer},
      {"segment_suffix", cfg.upload.segmentSuffix},
      {"retry", {
        {"max_attempts", cfg.retry.maxAttempts},
        {"base_delay_ms", cfg.retry.baseDelay.count()},
        {"max_delay_ms", cfg.retry.maxDelay.count()},
        {"jitter", cfg.retry.jitter}}},
      {"timeouts", {
        {"connect_sec", cfg.swift.connectTimeoutSec},
        {"read_sec", cfg.swift.readTimeoutSec},
        {"write_sec", cfg.swift.writeTimeoutSec}}}}},
    {"storage", {{"db_path", cfg.storage.dbPath}, {"schema_path", cfg.storage.schemaPath}}},
    {"server", {{"port", cfg.server.port}, {"api_key_set", !cfg.server.apiKey.empty()}}},
    {"logging", {
      {"level", cfg.logging.level},
      {"file", cfg.logging.file},
      {"events_file", cfg.logging.eventsFile}}}
  };
}

} // namespace safs
