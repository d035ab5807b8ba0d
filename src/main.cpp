// src/main.cpp
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/errors/Errors.hpp"
#include "core/events/ProgressEvent.hpp"
#include "core/logging/Logging.hpp"
#include "core/package/BatchAssembler.hpp"
#include "core/session/InitDb.hpp"
#include "core/session/SessionStore.hpp"
#include "core/upload/Credentials.hpp"
#include "core/upload/SwiftObjectStore.hpp"
#include "core/upload/TreeUploader.hpp"
#include "core/upload/UploadPipeline.hpp"
#include "services/api/HttpServer.hpp"

using namespace safs;
namespace fs = std::filesystem;

// ---------- helpers ----------

static CancellationToken g_cancel;

static void on_signal(int) { g_cancel.cancel(); }

// Look for schema.sql in CWD first (the build copies it next to the binary),
// then in the source tree.
static std::string findSchemaPath(const AppConfig& cfg) {
  if (!cfg.storage.schemaPath.empty()) return cfg.storage.schemaPath;
  std::vector<fs::path> candidates = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/session/schema.sql")
  };
#ifdef SAFS_SCHEMA_FILE
  candidates.emplace_back(SAFS_SCHEMA_FILE);
#endif
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw ConfigError("schema.sql not found (set storage.schema_path or SAFS_SCHEMA_PATH)");
}

static std::unique_ptr<SessionStore> open_sessions(const AppConfig& cfg) {
  initDatabase(cfg.storage.dbPath, findSchemaPath(cfg));
  return std::make_unique<SessionStore>(cfg.storage.dbPath);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage: " << argv0 << " [--config FILE] <command> [args]\n\n"
            << "  scan <root>                          list directories holding metadata\n"
            << "  validate <root> [--issues-csv FILE]  check metadata against documents\n"
            << "  build <root> <output> [--fail-existing] [--zip]\n"
            << "                                       assemble SAF packages\n"
            << "  upload <path> <container> [--object KEY]\n"
            << "                                       upload a package tree or one file\n"
            << "  resume <session-id>                  continue an interrupted upload\n"
            << "  sessions [show <id> | abandon <id> [--delete-remote]]\n"
            << "  check-auth                           verify object-store credentials\n"
            << "  init                                 create/upgrade the session database\n"
            << "  serve                                start the HTTP service\n"
            << "  config                               print the effective configuration\n";
}

// Pulls "--name value" out of args; returns def when absent.
static std::string take_option(std::vector<std::string>& args, const std::string& name, const std::string& def = {}) {
  for (size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == name) {
      std::string v = args[i + 1];
      args.erase(args.begin() + static_cast<std::ptrdiff_t>(i), args.begin() + static_cast<std::ptrdiff_t>(i) + 2);
      return v;
    }
  }
  return def;
}

static bool take_flag(std::vector<std::string>& args, const std::string& name) {
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<std::ptrdiff_t>(i));
      return true;
    }
  }
  return false;
}

static void need(const std::vector<std::string>& args, size_t n, const char* usage) {
  if (args.size() < n) throw ConfigError(std::string("usage: ") + usage);
}

static BatchAssembler make_batch(const AppConfig& cfg) {
  ConsistencyValidator validator(cfg.validation, SchemaTable(cfg.schemas));
  return BatchAssembler(PackageAssembler(validator, cfg.package), cfg.scan, cfg.batch);
}

static std::unique_ptr<SwiftObjectStore> open_store(const AppConfig& cfg) {
  const auto creds = credentials_from_env();
  return std::make_unique<SwiftObjectStore>(require_credentials(creds), cfg.swift);
}

// ---------- commands ----------

static int cmd_scan(const AppConfig& cfg, std::vector<std::string>& args) {
  need(args, 1, "scan <root>");
  std::vector<ScanError> errors;
  const auto entries = scan_all(args[0], cfg.scan, &errors);
  nlohmann::json out = nlohmann::json::array();
  for (const auto& e : entries) {
    out.push_back({{"directory", e.directory.string()}, {"relative_path", e.relativePath.generic_string()},
                   {"metadata_files", e.metadataFiles.size()}, {"documents", e.documentFiles.size()}});
  }
  for (const auto& e : errors) spdlog::warn("scan: {}: {}", e.directory.string(), e.reason);
  std::cout << out.dump(2) << "\n";
  return errors.empty() ? 0 : 1;
}

static int cmd_validate(const AppConfig& cfg, std::vector<std::string>& args, EventBus& events) {
  const std::string issuesCsv = take_option(args, "--issues-csv");
  need(args, 1, "validate <root> [--issues-csv FILE]");
  auto batch = make_batch(cfg);
  auto result = batch.validateAll(args[0], g_cancel, &events);
  if (!issuesCsv.empty()) {
    std::ofstream out(issuesCsv);
    if (!out) throw FilesystemError("cannot write " + issuesCsv);
    for (const auto& r : result.reports) write_issues_csv(r, out);
  }
  std::cout << to_json(result).dump(2) << "\n";
  return result.allPass() ? 0 : 1;
}

static int cmd_build(const AppConfig& base, std::vector<std::string>& args, EventBus& events) {
  AppConfig cfg = base;
  if (take_flag(args, "--fail-existing")) cfg.package.existing = ExistingPackagePolicy::Fail;
  if (take_flag(args, "--zip")) cfg.batch.zip = true;
  need(args, 2, "build <root> <output> [--fail-existing] [--zip]");
  auto batch = make_batch(cfg);
  auto report = batch.run(args[0], args[1], g_cancel, &events);
  std::cout << to_json(report).dump(2) << "\n";
  return report.allSucceeded() ? 0 : 1;
}

static int cmd_upload(const AppConfig& cfg, std::vector<std::string>& args, EventBus& events) {
  const std::string key = take_option(args, "--object");
  need(args, 2, "upload <path> <container> [--object KEY]");
  const fs::path source = args[0];
  const std::string container = args[1];

  auto store = open_store(cfg);
  auto sessions = open_sessions(cfg);
  UploadPipeline pipeline(*store, *sessions, cfg.upload, cfg.retry, nullptr, &events);

  if (fs::is_directory(source)) {
    TreeUploader tree(pipeline);
    auto report = tree.uploadDirectory(source, container, g_cancel);
    std::cout << to_json(report).dump(2) << "\n";
    return report.ok() ? 0 : 1;
  }

  pipeline.ensureContainer(container);
  auto r = pipeline.uploadFile(container, key.empty() ? source.filename().string() : key, source, g_cancel);
  std::cout << to_json(r).dump(2) << "\n";
  return r.ok() ? 0 : 1;
}

static int cmd_resume(const AppConfig& cfg, std::vector<std::string>& args, EventBus& events) {
  need(args, 1, "resume <session-id>");
  auto store = open_store(cfg);
  auto sessions = open_sessions(cfg);
  UploadPipeline pipeline(*store, *sessions, cfg.upload, cfg.retry, nullptr, &events);
  auto r = pipeline.resumeFile(args[0], g_cancel);
  std::cout << to_json(r).dump(2) << "\n";
  return r.ok() ? 0 : 1;
}

static int cmd_sessions(const AppConfig& cfg, std::vector<std::string>& args, EventBus& events) {
  auto sessions = open_sessions(cfg);
  if (args.empty()) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& s : sessions->list()) out.push_back(to_json(s));
    std::cout << out.dump(2) << "\n";
    return 0;
  }
  if (args[0] == "show") {
    need(args, 2, "sessions show <id>");
    auto s = sessions->load(args[1]);
    if (!s) throw StorageError("no upload session " + args[1]);
    std::cout << to_json(*s).dump(2) << "\n";
    return 0;
  }
  if (args[0] == "abandon") {
    const bool deleteRemote = take_flag(args, "--delete-remote");
    need(args, 2, "sessions abandon <id> [--delete-remote]");
    if (deleteRemote) {
      auto store = open_store(cfg);
      UploadPipeline pipeline(*store, *sessions, cfg.upload, cfg.retry, nullptr, &events);
      pipeline.abandon(args[1], true);
    } else {
      // Local state only; no credentials needed.
      auto s = sessions->load(args[1]);
      if (!s) throw StorageError("no upload session " + args[1]);
      sessions->appendHistory(s->id, "ABANDONED", R"({"delete_remote":false})",
                              static_cast<int64_t>(std::time(nullptr)), "cli");
      sessions->removeSession(s->id);
    }
    std::cout << "abandoned " << args[1] << "\n";
    return 0;
  }
  throw ConfigError("unknown sessions subcommand: " + args[0]);
}

static int cmd_check_auth(const AppConfig& cfg) {
  auto store = open_store(cfg);
  auto sessions = open_sessions(cfg);
  UploadPipeline pipeline(*store, *sessions, cfg.upload, cfg.retry);
  auto r = pipeline.verifyAccess();
  std::cout << (r.ok() ? "authorized" : "not authorized: " + r.message) << "\n";
  return r.ok() ? 0 : 1;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  try {
    const std::string configPath = take_option(args, "--config", get_env_or("SAFS_CONFIG", ""));
    if (args.empty() || args[0] == "--help" || args[0] == "-h") {
      print_usage(argv[0]);
      return args.empty() ? 1 : 0;
    }
    const std::string cmd = args[0];
    args.erase(args.begin());

    AppConfig cfg = load_config(configPath);
    initLogging(cfg.logging.level, cfg.logging.file);

    EventBus events;
    events.subscribe([](const ProgressEvent& e) {
      spdlog::debug("[{}] {} {} {}/{} {}", e.component, to_string(e.kind), e.subject,
                    e.processed, e.total, e.message);
    });
    if (!cfg.logging.eventsFile.empty()) {
      auto log = std::make_shared<JsonlEventLog>(cfg.logging.eventsFile);
      events.subscribe([log](const ProgressEvent& e) { (*log)(e); });
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    if (cmd == "scan")       return cmd_scan(cfg, args);
    if (cmd == "validate")   return cmd_validate(cfg, args, events);
    if (cmd == "build")      return cmd_build(cfg, args, events);
    if (cmd == "upload")     return cmd_upload(cfg, args, events);
    if (cmd == "resume")     return cmd_resume(cfg, args, events);
    if (cmd == "sessions")   return cmd_sessions(cfg, args, events);
    if (cmd == "check-auth") return cmd_check_auth(cfg);
    if (cmd == "config") {
      std::cout << to_json(cfg).dump(2) << "\n";
      return 0;
    }
    if (cmd == "init") {
      initDatabase(cfg.storage.dbPath, findSchemaPath(cfg));
      std::cout << "DB initialized at: " << cfg.storage.dbPath << "\n";
      return 0;
    }
    if (cmd == "serve") {
      auto sessions = open_sessions(cfg);
      run_http_server(cfg, *sessions, events);
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const Error& e) {
    spdlog::error("{} ({})", e.what(), to_string(e.category()));
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
