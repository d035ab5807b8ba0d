#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

#include "core/config/Config.hpp"
#include "core/errors/Errors.hpp"
#include "core/events/ProgressEvent.hpp"
#include "core/package/BatchAssembler.hpp"
#include "core/session/SessionStore.hpp"

using nlohmann::json;

namespace safs {

// -------- helpers --------

static bool check_api_key(const httplib::Request& req,
                          const std::string& apiKey,
                          httplib::Response& res) {
  if (apiKey.empty()) return true;
  auto k = req.get_header_value("X-API-Key");
  if (k == apiKey) return true;
  res.status = 401;
  res.set_content(json({{"error", "unauthorized"}}).dump(), "application/json");
  return false;
}

static void reply(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static int status_for(ErrorCategory c) {
  switch (c) {
    case ErrorCategory::Validation:
    case ErrorCategory::Config:               return 400;
    case ErrorCategory::Filesystem:           return 422;
    case ErrorCategory::PackageAlreadyExists:
    case ErrorCategory::StateInconsistency:   return 409;
    case ErrorCategory::AuthUnavailable:      return 503;
    case ErrorCategory::TransientTransport:
    case ErrorCategory::FatalTransport:       return 502;
    case ErrorCategory::GateFailure:          return 422;
    case ErrorCategory::Storage:              return 500;
  }
  return 500;
}

// Parses the JSON body and pulls a required path field. Replies 400 and
// returns false when either is missing.
static bool body_path(const httplib::Request& req, httplib::Response& res,
                      const char* key, json& body, std::string& out) {
  try {
    body = req.body.empty() ? json::object() : json::parse(req.body);
  } catch (const json::exception&) {
    reply(res, 400, {{"error", "invalid JSON body"}});
    return false;
  }
  if (!body.is_object() || !body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
    reply(res, 400, {{"error", std::string("'") + key + "' (string) required"}});
    return false;
  }
  out = body[key].get<std::string>();
  if (!std::filesystem::is_directory(out)) {
    reply(res, 404, {{"error", "not a directory"}, {"path", out}});
    return false;
  }
  return true;
}

static json session_summary(const UploadSession& s) {
  json j = to_json(s);
  j.erase("committed");
  j["committed_count"] = s.committed.size();
  j["missing"] = s.missing();
  return j;
}

static BatchAssembler make_batch(const AppConfig& cfg) {
  ConsistencyValidator validator(cfg.validation, SchemaTable(cfg.schemas));
  return BatchAssembler(PackageAssembler(validator, cfg.package), cfg.scan, cfg.batch);
}

// -------- server --------

void run_http_server(const AppConfig& cfg, SessionStore& sessions, EventBus& events) {
  httplib::Server svr;
  const std::string apiKey = cfg.server.apiKey;

  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /validate  {"path": "<root>"}
  svr.Post("/validate", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json body;
    std::string path;
    if (!body_path(req, res, "path", body, path)) return;

    auto batch = make_batch(cfg);
    auto result = batch.validateAll(path, {}, &events);
    reply(res, 200, to_json(result));
  });

  // POST /build  {"path": "<root>", "output": "<output root>"}
  svr.Post("/build", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json body;
    std::string path;
    if (!body_path(req, res, "path", body, path)) return;
    const std::string output = body.value("output", "");
    if (output.empty()) {
      reply(res, 400, {{"error", "'output' (string) required"}});
      return;
    }

    auto batch = make_batch(cfg);
    auto report = batch.run(path, output, {}, &events);
    reply(res, report.allSucceeded() ? 200 : 207, to_json(report));
  });

  svr.Get("/sessions", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    json out = json::array();
    for (const auto& s : sessions.list()) out.push_back(session_summary(s));
    reply(res, 200, {{"sessions", out}});
  });

  svr.Get(R"(/sessions/([A-Za-z0-9\-]+))", [&](const httplib::Request& req, httplib::Response& res) {
    if (!check_api_key(req, apiKey, res)) return;
    const std::string id = req.matches[1];
    json history = json::array();
    for (const auto& h : sessions.history(id)) {
      json details = json::parse(h.details_json, nullptr, false);
      history.push_back({{"event", h.event}, {"at", h.at}, {"actor", h.actor},
                         {"details", details.is_discarded() ? json(h.details_json) : details}});
    }
    auto s = sessions.load(id);
    if (!s && history.empty()) {
      reply(res, 404, {{"error", "no such session"}, {"id", id}});
      return;
    }
    json out = s ? to_json(*s) : json({{"id", id}, {"state", "closed"}});
    out["history"] = history;
    reply(res, 200, out);
  });

  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    try {
      std::rethrow_exception(ep);
    } catch (const Error& e) {
      spdlog::error("{} {}: {} ({})", req.method, req.path, e.what(), to_string(e.category()));
      reply(res, status_for(e.category()), {{"error", to_string(e.category())}, {"message", e.what()}});
    } catch (const std::exception& e) {
      spdlog::error("{} {}: {}", req.method, req.path, e.what());
      reply(res, 500, {{"error", "internal"}, {"message", e.what()}});
    }
  });

  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", cfg.server.port);
  if (!svr.listen("0.0.0.0", cfg.server.port)) {
    spdlog::error("Failed to bind port {}", cfg.server.port);
    throw ConfigError("cannot bind port " + std::to_string(cfg.server.port));
  }
}

} // namespace safs
