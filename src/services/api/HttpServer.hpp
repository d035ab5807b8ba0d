#pragma once
#include <string>

namespace safs {

struct AppConfig;
class SessionStore;
class EventBus;

// Start a blocking HTTP server exposing validation, batch build and upload
// session inspection. cfg.server.apiKey empty disables the X-API-Key check.
void run_http_server(const AppConfig& cfg, SessionStore& sessions, EventBus& events);

} // namespace safs
