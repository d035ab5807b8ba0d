#include "ObjectStore.hpp"

namespace safs {

const char* to_string(TransportStatus s) {
  switch (s) {
    case TransportStatus::Ok:         return "ok";
    case TransportStatus::NotFound:   return "not_found";
    case TransportStatus::AuthFailed: return "auth_failed";
    case TransportStatus::Transient:  return "transient";
    case TransportStatus::Fatal:      return "fatal";
  }
  return "unknown";
}

TransportResult TransportResult::fromHttpStatus(int status, std::string message) {
  TransportResult r;
  r.httpStatus = status;
  r.message = std::move(message);
  if (status >= 200 && status < 300)          r.status = TransportStatus::Ok;
  else if (status == 401 || status == 403)    r.status = TransportStatus::AuthFailed;
  else if (status == 404)                     r.status = TransportStatus::NotFound;
  // 422: body did not match the ETag we sent
  else if (status == 408 || status == 422 || status == 429 || status >= 500)
                                              r.status = TransportStatus::Transient;
  else                                        r.status = TransportStatus::Fatal;
  if (r.message.empty() && !r.ok()) r.message = "HTTP " + std::to_string(status);
  return r;
}

} // namespace safs
