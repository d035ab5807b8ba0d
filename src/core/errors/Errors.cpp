#include "Errors.hpp"

namespace safs {

const char* to_string(ErrorCategory c) {
  switch (c) {
    case ErrorCategory::Validation:           return "validation";
    case ErrorCategory::GateFailure:          return "gate_failure";
    case ErrorCategory::Filesystem:           return "filesystem";
    case ErrorCategory::TransientTransport:   return "transient_transport";
    case ErrorCategory::FatalTransport:       return "fatal_transport";
    case ErrorCategory::StateInconsistency:   return "state_inconsistency";
    case ErrorCategory::AuthUnavailable:      return "auth_unavailable";
    case ErrorCategory::PackageAlreadyExists: return "package_already_exists";
    case ErrorCategory::Config:               return "config";
    case ErrorCategory::Storage:              return "storage";
  }
  return "unknown";
}

} // namespace safs
