#pragma once
#include <stdexcept>
#include <string>

namespace safs {

enum class ErrorCategory {
  Validation,
  GateFailure,
  Filesystem,
  TransientTransport,
  FatalTransport,
  StateInconsistency,
  AuthUnavailable,
  PackageAlreadyExists,
  Config,
  Storage
};

const char* to_string(ErrorCategory c);

// Base for every error raised by the suite. Front ends switch on category()
// instead of on the concrete type.
class Error : public std::runtime_error {
public:
  Error(ErrorCategory category, const std::string& msg)
    : std::runtime_error(msg), category_(category) {}

  ErrorCategory category() const noexcept { return category_; }

private:
  ErrorCategory category_;
};

class FilesystemError : public Error {
public:
  explicit FilesystemError(const std::string& msg)
    : Error(ErrorCategory::Filesystem, msg) {}
};

class PackageAlreadyExistsError : public Error {
public:
  explicit PackageAlreadyExistsError(const std::string& packageId)
    : Error(ErrorCategory::PackageAlreadyExists, "package already exists: " + packageId),
      packageId_(packageId) {}
  const std::string& packageId() const noexcept { return packageId_; }

private:
  std::string packageId_;
};

class TransportError : public Error {
public:
  TransportError(ErrorCategory category, const std::string& msg, int httpStatus = 0)
    : Error(category, msg), httpStatus_(httpStatus) {}
  int httpStatus() const noexcept { return httpStatus_; }

private:
  int httpStatus_;
};

class FatalTransportError : public TransportError {
public:
  explicit FatalTransportError(const std::string& msg, int httpStatus = 0)
    : TransportError(ErrorCategory::FatalTransport, msg, httpStatus) {}
};

class TransientTransportError : public TransportError {
public:
  explicit TransientTransportError(const std::string& msg, int httpStatus = 0)
    : TransportError(ErrorCategory::TransientTransport, msg, httpStatus) {}
};

class StateInconsistencyError : public Error {
public:
  explicit StateInconsistencyError(const std::string& msg)
    : Error(ErrorCategory::StateInconsistency, msg) {}
};

class AuthUnavailableError : public Error {
public:
  explicit AuthUnavailableError(const std::string& msg)
    : Error(ErrorCategory::AuthUnavailable, msg) {}
};

class ConfigError : public Error {
public:
  explicit ConfigError(const std::string& msg)
    : Error(ErrorCategory::Config, msg) {}
};

class StorageError : public Error {
public:
  explicit StorageError(const std::string& msg)
    : Error(ErrorCategory::Storage, msg) {}
};

} // namespace safs
