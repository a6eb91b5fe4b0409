#pragma once

#include <stdexcept>
#include <string>

namespace livetv::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed channel key; never queued.
class InvalidChannel : public InvalidArgument {
 public:
  explicit InvalidChannel(const std::string& msg) : InvalidArgument(msg) {
  }
};

// No tuners / no credential slots exist for the request at all.
class NoCapacityConfigured : public std::runtime_error {
 public:
  explicit NoCapacityConfigured(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Session is unknown or already reclaimed.
class SessionNotFound : public std::runtime_error {
 public:
  explicit SessionNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Resource died under the session or stream setup failed. Retryable.
class ResourceFailed : public std::runtime_error {
 public:
  explicit ResourceFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class QueueTimeout : public std::runtime_error {
 public:
  explicit QueueTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace livetv::util
