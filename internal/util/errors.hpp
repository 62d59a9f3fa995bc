#pragma once

#include <stdexcept>
#include <string>

namespace bookrec::util {

/*
  Central error types.

  Only ConfigError is fatal, and only at startup. Every other type is
  caught by the loop that raised it and reflected in the status snapshot.
  The gRPC layer translates them to status codes.
*/

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Booking source unreachable or timed out. Retried on the next poll.
class TransientSourceError : public std::runtime_error {
 public:
  explicit TransientSourceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidTimeFormat : public std::runtime_error {
 public:
  explicit InvalidTimeFormat(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidBooking : public std::runtime_error {
 public:
  explicit InvalidBooking(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CameraInitError : public std::runtime_error {
 public:
  explicit CameraInitError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceConflictError : public std::runtime_error {
 public:
  explicit ResourceConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Retryable upload failure.
class UploadError : public std::runtime_error {
 public:
  explicit UploadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Upload that can never succeed. The task is not retried.
class PermanentUploadFailure : public std::runtime_error {
 public:
  explicit PermanentUploadFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace bookrec::util
