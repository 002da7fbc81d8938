#pragma once

#include <stdexcept>
#include <string>

namespace resonance::util {

/*
  Central error types.

  Per-node failures (ValidationError) are caught inside the migration loop and
  never abort a run. Everything else is run-level and propagates to the caller.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CorruptionDetected : public std::runtime_error {
 public:
  explicit CorruptionDetected(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceLimitExceeded : public std::runtime_error {
 public:
  explicit ResourceLimitExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FailoverExhausted : public std::runtime_error {
 public:
  explicit FailoverExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace resonance::util
