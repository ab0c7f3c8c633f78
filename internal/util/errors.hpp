#pragma once

#include <stdexcept>
#include <string>

namespace caretask::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Malformed schedule definition, time string, or request field.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// No active schedule matches a completion.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Schedule store failed or returned a transport error.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Due cache failed or returned a transport error.
class CacheUnavailable : public std::runtime_error {
 public:
  explicit CacheUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace caretask::util
