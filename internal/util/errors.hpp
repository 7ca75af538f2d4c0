#pragma once

#include <stdexcept>
#include <string>

namespace dispatch::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Arbitration outcomes are NOT errors and never use these.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Requested ride lifecycle transition is not in the allowed set.
class InvalidTransition : public std::runtime_error {
 public:
  explicit InvalidTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Compare-and-set lost against a concurrent writer; caller must re-fetch.
class StateConflict : public std::runtime_error {
 public:
  explicit StateConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace dispatch::util
