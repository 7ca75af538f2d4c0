#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::db {

// Raises the service-layer exception matching a failed Result.
inline void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw dispatch::util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw dispatch::util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::SerializationFailure:
      throw dispatch::util::StateConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace dispatch::db
