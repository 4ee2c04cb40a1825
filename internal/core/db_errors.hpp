#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::core {

// Translates a repository result into the util:: exception hierarchy.
inline void ThrowIfDbError(const flowstore::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case flowstore::db::ErrorCode::NotFound:
      throw flowstore::util::NotFound(message);
    case flowstore::db::ErrorCode::AlreadyExists:
    case flowstore::db::ErrorCode::ConstraintViolation:
      throw flowstore::util::ConstraintViolation(message);
    default:
      throw flowstore::util::StorageError(message);
  }
}

} // namespace flowstore::core
