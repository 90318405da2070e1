#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace checkout::db {

// Conflict is a lost optimistic race; every other failure is internal.
inline void ThrowIfDbError(const Result& result, const std::string& prefix) {
  if (result) return;

  const std::string message = prefix + ": " + result.message;
  if (result.code == ErrorCode::Conflict) {
    throw util::VersionConflict(message);
  }
  throw std::runtime_error(message);
}

} // namespace checkout::db
