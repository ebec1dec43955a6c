#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace ledger::util {

// Translates a repository Result into the matching exception.
inline void ThrowIfDbError(const ledger::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ledger::db::ErrorCode::AlreadyExists:
      throw AlreadyExists(message);
    case ledger::db::ErrorCode::NotFound:
      throw NotFound(message);
    case ledger::db::ErrorCode::Conflict:
      throw InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace ledger::util
