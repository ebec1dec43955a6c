#pragma once

#include <stdexcept>
#include <string>

namespace ledger::util {

/*
  Central error types.

  Every ledger operation validates before it writes, so any of these
  escaping a core call means the call's transaction was abandoned.
  ledgerctl maps them to exit codes.
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller is not an operator (catalog owner + trusted verifier).
class AuthorizationError : public std::runtime_error {
 public:
  explicit AuthorizationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Parallel input sequences differ in length.
class ParityError : public std::runtime_error {
 public:
  explicit ParityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Variant/quantity consistency check failed on product create or update.
class InvalidInventoryCount : public std::runtime_error {
 public:
  explicit InvalidInventoryCount(const std::string& msg) : std::runtime_error(msg) {
  }
};

class VariantMismatch : public std::runtime_error {
 public:
  explicit VariantMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A counter would go below zero.
class CapacityExceeded : public std::runtime_error {
 public:
  explicit CapacityExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IneligibleTransition : public std::runtime_error {
 public:
  explicit IneligibleTransition(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ledger::util
