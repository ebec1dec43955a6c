#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/api/transaction.hpp"

namespace ledger::registry {

/*
  Unique-asset registry the ledger calls into.

  The registry is the authoritative record of who holds an item id. Calls
  take the ledger's open transaction so that a mint or burn commits or
  rolls back together with the ledger change that caused it.

  Failures are reported as exceptions (util::AlreadyExists on a duplicate
  mint, util::NotFound for an unknown id).
*/
class AssetRegistry {
 public:
  virtual ~AssetRegistry() = default;

  virtual void Mint(db::Transaction& tx, const std::string& owner, std::uint64_t id) = 0;
  virtual void Transfer(db::Transaction& tx, std::uint64_t id, const std::string& to) = 0;
  virtual void Burn(db::Transaction& tx, std::uint64_t id) = 0;

  virtual std::optional<std::string> OwnerOf(db::Transaction& tx, std::uint64_t id) = 0;
};

} // namespace ledger::registry
