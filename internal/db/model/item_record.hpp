#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/location.hpp"
#include "internal/model/state_machine.hpp"

namespace ledger::db::model {

/*
  Persistent item row.

  IMPORTANT:
  - state is the single source of the item's lifecycle position.
  - owner/owners are a cache of the asset registry; the registry wins.
*/

struct ItemRecord {
  std::uint64_t id         = 0;
  std::uint64_t product_id = 0;

  std::string              owner;
  std::vector<std::string> owners;

  // one label per product dimension, in dimension order
  std::vector<std::string> variants;

  std::uint64_t           price    = 0;
  ledger::model::Location location = ledger::model::Location::kSeller;

  bool is_chipped   = false;
  bool is_digitized = false;

  ledger::model::ItemState state = ledger::model::ItemState::kMinted;
};

} // namespace ledger::db::model
