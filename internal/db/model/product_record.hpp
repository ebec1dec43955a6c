#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"

namespace ledger::db::model {

/*
  Persistent product row.

  variants is a flat label list split into dimensions by separator
  sentinels; quantity_per_variant is index-aligned with it.
  inventory counts units across all variants and is independent of the
  per-variant counters.
*/

struct ProductRecord {
  std::uint64_t id = 0;

  std::string name;

  std::vector<std::string>   variants;
  std::vector<std::uint64_t> quantity_per_variant;

  ledger::model::Inventory inventory{};
};

} // namespace ledger::db::model
