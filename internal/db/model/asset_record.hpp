#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

// Ownership row kept by the repository-backed asset registry.
struct AssetRecord {
  std::uint64_t id = 0;
  std::string   owner;
};

} // namespace ledger::db::model
