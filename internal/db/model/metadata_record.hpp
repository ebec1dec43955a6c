#pragma once

#include <cstdint>
#include <string>

namespace ledger::db::model {

/*
  Metadata reference for an item (URI or content hash).

  The ledger only stores the reference; the document lives elsewhere.
*/

struct MetadataRecord {
  std::uint64_t item_id = 0;

  std::string uri;

  // epoch ms
  uint64_t updated_at_ms = 0;
};

} // namespace ledger::db::model
