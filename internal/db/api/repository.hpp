#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/db/model/metadata_record.hpp"
#include "internal/db/model/product_record.hpp"

namespace ledger::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Id counters are transactional: an insert that rolls back does not
    consume its id, a committed one never gets reused

  The DB is the source of truth for:
    products and their buckets
    items and their lifecycle state
    metadata references
    asset ownership
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Products
  // ---------------------------------------------------------------------

  // Assigns record.id from the product counter.
  virtual Result InsertProduct(Transaction&, model::ProductRecord&) = 0;

  virtual std::optional<model::ProductRecord> GetProduct(Transaction&, std::uint64_t id) = 0;

  virtual std::vector<model::ProductRecord> ListProducts(Transaction&) = 0;

  virtual Result UpdateProduct(Transaction&, const model::ProductRecord&) = 0;

  virtual std::uint64_t NextProductId(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Items
  // ---------------------------------------------------------------------

  // Assigns record.id from the item counter.
  virtual Result InsertItem(Transaction&, model::ItemRecord&) = 0;

  virtual std::optional<model::ItemRecord> GetItem(Transaction&, std::uint64_t id) = 0;

  virtual std::vector<model::ItemRecord> ListItemsByProduct(Transaction&, std::uint64_t product_id) = 0;

  virtual Result UpdateItem(Transaction&, const model::ItemRecord&) = 0;

  // Also drops the item's metadata reference.
  virtual Result DeleteItem(Transaction&, std::uint64_t id) = 0;

  virtual std::uint64_t NextItemId(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Metadata references
  // ---------------------------------------------------------------------

  virtual Result UpsertMetadata(Transaction&, const model::MetadataRecord&) = 0;

  virtual std::optional<model::MetadataRecord> GetMetadata(Transaction&, std::uint64_t item_id) = 0;

  // ---------------------------------------------------------------------
  // Asset ownership
  // ---------------------------------------------------------------------

  virtual Result InsertAsset(Transaction&, const model::AssetRecord&) = 0;

  virtual std::optional<model::AssetRecord> GetAsset(Transaction&, std::uint64_t id) = 0;

  virtual Result UpdateAsset(Transaction&, const model::AssetRecord&) = 0;

  virtual Result DeleteAsset(Transaction&, std::uint64_t id) = 0;
};

} // namespace ledger::db
