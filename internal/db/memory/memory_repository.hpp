#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ledger::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProduct(Transaction&, model::ProductRecord&) override;
  std::optional<model::ProductRecord> GetProduct(Transaction&, std::uint64_t) override;
  std::vector<model::ProductRecord> ListProducts(Transaction&) override;
  Result UpdateProduct(Transaction&, const model::ProductRecord&) override;
  std::uint64_t NextProductId(Transaction&) override;

  Result InsertItem(Transaction&, model::ItemRecord&) override;
  std::optional<model::ItemRecord> GetItem(Transaction&, std::uint64_t) override;
  std::vector<model::ItemRecord> ListItemsByProduct(Transaction&, std::uint64_t product_id) override;
  Result UpdateItem(Transaction&, const model::ItemRecord&) override;
  Result DeleteItem(Transaction&, std::uint64_t) override;
  std::uint64_t NextItemId(Transaction&) override;

  Result UpsertMetadata(Transaction&, const model::MetadataRecord&) override;
  std::optional<model::MetadataRecord> GetMetadata(Transaction&, std::uint64_t) override;

  Result InsertAsset(Transaction&, const model::AssetRecord&) override;
  std::optional<model::AssetRecord> GetAsset(Transaction&, std::uint64_t) override;
  Result UpdateAsset(Transaction&, const model::AssetRecord&) override;
  Result DeleteAsset(Transaction&, std::uint64_t) override;

private:
  friend class MemoryTransaction;

  // ordered maps keep listings in id order, matching the sqlite backend
  struct State {
    std::map<std::uint64_t, model::ProductRecord>  products;
    std::map<std::uint64_t, model::ItemRecord>     items;
    std::map<std::uint64_t, model::MetadataRecord> metadata;
    std::map<std::uint64_t, model::AssetRecord>    assets;
    std::uint64_t next_product_id = 0;
    std::uint64_t next_item_id    = 0;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

}
