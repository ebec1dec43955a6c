#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::uint64_t ReadCounter(sqlite3* db, const char* name);
  Result TakeCounter(sqlite3* db, const char* name, std::uint64_t* value);
  Result WriteProductVariants(sqlite3* db, const model::ProductRecord& r);
  Result WriteItemChildren(sqlite3* db, const model::ItemRecord& r);
  void LoadProductVariants(sqlite3* db, model::ProductRecord& r);
  void LoadItemChildren(sqlite3* db, model::ItemRecord& r);
};

}
