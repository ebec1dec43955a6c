#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"

namespace {

using ledger::db::ErrorCode;
using ledger::db::Repository;
using ledger::db::memory::MemoryRepository;
using ledger::db::model::AssetRecord;
using ledger::db::model::ItemRecord;
using ledger::db::model::MetadataRecord;
using ledger::db::model::ProductRecord;
using ledger::model::ItemState;
using ledger::model::Location;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // writes straight to storage, bypassing the repository; empty for memory
  std::function<void(const std::string&)>           exec_raw;
};

ProductRecord MakeShirt() {
  ProductRecord p;
  p.name                 = "Shirt";
  p.variants             = {"S", "M", "BUFFER", "red"};
  p.quantity_per_variant = {2, 1, 0, 3};
  p.inventory            = {1, 2, 3, 4};
  return p;
}

void VerifyProductReadWrite(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.NextProductId(*tx) == 0);

  auto shirt = MakeShirt();
  assert(repo.InsertProduct(*tx, shirt));
  assert(shirt.id == 0);

  auto cap = MakeShirt();
  cap.name = "Cap";
  assert(repo.InsertProduct(*tx, cap));
  assert(cap.id == 1);
  assert(repo.NextProductId(*tx) == 2);

  auto loaded = repo.GetProduct(*tx, shirt.id);
  assert(loaded.has_value());
  assert(loaded->name == "Shirt");
  assert(loaded->variants == shirt.variants);
  assert(loaded->quantity_per_variant == shirt.quantity_per_variant);
  assert(loaded->inventory == shirt.inventory);

  // shrink the variant list; stale positions must not survive
  loaded->variants             = {"XL"};
  loaded->quantity_per_variant = {9};
  assert(repo.UpdateProduct(*tx, *loaded));
  auto updated = repo.GetProduct(*tx, shirt.id);
  assert(updated->variants == std::vector<std::string>{"XL"});
  assert(updated->quantity_per_variant == std::vector<std::uint64_t>{9});

  ProductRecord ghost = MakeShirt();
  ghost.id            = 77;
  assert(repo.UpdateProduct(*tx, ghost).code == ErrorCode::NotFound);
  assert(!repo.GetProduct(*tx, 77).has_value());

  const auto all = repo.ListProducts(*tx);
  assert(all.size() == 2);
  assert(all[0].id == 0 && all[1].id == 1);
  tx->Commit();
}

void VerifyItemReadWrite(Repository& repo) {
  auto tx = repo.Begin();

  auto product = MakeShirt();
  assert(repo.InsertProduct(*tx, product));

  ItemRecord item;
  item.product_id   = product.id;
  item.owner        = "catalog";
  item.owners       = {"catalog"};
  item.variants     = {"red", "S"};
  item.price        = 1500;
  item.location     = Location::kHq;
  item.is_chipped   = true;
  item.is_digitized = false;
  item.state        = ItemState::kReady;

  const auto expected_id = repo.NextItemId(*tx);
  assert(repo.InsertItem(*tx, item));
  assert(item.id == expected_id);
  assert(repo.NextItemId(*tx) == expected_id + 1);

  auto loaded = repo.GetItem(*tx, item.id);
  assert(loaded.has_value());
  assert(loaded->product_id == product.id);
  assert(loaded->variants == (std::vector<std::string>{"red", "S"}));
  assert(loaded->owners == std::vector<std::string>{"catalog"});
  assert(loaded->location == Location::kHq);
  assert(loaded->is_chipped && !loaded->is_digitized);
  assert(loaded->state == ItemState::kReady);

  loaded->owner = "partner";
  loaded->owners.push_back("partner");
  loaded->state = ItemState::kBidded;
  assert(repo.UpdateItem(*tx, *loaded));

  auto updated = repo.GetItem(*tx, item.id);
  assert(updated->owner == "partner");
  assert(updated->owners == (std::vector<std::string>{"catalog", "partner"}));
  assert(updated->state == ItemState::kBidded);

  assert(repo.ListItemsByProduct(*tx, product.id).size() == 1);
  assert(repo.ListItemsByProduct(*tx, product.id + 100).empty());

  MetadataRecord metadata{.item_id = item.id, .uri = "ipfs://a", .updated_at_ms = NowMs()};
  assert(repo.UpsertMetadata(*tx, metadata));
  metadata.uri = "ipfs://b";
  assert(repo.UpsertMetadata(*tx, metadata));
  assert(repo.GetMetadata(*tx, item.id)->uri == "ipfs://b");

  assert(repo.DeleteItem(*tx, item.id));
  assert(!repo.GetItem(*tx, item.id).has_value());
  assert(!repo.GetMetadata(*tx, item.id).has_value());
  assert(repo.DeleteItem(*tx, item.id).code == ErrorCode::NotFound);

  // a deleted id is not handed out again
  assert(repo.NextItemId(*tx) == expected_id + 1);
  tx->Commit();
}

void VerifyItemRequiresProduct(Repository& repo) {
  auto tx = repo.Begin();

  ItemRecord orphan;
  orphan.product_id = 9999;
  orphan.owner      = "catalog";
  orphan.variants   = {"S"};
  assert(repo.InsertItem(*tx, orphan).code == ErrorCode::ConstraintViolation);
  tx->Rollback();
}

void VerifyAssetReadWrite(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.InsertAsset(*tx, AssetRecord{.id = 500, .owner = "catalog"}));
  assert(repo.InsertAsset(*tx, AssetRecord{.id = 500, .owner = "someone"}).code == ErrorCode::AlreadyExists);
  assert(repo.GetAsset(*tx, 500)->owner == "catalog");

  assert(repo.UpdateAsset(*tx, AssetRecord{.id = 500, .owner = "buyer"}));
  assert(repo.GetAsset(*tx, 500)->owner == "buyer");
  assert(repo.UpdateAsset(*tx, AssetRecord{.id = 501, .owner = "buyer"}).code == ErrorCode::NotFound);

  assert(repo.DeleteAsset(*tx, 500));
  assert(!repo.GetAsset(*tx, 500).has_value());
  assert(repo.DeleteAsset(*tx, 500).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  std::uint64_t next_product = 0;
  {
    auto tx      = repo.Begin();
    next_product = repo.NextProductId(*tx);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto p  = MakeShirt();
    assert(repo.InsertProduct(*tx, p));
    assert(repo.InsertAsset(*tx, AssetRecord{.id = 900, .owner = "catalog"}));
    tx->Rollback();
  }

  {
    // destructor without commit also discards
    auto tx = repo.Begin();
    auto p  = MakeShirt();
    assert(repo.InsertProduct(*tx, p));
  }

  auto tx = repo.Begin();
  assert(repo.NextProductId(*tx) == next_product);
  assert(!repo.GetProduct(*tx, next_product).has_value());
  assert(!repo.GetAsset(*tx, 900).has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto          repo = backend.make_repository();
  std::uint64_t product_id;
  std::uint64_t item_id;
  {
    auto tx = repo->Begin();

    auto p = MakeShirt();
    p.name = "Durable";
    assert(repo->InsertProduct(*tx, p));
    product_id = p.id;

    ItemRecord item;
    item.product_id = product_id;
    item.owner      = "catalog";
    item.owners     = {"catalog"};
    item.variants   = {"M", "red"};
    item.state      = ItemState::kSold;
    assert(repo->InsertItem(*tx, item));
    item_id = item.id;

    assert(repo->UpsertMetadata(*tx, MetadataRecord{.item_id = item_id, .uri = "sha256:durable", .updated_at_ms = NowMs()}));
    assert(repo->InsertAsset(*tx, AssetRecord{.id = item_id, .owner = "catalog"}));

    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto p  = repo->GetProduct(*tx, product_id);
  assert(p.has_value());
  assert(p->name == "Durable");
  assert(p->inventory == MakeShirt().inventory);

  auto item = repo->GetItem(*tx, item_id);
  assert(item.has_value());
  assert(item->state == ItemState::kSold);
  assert(item->variants == (std::vector<std::string>{"M", "red"}));
  assert(repo->GetMetadata(*tx, item_id)->uri == "sha256:durable");
  assert(repo->GetAsset(*tx, item_id)->owner == "catalog");

  // counters survive a reopen
  assert(repo->NextProductId(*tx) == product_id + 1);
  assert(repo->NextItemId(*tx) == item_id + 1);
  tx->Commit();
}

template <typename Fn>
bool ThrowsRuntimeError(Fn&& fn) {
  try {
    fn();
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void VerifyUnknownEnumsRejectedOnRead(BackendFactory& backend) {
  if (!backend.exec_raw) {
    return;
  }

  auto          repo = backend.make_repository();
  std::uint64_t item_id;
  {
    auto tx = repo->Begin();
    auto p  = MakeShirt();
    assert(repo->InsertProduct(*tx, p));

    ItemRecord item;
    item.product_id = p.id;
    item.owner      = "catalog";
    item.owners     = {"catalog"};
    item.variants   = {"S", "red"};
    item.location   = Location::kPartner;
    assert(repo->InsertItem(*tx, item));
    item_id = item.id;
    tx->Commit();
  }

  const auto id = std::to_string(item_id);
  backend.exec_raw("UPDATE item SET location = 99 WHERE id = " + id + ";");
  {
    auto tx = repo->Begin();
    assert(ThrowsRuntimeError([&] { (void)repo->GetItem(*tx, item_id); }));
    tx->Rollback();
  }

  backend.exec_raw("UPDATE item SET location = -1 WHERE id = " + id + ";");
  {
    auto tx = repo->Begin();
    assert(ThrowsRuntimeError([&] { (void)repo->GetItem(*tx, item_id); }));
    tx->Rollback();
  }

  backend.exec_raw("UPDATE item SET location = 4, state = 42 WHERE id = " + id + ";");
  {
    auto tx = repo->Begin();
    assert(ThrowsRuntimeError([&] { (void)repo->GetItem(*tx, item_id); }));
    tx->Rollback();
  }

  // a repaired row reads back normally
  backend.exec_raw("UPDATE item SET state = 4 WHERE id = " + id + ";");
  auto tx   = repo->Begin();
  auto item = repo->GetItem(*tx, item_id);
  assert(item.has_value());
  assert(item->location == Location::kBuyer);
  assert(item->state == ItemState::kShipped);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .exec_raw         = {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("supply_ledger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<ledger::db::sqlite::SqliteDB>(db_path);
    ledger::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<ledger::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .exec_raw = [db_path](const std::string& sql) {
        ledger::db::sqlite::SqliteDB raw(db_path);
        raw.Exec(sql);
      },
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyProductReadWrite(*repo);
    VerifyItemReadWrite(*repo);
    VerifyItemRequiresProduct(*repo);
    VerifyAssetReadWrite(*repo);
    VerifyRollbackBehavior(*repo);
  }

  VerifyRestartDurability(backend);
  VerifyUnknownEnumsRejectedOnRead(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "supply_ledger_integration_repository_parity: pass\n";
  return 0;
}
