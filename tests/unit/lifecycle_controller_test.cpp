#include "internal/core/lifecycle_controller.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/inventory_accountant.hpp"
#include "internal/core/item_registry.hpp"
#include "internal/core/product_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/registry/repository_asset_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::core::InventoryAccountant;
using ledger::core::ItemRegistry;
using ledger::core::LifecycleController;
using ledger::core::MintRequest;
using ledger::core::ProductCatalog;
using ledger::core::VariantMatcher;
using ledger::db::model::ProductRecord;
using ledger::model::Bucket;
using ledger::model::Index;
using ledger::model::ItemState;
using ledger::model::Location;

struct Backend {
  std::string                                              name;
  std::function<std::shared_ptr<ledger::db::Repository>()> make_repository;
  std::function<void()>                                    cleanup;
};

Backend MakeMemoryBackend() {
  return Backend{
      .name            = "memory",
      .make_repository = []() { return std::make_shared<ledger::db::memory::MemoryRepository>(); },
      .cleanup         = []() {},
  };
}

void RemoveDbFiles(const std::string& path) {
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

Backend MakeSqliteBackend() {
  const auto stamp = std::chrono::system_clock::now().time_since_epoch().count();
  auto       db_path =
      (std::filesystem::temp_directory_path() / ("supply_ledger_lifecycle_" + std::to_string(stamp) + ".db")).string();

  return Backend{
      .name = "sqlite",
      // every fixture starts from an empty file
      .make_repository =
          [db_path]() {
            RemoveDbFiles(db_path);
            auto db = std::make_shared<ledger::db::sqlite::SqliteDB>(db_path);
            ledger::db::sqlite::BootstrapSchema(*db);
            return std::make_shared<ledger::db::sqlite::SqliteRepository>(std::move(db));
          },
      .cleanup = [db_path]() { RemoveDbFiles(db_path); },
  };
}

struct Fixture {
  explicit Fixture(const Backend& backend) : repository(backend.make_repository()) {
  }

  std::shared_ptr<ledger::db::Repository>                    repository;
  std::shared_ptr<ledger::registry::RepositoryAssetRegistry> assets =
      std::make_shared<ledger::registry::RepositoryAssetRegistry>(repository);
  ProductCatalog      catalog{repository, VariantMatcher("BUFFER")};
  ItemRegistry        items{repository, assets, VariantMatcher("BUFFER"), "catalog"};
  LifecycleController lifecycle{repository, assets, VariantMatcher("BUFFER")};

  std::uint64_t product_id = catalog.CreateProduct("Shirt", {"S", "M", "BUFFER", "red"}, {2, 2, 0, 4});

  std::uint64_t Mint(const std::string& size, bool verified = true) {
    MintRequest req;
    req.product_id   = product_id;
    req.variants     = {size, "red"};
    req.is_chipped   = verified;
    req.is_digitized = verified;
    return items.MintItem(req);
  }

  ProductRecord Product() {
    return catalog.GetProduct(product_id);
  }
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFullLifecycleMovesOneUnitThroughBuckets(const Backend& backend) {
  Fixture    f(backend);
  const auto id = f.Mint("S");

  f.lifecycle.ReadyForAuction({id});
  assert(f.items.GetItem(id).state == ItemState::kReady);
  assert(f.Product().inventory[Index(Bucket::kAvailable)] == 1);

  f.lifecycle.SetBidStatus({id}, {true});
  assert(f.Product().inventory[Index(Bucket::kReserved)] == 1);
  assert(f.Product().inventory[Index(Bucket::kAvailable)] == 0);

  f.lifecycle.SetSaleStatus({id}, {true});
  assert(f.Product().inventory[Index(Bucket::kSold)] == 1);

  f.lifecycle.SetShippingStatus({id}, {true});
  assert(f.Product().inventory[Index(Bucket::kShipped)] == 1);
  assert(f.items.GetItem(id).location == Location::kTransit);

  f.lifecycle.SetDeliveryStatus({id}, {true});
  assert(f.items.GetItem(id).location == Location::kBuyer);
  f.lifecycle.SetDeliveryStatus({id}, {false});
  assert(f.items.GetItem(id).location == Location::kTransit);

  assert(InventoryAccountant::Total(f.Product()) == 1);
}

void TestReadyRequiresChippedAndDigitized(const Backend& backend) {
  Fixture    f(backend);
  const auto good = f.Mint("S");
  const auto bad  = f.Mint("M", false);

  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.ReadyForAuction({good, bad}); }));
  assert(f.items.GetItem(good).state == ItemState::kMinted);

  // already-ready items are left alone
  f.lifecycle.ReadyForAuction({good});
  f.lifecycle.ReadyForAuction({good});
  assert(f.items.GetItem(good).state == ItemState::kReady);
}

void TestParityEnforcement(const Backend& backend) {
  Fixture    f(backend);
  const auto a = f.Mint("S");
  const auto b = f.Mint("M");
  f.lifecycle.ReadyForAuction({a, b});
  const auto before = f.Product();

  assert(Throws<ledger::util::ParityError>([&] { f.lifecycle.SetBidStatus({a, b}, {true}); }));
  assert(Throws<ledger::util::ParityError>([&] { f.lifecycle.SetDeliveryStatus({a}, {}); }));

  assert(f.Product().inventory == before.inventory);
  assert(f.items.GetItem(a).state == ItemState::kReady);
  assert(f.items.GetItem(b).state == ItemState::kReady);
}

void TestBatchIsAtomic(const Backend& backend) {
  Fixture    f(backend);
  const auto a = f.Mint("S");
  const auto b = f.Mint("S");
  const auto c = f.Mint("M");
  f.lifecycle.ReadyForAuction({a, b});
  const auto before = f.Product();

  // c never became ready
  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.SetBidStatus({a, b, c}, {true, true, true}); }));
  assert(f.Product().inventory == before.inventory);
  assert(f.items.GetItem(a).state == ItemState::kReady);
  assert(f.items.GetItem(b).state == ItemState::kReady);

  // a false flag is not a bid
  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.SetBidStatus({a, b}, {true, false}); }));
  assert(f.items.GetItem(a).state == ItemState::kReady);

  // repeated id sees its own first step
  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.SetBidStatus({a, a}, {true, true}); }));
  assert(f.Product().inventory == before.inventory);

  // unknown id aborts the batch too
  assert(Throws<ledger::util::NotFound>([&] { f.lifecycle.SetBidStatus({a, 99}, {true, true}); }));
  assert(f.items.GetItem(a).state == ItemState::kReady);
}

void TestMixedSaleBatchIsAtomic(const Backend& backend) {
  Fixture    f(backend);
  const auto bidded = f.Mint("S");
  const auto ready  = f.Mint("M");
  f.lifecycle.ReadyForAuction({bidded, ready});
  f.lifecycle.SetBidStatus({bidded}, {true});
  const auto before = f.Product();

  // the eligible item comes first so its step would land before the failure
  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.SetSaleStatus({bidded, ready}, {true, true}); }));
  assert(f.Product().inventory == before.inventory);
  assert(f.items.GetItem(bidded).state == ItemState::kBidded);
  assert(f.items.GetItem(ready).state == ItemState::kReady);

  f.lifecycle.SetSaleStatus({bidded}, {true});
  assert(f.Product().inventory[Index(Bucket::kSold)] == 1);
}

void TestMixedShippingBatchIsAtomic(const Backend& backend) {
  Fixture    f(backend);
  const auto sold   = f.Mint("S");
  const auto bidded = f.Mint("M");
  f.lifecycle.ReadyForAuction({sold, bidded});
  f.lifecycle.SetBidStatus({sold, bidded}, {true, true});
  f.lifecycle.SetSaleStatus({sold}, {true});
  const auto before          = f.Product();
  const auto sold_location   = f.items.GetItem(sold).location;
  const auto bidded_location = f.items.GetItem(bidded).location;

  assert(Throws<ledger::util::IneligibleTransition>(
      [&] { f.lifecycle.SetShippingStatus({sold, bidded}, {true, true}); }));
  assert(f.Product().inventory == before.inventory);
  assert(f.items.GetItem(sold).state == ItemState::kSold);
  assert(f.items.GetItem(sold).location == sold_location);
  assert(f.items.GetItem(bidded).state == ItemState::kBidded);
  assert(f.items.GetItem(bidded).location == bidded_location);
}

void TestMixedDeliveryBatchIsAtomic(const Backend& backend) {
  Fixture    f(backend);
  const auto shipped = f.Mint("S");
  const auto sold    = f.Mint("M");
  f.lifecycle.ReadyForAuction({shipped, sold});
  f.lifecycle.SetBidStatus({shipped, sold}, {true, true});
  f.lifecycle.SetSaleStatus({shipped, sold}, {true, true});
  f.lifecycle.SetShippingStatus({shipped}, {true});
  const auto before        = f.Product();
  const auto sold_location = f.items.GetItem(sold).location;

  assert(Throws<ledger::util::IneligibleTransition>(
      [&] { f.lifecycle.SetDeliveryStatus({shipped, sold}, {true, true}); }));
  assert(f.items.GetItem(shipped).location == Location::kTransit);
  assert(f.items.GetItem(shipped).state == ItemState::kShipped);
  assert(f.items.GetItem(sold).location == sold_location);
  assert(f.items.GetItem(sold).state == ItemState::kSold);
  assert(f.Product().inventory == before.inventory);

  f.lifecycle.SetDeliveryStatus({shipped}, {true});
  assert(f.items.GetItem(shipped).location == Location::kBuyer);
}

void TestLifecycleOrdering(const Backend& backend) {
  Fixture    f(backend);
  const auto id = f.Mint("S");
  f.lifecycle.ReadyForAuction({id});
  const auto before = f.Product();

  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.SetSaleStatus({id}, {true}); }));
  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.SetShippingStatus({id}, {true}); }));
  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.SetDeliveryStatus({id}, {true}); }));
  assert(f.Product().inventory == before.inventory);

  const auto minted = f.Mint("M");
  assert(Throws<ledger::util::IneligibleTransition>([&] { f.lifecycle.SetBidStatus({minted}, {true}); }));
}

void TestMintBurnRoundTrip(const Backend& backend) {
  Fixture    f(backend);
  const auto before = f.Product();
  const auto id     = f.Mint("S");

  f.lifecycle.Burn(id);
  const auto after = f.Product();
  assert(after.quantity_per_variant == before.quantity_per_variant);
  assert(after.inventory == before.inventory);

  assert(Throws<ledger::util::NotFound>([&] { (void)f.items.GetItem(id); }));
  assert(Throws<ledger::util::NotFound>([&] { (void)f.items.OwnerOf(id); }));
  assert(Throws<ledger::util::NotFound>([&] { f.lifecycle.Burn(id); }));

  // ids are never reused
  assert(f.Mint("S") == id + 1);
}

void TestBurnDebitsTheOccupiedBucket(const Backend& backend) {
  Fixture    f(backend);
  const auto id = f.Mint("M");
  f.lifecycle.ReadyForAuction({id});
  f.lifecycle.SetBidStatus({id}, {true});
  f.lifecycle.SetSaleStatus({id}, {true});
  assert(f.Product().inventory[Index(Bucket::kSold)] == 1);

  f.lifecycle.Burn(id);
  const auto after = f.Product();
  assert(InventoryAccountant::Total(after) == 0);
  assert(after.quantity_per_variant == (std::vector<std::uint64_t>{2, 2, 0, 4}));
}

void TestBurnAfterProductChangeNeedsMatchingLabels(const Backend& backend) {
  Fixture    f(backend);
  const auto id     = f.Mint("S");
  const auto before = f.Product();

  f.catalog.UpdateProduct(f.product_id, "Shirt", {"XL", "BUFFER", "red"}, {3, 0, 3});
  assert(Throws<ledger::util::VariantMismatch>([&] { f.lifecycle.Burn(id); }));

  const auto after = f.Product();
  assert(after.inventory == before.inventory);
  assert(f.items.GetItem(id).state == ItemState::kMinted);
}

void RunSuite(const Backend& backend) {
  std::cout << "running lifecycle suite: " << backend.name << "\n";
  TestFullLifecycleMovesOneUnitThroughBuckets(backend);
  TestReadyRequiresChippedAndDigitized(backend);
  TestParityEnforcement(backend);
  TestBatchIsAtomic(backend);
  TestMixedSaleBatchIsAtomic(backend);
  TestMixedShippingBatchIsAtomic(backend);
  TestMixedDeliveryBatchIsAtomic(backend);
  TestLifecycleOrdering(backend);
  TestMintBurnRoundTrip(backend);
  TestBurnDebitsTheOccupiedBucket(backend);
  TestBurnAfterProductChangeNeedsMatchingLabels(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<Backend> backends;
  backends.push_back(MakeMemoryBackend());
  backends.push_back(MakeSqliteBackend());

  for (const auto& backend : backends) {
    RunSuite(backend);
  }

  std::cout << "supply_ledger_unit_lifecycle_controller: pass\n";
  return 0;
}
