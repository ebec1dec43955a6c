#include "internal/core/product_catalog.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using ledger::core::ProductCatalog;
using ledger::core::VariantMatcher;
using ledger::db::memory::MemoryRepository;

ProductCatalog MakeCatalog() {
  return ProductCatalog(std::make_shared<MemoryRepository>(), VariantMatcher("BUFFER"));
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreateAssignsSequentialIds() {
  auto catalog = MakeCatalog();
  assert(catalog.NextProductId() == 0);

  const auto first  = catalog.CreateProduct("Shirt", {"S", "BUFFER", "red"}, {5, 0, 5});
  const auto second = catalog.CreateProduct("Cap", {"one"}, {3});
  assert(first == 0);
  assert(second == 1);
  assert(catalog.NextProductId() == 2);

  const auto shirt = catalog.GetProduct(first);
  assert(shirt.name == "Shirt");
  assert(shirt.quantity_per_variant == (std::vector<std::uint64_t>{5, 0, 5}));
  for (auto count : shirt.inventory) {
    assert(count == 0);
  }
  assert(catalog.ListProducts().size() == 2);
}

void TestCreateValidatesLayout() {
  auto catalog = MakeCatalog();

  assert(Throws<ledger::util::InvalidInventoryCount>(
      [&] { catalog.CreateProduct("Shirt", {"S", "BUFFER", "red"}, {5, 0, 3}); }));
  assert(Throws<ledger::util::ParityError>([&] { catalog.CreateProduct("Shirt", {"S", "BUFFER"}, {5}); }));
  assert(Throws<ledger::util::InvalidInventoryCount>([&] { catalog.CreateProduct("Empty", {}, {}); }));
  assert(Throws<ledger::util::InvalidInventoryCount>([&] { catalog.CreateProduct("Hollow", {"BUFFER", "red"}, {0, 4}); }));

  // two separators: 12 units over three dimensions of 4
  const auto id = catalog.CreateProduct("Boot", {"40", "42", "BUFFER", "black", "BUFFER", "wide", "narrow"},
                                        {2, 2, 0, 4, 0, 1, 3});
  assert(id == 0);

  // failed creates consumed no ids
  assert(catalog.NextProductId() == 1);
}

void TestUpdateReplacesWholesale() {
  auto       catalog = MakeCatalog();
  const auto id      = catalog.CreateProduct("Shirt", {"S", "BUFFER", "red"}, {5, 0, 5});

  catalog.UpdateProduct(id, "Tee", {"S", "M", "BUFFER", "red"}, {1, 1, 0, 2});
  const auto updated = catalog.GetProduct(id);
  assert(updated.name == "Tee");
  assert(updated.variants.size() == 4);

  assert(Throws<ledger::util::NotFound>([&] { catalog.UpdateProduct(99, "x", {"a"}, {1}); }));
  assert(Throws<ledger::util::ParityError>([&] { catalog.UpdateProduct(id, "x", {"a"}, {1, 2}); }));

  // rejected update leaves the record as it was
  assert(catalog.GetProduct(id).name == "Tee");
}

void TestRepeatedLabelsRejected() {
  auto catalog = MakeCatalog();

  // same label on both sides of the separator
  assert(Throws<ledger::util::InvalidInventoryCount>(
      [&] { catalog.CreateProduct("Tee", {"red", "BUFFER", "red"}, {1, 0, 1}); }));
  // same label twice inside one dimension
  assert(Throws<ledger::util::InvalidInventoryCount>(
      [&] { catalog.CreateProduct("Tee", {"S", "S", "BUFFER", "red"}, {1, 1, 0, 2}); }));
  // repeated separators are fine
  const auto id = catalog.CreateProduct("Boot", {"40", "BUFFER", "black", "BUFFER", "wide"}, {2, 0, 2, 0, 2});
  assert(id == 0);
  assert(catalog.NextProductId() == 1);

  assert(Throws<ledger::util::InvalidInventoryCount>(
      [&] { catalog.UpdateProduct(id, "Boot", {"40", "40", "BUFFER", "black"}, {1, 1, 0, 2}); }));
  const auto unchanged = catalog.GetProduct(id);
  assert(unchanged.variants.size() == 5);
  assert(unchanged.variants[0] == "40");
}

void TestGetUnknownProduct() {
  auto catalog = MakeCatalog();
  assert(Throws<ledger::util::NotFound>([&] { (void)catalog.GetProduct(0); }));
}

} // namespace

int main() {
  TestCreateAssignsSequentialIds();
  TestCreateValidatesLayout();
  TestUpdateReplacesWholesale();
  TestRepeatedLabelsRejected();
  TestGetUnknownProduct();

  std::cout << "supply_ledger_unit_product_catalog: pass\n";
  return 0;
}
