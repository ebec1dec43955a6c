#include "internal/core/inventory_accountant.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace ledger::core {

using ledger::model::Bucket;
using ledger::model::Index;
using ledger::model::ItemState;

namespace {

void CheckSlot(const db::model::ProductRecord& product, std::size_t slot) {
  if (slot >= product.quantity_per_variant.size()) {
    throw ledger::util::VariantMismatch("product " + std::to_string(product.id) + " has no variant slot " + std::to_string(slot));
  }
}

} // namespace

void InventoryAccountant::ConsumeVariantStock(db::model::ProductRecord& product, const std::vector<std::size_t>& slots) const {
  for (auto slot : slots) {
    CheckSlot(product, slot);
    const auto wanted = static_cast<std::uint64_t>(std::count(slots.begin(), slots.end(), slot));
    if (product.quantity_per_variant[slot] < wanted) {
      throw ledger::util::CapacityExceeded("max quantity reached for variant '" + product.variants[slot] + "' of product " +
                                           std::to_string(product.id));
    }
  }
  for (auto slot : slots) {
    --product.quantity_per_variant[slot];
  }
}

void InventoryAccountant::RestoreVariantStock(db::model::ProductRecord& product, const std::vector<std::size_t>& slots) const {
  for (auto slot : slots) {
    CheckSlot(product, slot);
    if (product.quantity_per_variant[slot] == std::numeric_limits<std::uint64_t>::max()) {
      throw ledger::util::CapacityExceeded("variant stock overflow on product " + std::to_string(product.id));
    }
  }
  for (auto slot : slots) {
    ++product.quantity_per_variant[slot];
  }
}

void InventoryAccountant::Credit(db::model::ProductRecord& product, Bucket bucket) const {
  auto& counter = product.inventory[Index(bucket)];
  if (counter == std::numeric_limits<std::uint64_t>::max()) {
    throw ledger::util::CapacityExceeded("bucket " + std::string(ledger::model::ToString(bucket)) + " overflow on product " +
                                         std::to_string(product.id));
  }
  ++counter;
}

void InventoryAccountant::Debit(db::model::ProductRecord& product, Bucket bucket) const {
  auto& counter = product.inventory[Index(bucket)];
  if (counter == 0) {
    throw ledger::util::CapacityExceeded("max quantity reached: bucket " + std::string(ledger::model::ToString(bucket)) +
                                         " is empty on product " + std::to_string(product.id));
  }
  --counter;
}

void InventoryAccountant::Move(db::model::ProductRecord& product, Bucket from, Bucket to) const {
  if (from == to) {
    return;
  }
  // Debit validates; Credit on the other bucket cannot fail once a unit left.
  Debit(product, from);
  ++product.inventory[Index(to)];
}

void InventoryAccountant::ApplyTransition(db::model::ProductRecord& product, db::model::ItemRecord& item, ItemState target) const {
  if (!ledger::model::CanTransition(item.state, target)) {
    throw ledger::util::IneligibleTransition("item " + std::to_string(item.id) + " cannot move from " +
                                             std::string(ledger::model::ToString(item.state)) + " to " +
                                             std::string(ledger::model::ToString(target)));
  }
  if (item.product_id != product.id) {
    throw ledger::util::InvalidState("item " + std::to_string(item.id) + " does not belong to product " + std::to_string(product.id));
  }

  Move(product, ledger::model::BucketOf(item.state), ledger::model::BucketOf(target));
  item.state = target;
}

std::uint64_t InventoryAccountant::Total(const db::model::ProductRecord& product) {
  std::uint64_t total = 0;
  for (auto count : product.inventory) {
    total += count;
  }
  return total;
}

} // namespace ledger::core
