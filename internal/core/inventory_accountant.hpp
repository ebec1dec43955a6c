#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "internal/db/model/item_record.hpp"
#include "internal/db/model/product_record.hpp"
#include "internal/model/state_machine.hpp"

namespace ledger::core {

/*
  InventoryAccountant

  The conservation engine. Every change to a product's buckets or
  per-variant stock goes through here. Each operation validates fully
  before it writes, so a throw leaves the records untouched.

  Invariants maintained:
    - no counter ever goes below zero
    - only Credit (mint) and Debit (burn) change the bucket total
    - an item's state always names the bucket its unit occupies
*/
class InventoryAccountant {
 public:
  // Takes one unit from every slot. Throws util::CapacityExceeded if any is 0.
  void ConsumeVariantStock(db::model::ProductRecord& product, const std::vector<std::size_t>& slots) const;

  // Returns one unit to every slot.
  void RestoreVariantStock(db::model::ProductRecord& product, const std::vector<std::size_t>& slots) const;

  void Credit(db::model::ProductRecord& product, model::Bucket bucket) const;

  // Throws util::CapacityExceeded if the bucket is already 0.
  void Debit(db::model::ProductRecord& product, model::Bucket bucket) const;

  void Move(db::model::ProductRecord& product, model::Bucket from, model::Bucket to) const;

  /*
    Moves the item's unit from the bucket of its current state to the
    bucket of `target`, then records the new state on the item. Throws
    util::IneligibleTransition for anything but a single forward step.
  */
  void ApplyTransition(db::model::ProductRecord& product, db::model::ItemRecord& item, model::ItemState target) const;

  static std::uint64_t Total(const db::model::ProductRecord& product);
};

} // namespace ledger::core
