#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "internal/core/inventory_accountant.hpp"
#include "internal/core/variant_matcher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/registry/asset_registry.hpp"

namespace ledger::core {

/*
  LifecycleController

  Batch state transitions over items:

    Minted -> Ready -> Bidded -> Sold -> Shipped -> (Buyer | Transit)

  Every call runs in a single repository transaction. Elements are applied
  in order against the transaction's view, so a repeated id sees the
  earlier element's effect. Any throw abandons the whole batch.
*/
class LifecycleController {
 public:
  LifecycleController(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::AssetRegistry> assets,
                      VariantMatcher matcher);

  // Items must be chipped and digitized. Items already past Minted are left alone.
  void ReadyForAuction(const std::vector<std::uint64_t>& item_ids);

  void SetBidStatus(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags);
  void SetSaleStatus(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags);
  void SetShippingStatus(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags);

  // Shipped items only; true delivers to the buyer, false marks a return in transit.
  void SetDeliveryStatus(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags);

  void Burn(std::uint64_t item_id);

 private:
  struct Step {
    model::ItemState from;
    model::ItemState to;
    const char*      operation;
    const char*      reason;
  };

  void AdvanceBatch(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags, const Step& step);

  db::model::ItemRecord    LoadItem(db::Transaction& tx, std::uint64_t item_id, const char* operation);
  db::model::ProductRecord LoadProduct(db::Transaction& tx, std::uint64_t product_id, const char* operation);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<registry::AssetRegistry> assets_;
  VariantMatcher                           matcher_;
  InventoryAccountant                      accountant_;
};

} // namespace ledger::core
