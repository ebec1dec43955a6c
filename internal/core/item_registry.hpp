#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/inventory_accountant.hpp"
#include "internal/core/variant_matcher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/location.hpp"
#include "internal/registry/asset_registry.hpp"

namespace ledger::core {

struct MintRequest {
  std::uint64_t            product_id = 0;
  std::vector<std::string> variants;
  std::uint64_t            price        = 0;
  model::Location          location     = model::Location::kSeller;
  bool                     is_chipped   = false;
  bool                     is_digitized = false;
  std::string              metadata_ref;
};

/*
  ItemRegistry

  Owns item rows. Minting consumes one unit of every matched variant slot
  and credits the product's available bucket; the new id is minted to the
  catalog owner in the asset registry inside the same transaction.
*/
class ItemRegistry {
 public:
  ItemRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::AssetRegistry> assets,
               VariantMatcher matcher, std::string catalog_owner);

  std::uint64_t MintItem(const MintRequest& request);

  // Administrative update. Lifecycle state and variants are not touched.
  void UpdateItem(std::uint64_t item_id, std::uint64_t price, model::Location location, bool is_chipped, bool is_digitized);

  void                       SetMetadataRef(std::uint64_t item_id, const std::string& uri);
  std::optional<std::string> GetMetadataRef(std::uint64_t item_id);

  // Moves the asset and refreshes the cached owner from the registry.
  void        TransferItem(std::uint64_t item_id, const std::string& to);
  std::string OwnerOf(std::uint64_t item_id);

  db::model::ItemRecord              GetItem(std::uint64_t item_id);
  std::vector<std::string>           GetItemVariants(std::uint64_t item_id);
  std::vector<db::model::ItemRecord> ListItems(std::uint64_t product_id);

  std::uint64_t NextItemId();

  const std::string& CatalogOwner() const {
    return catalog_owner_;
  }

 private:
  db::model::ItemRecord LoadItem(db::Transaction& tx, std::uint64_t item_id, const char* context);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<registry::AssetRegistry> assets_;
  VariantMatcher                           matcher_;
  InventoryAccountant                      accountant_;
  std::string                              catalog_owner_;
};

} // namespace ledger::core
