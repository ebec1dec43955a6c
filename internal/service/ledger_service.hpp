#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/item_registry.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/db/model/product_record.hpp"
#include "service_context.hpp"

namespace ledger::service {

/*
  LedgerService

  Entry point for every ledger operation. Mutators take the calling
  account first and require it to be an operator; reads are open.
  Failures are logged with the route name and rethrown unchanged.
*/
class LedgerService {
 public:
  explicit LedgerService(ServiceContext ctx);

  // Products
  std::uint64_t CreateProduct(const std::string& caller, const std::string& name,
                              const std::vector<std::string>& variants, const std::vector<std::uint64_t>& quantities);
  void          UpdateProduct(const std::string& caller, std::uint64_t product_id, const std::string& name,
                              const std::vector<std::string>& variants, const std::vector<std::uint64_t>& quantities);

  db::model::ProductRecord              GetProduct(std::uint64_t product_id);
  std::vector<db::model::ProductRecord> ListProducts();
  std::uint64_t                         NextProductId();

  // Items
  std::uint64_t MintItem(const std::string& caller, const core::MintRequest& request);
  void          UpdateItem(const std::string& caller, std::uint64_t item_id, std::uint64_t price,
                           model::Location location, bool is_chipped, bool is_digitized);
  void          SetMetadataRef(const std::string& caller, std::uint64_t item_id, const std::string& uri);
  void          TransferItem(const std::string& caller, std::uint64_t item_id, const std::string& to);

  db::model::ItemRecord              GetItem(std::uint64_t item_id);
  std::vector<std::string>           GetItemVariants(std::uint64_t item_id);
  std::vector<db::model::ItemRecord> ListItems(std::uint64_t product_id);
  std::optional<std::string>         GetMetadataRef(std::uint64_t item_id);
  std::string                        OwnerOf(std::uint64_t item_id);
  std::uint64_t                      NextItemId();

  // Lifecycle
  void ReadyForAuction(const std::string& caller, const std::vector<std::uint64_t>& item_ids);
  void SetBidStatus(const std::string& caller, const std::vector<std::uint64_t>& item_ids,
                    const std::vector<bool>& flags);
  void SetSaleStatus(const std::string& caller, const std::vector<std::uint64_t>& item_ids,
                     const std::vector<bool>& flags);
  void SetShippingStatus(const std::string& caller, const std::vector<std::uint64_t>& item_ids,
                         const std::vector<bool>& flags);
  void SetDeliveryStatus(const std::string& caller, const std::vector<std::uint64_t>& item_ids,
                         const std::vector<bool>& flags);
  void Burn(const std::string& caller, std::uint64_t item_id);

 private:
  ServiceContext ctx_;
};

} // namespace ledger::service
