#include "ledger_service.hpp"

#include <chrono>
#include <type_traits>

#include "internal/auth/access_control.hpp"
#include "internal/core/lifecycle_controller.hpp"
#include "internal/core/product_catalog.hpp"
#include "internal/observability/logging.hpp"

namespace ledger::service {

namespace {

template <typename Fn>
auto ObserveCall(std::string_view route, std::string_view caller, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      LEDGER_LOG_DEBUG("call completed", {ledger::observability::StringField("route", route),
                                          ledger::observability::UintField("elapsed_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      LEDGER_LOG_DEBUG("call completed", {ledger::observability::StringField("route", route),
                                          ledger::observability::UintField("elapsed_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    LEDGER_LOG_ERROR("call failed", {ledger::observability::StringField("route", route),
                                     ledger::observability::StringField("caller", caller),
                                     ledger::observability::StringField("error", ex.what()),
                                     ledger::observability::UintField("elapsed_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::uint64_t LedgerService::CreateProduct(const std::string& caller, const std::string& name,
                                           const std::vector<std::string>&   variants,
                                           const std::vector<std::uint64_t>& quantities) {
  return ObserveCall("LedgerService.CreateProduct", caller, [&] {
    ctx_.access->RequireOperator(caller);
    return ctx_.catalog->CreateProduct(name, variants, quantities);
  });
}

void LedgerService::UpdateProduct(const std::string& caller, std::uint64_t product_id, const std::string& name,
                                  const std::vector<std::string>&   variants,
                                  const std::vector<std::uint64_t>& quantities) {
  ObserveCall("LedgerService.UpdateProduct", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.catalog->UpdateProduct(product_id, name, variants, quantities);
  });
}

db::model::ProductRecord LedgerService::GetProduct(std::uint64_t product_id) {
  return ObserveCall("LedgerService.GetProduct", "", [&] { return ctx_.catalog->GetProduct(product_id); });
}

std::vector<db::model::ProductRecord> LedgerService::ListProducts() {
  return ObserveCall("LedgerService.ListProducts", "", [&] { return ctx_.catalog->ListProducts(); });
}

std::uint64_t LedgerService::NextProductId() {
  return ObserveCall("LedgerService.NextProductId", "", [&] { return ctx_.catalog->NextProductId(); });
}

std::uint64_t LedgerService::MintItem(const std::string& caller, const core::MintRequest& request) {
  return ObserveCall("LedgerService.MintItem", caller, [&] {
    ctx_.access->RequireOperator(caller);
    return ctx_.items->MintItem(request);
  });
}

void LedgerService::UpdateItem(const std::string& caller, std::uint64_t item_id, std::uint64_t price,
                               model::Location location, bool is_chipped, bool is_digitized) {
  ObserveCall("LedgerService.UpdateItem", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.items->UpdateItem(item_id, price, location, is_chipped, is_digitized);
  });
}

void LedgerService::SetMetadataRef(const std::string& caller, std::uint64_t item_id, const std::string& uri) {
  ObserveCall("LedgerService.SetMetadataRef", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.items->SetMetadataRef(item_id, uri);
  });
}

void LedgerService::TransferItem(const std::string& caller, std::uint64_t item_id, const std::string& to) {
  ObserveCall("LedgerService.TransferItem", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.items->TransferItem(item_id, to);
  });
}

db::model::ItemRecord LedgerService::GetItem(std::uint64_t item_id) {
  return ObserveCall("LedgerService.GetItem", "", [&] { return ctx_.items->GetItem(item_id); });
}

std::vector<std::string> LedgerService::GetItemVariants(std::uint64_t item_id) {
  return ObserveCall("LedgerService.GetItemVariants", "", [&] { return ctx_.items->GetItemVariants(item_id); });
}

std::vector<db::model::ItemRecord> LedgerService::ListItems(std::uint64_t product_id) {
  return ObserveCall("LedgerService.ListItems", "", [&] { return ctx_.items->ListItems(product_id); });
}

std::optional<std::string> LedgerService::GetMetadataRef(std::uint64_t item_id) {
  return ObserveCall("LedgerService.GetMetadataRef", "", [&] { return ctx_.items->GetMetadataRef(item_id); });
}

std::string LedgerService::OwnerOf(std::uint64_t item_id) {
  return ObserveCall("LedgerService.OwnerOf", "", [&] { return ctx_.items->OwnerOf(item_id); });
}

std::uint64_t LedgerService::NextItemId() {
  return ObserveCall("LedgerService.NextItemId", "", [&] { return ctx_.items->NextItemId(); });
}

void LedgerService::ReadyForAuction(const std::string& caller, const std::vector<std::uint64_t>& item_ids) {
  ObserveCall("LedgerService.ReadyForAuction", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.lifecycle->ReadyForAuction(item_ids);
  });
}

void LedgerService::SetBidStatus(const std::string& caller, const std::vector<std::uint64_t>& item_ids,
                                 const std::vector<bool>& flags) {
  ObserveCall("LedgerService.SetBidStatus", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.lifecycle->SetBidStatus(item_ids, flags);
  });
}

void LedgerService::SetSaleStatus(const std::string& caller, const std::vector<std::uint64_t>& item_ids,
                                  const std::vector<bool>& flags) {
  ObserveCall("LedgerService.SetSaleStatus", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.lifecycle->SetSaleStatus(item_ids, flags);
  });
}

void LedgerService::SetShippingStatus(const std::string& caller, const std::vector<std::uint64_t>& item_ids,
                                      const std::vector<bool>& flags) {
  ObserveCall("LedgerService.SetShippingStatus", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.lifecycle->SetShippingStatus(item_ids, flags);
  });
}

void LedgerService::SetDeliveryStatus(const std::string& caller, const std::vector<std::uint64_t>& item_ids,
                                      const std::vector<bool>& flags) {
  ObserveCall("LedgerService.SetDeliveryStatus", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.lifecycle->SetDeliveryStatus(item_ids, flags);
  });
}

void LedgerService::Burn(const std::string& caller, std::uint64_t item_id) {
  ObserveCall("LedgerService.Burn", caller, [&] {
    ctx_.access->RequireOperator(caller);
    ctx_.lifecycle->Burn(item_id);
  });
}

} // namespace ledger::service
