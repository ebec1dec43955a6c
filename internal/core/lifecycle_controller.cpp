#include "internal/core/lifecycle_controller.hpp"

#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace ledger::core {

using ledger::util::ThrowIfDbError;

namespace {

void RequireParity(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags, const char* operation) {
  if (item_ids.size() != flags.size()) {
    throw ledger::util::ParityError(std::string(operation) + ": " + std::to_string(item_ids.size()) + " item ids but " +
                                    std::to_string(flags.size()) + " flags");
  }
}

std::string Describe(const db::model::ItemRecord& item) {
  return "item " + std::to_string(item.id) + " is " + std::string(model::ToString(item.state));
}

} // namespace

LifecycleController::LifecycleController(std::shared_ptr<db::Repository>          repository,
                                         std::shared_ptr<registry::AssetRegistry> assets, VariantMatcher matcher)
    : repository_(std::move(repository)), assets_(std::move(assets)), matcher_(std::move(matcher)) {}

db::model::ItemRecord LifecycleController::LoadItem(db::Transaction& tx, std::uint64_t item_id, const char* operation) {
  auto item = repository_->GetItem(tx, item_id);
  if (!item.has_value()) {
    throw ledger::util::NotFound(std::string(operation) + ": no item found with id " + std::to_string(item_id));
  }
  return *item;
}

db::model::ProductRecord LifecycleController::LoadProduct(db::Transaction& tx, std::uint64_t product_id,
                                                          const char* operation) {
  auto product = repository_->GetProduct(tx, product_id);
  if (!product.has_value()) {
    throw ledger::util::NotFound(std::string(operation) + ": no product found with id " + std::to_string(product_id));
  }
  return *product;
}

void LifecycleController::ReadyForAuction(const std::vector<std::uint64_t>& item_ids) {
  auto tx = repository_->Begin();

  for (const auto id : item_ids) {
    auto item = LoadItem(*tx, id, "ready for auction");
    if (!item.is_chipped || !item.is_digitized) {
      throw ledger::util::IneligibleTransition("NotReadyForAuction: item " + std::to_string(id) +
                                               " must be chipped and digitized");
    }
    if (item.state != model::ItemState::kMinted) {
      continue;
    }

    // Minted and Ready share the available bucket
    auto product = LoadProduct(*tx, item.product_id, "ready for auction");
    accountant_.ApplyTransition(product, item, model::ItemState::kReady);
    ThrowIfDbError(repository_->UpdateItem(*tx, item), "ready for auction");
  }

  tx->Commit();
  LEDGER_LOG_INFO("items ready for auction", {ledger::observability::UintField("count", item_ids.size())});
}

void LifecycleController::AdvanceBatch(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags,
                                       const Step& step) {
  RequireParity(item_ids, flags, step.operation);

  auto tx = repository_->Begin();

  for (std::size_t i = 0; i < item_ids.size(); ++i) {
    auto item = LoadItem(*tx, item_ids[i], step.operation);
    if (!flags[i] || item.state != step.from) {
      throw ledger::util::IneligibleTransition(std::string(step.reason) + ": " + Describe(item) + ", expected " +
                                               std::string(model::ToString(step.from)) +
                                               (flags[i] ? "" : " with flag set"));
    }

    auto product = LoadProduct(*tx, item.product_id, step.operation);
    accountant_.ApplyTransition(product, item, step.to);
    if (step.to == model::ItemState::kShipped) {
      item.location = model::Location::kTransit;
    }

    ThrowIfDbError(repository_->UpdateItem(*tx, item), step.operation);
    ThrowIfDbError(repository_->UpdateProduct(*tx, product), step.operation);
  }

  tx->Commit();
  LEDGER_LOG_INFO("lifecycle batch applied", {ledger::observability::StringField("operation", step.operation),
                                              ledger::observability::StringField("state", model::ToString(step.to)),
                                              ledger::observability::UintField("count", item_ids.size())});
}

void LifecycleController::SetBidStatus(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags) {
  AdvanceBatch(item_ids, flags,
               Step{model::ItemState::kReady, model::ItemState::kBidded, "set bid status", "ItemNotAvailableForAuction"});
}

void LifecycleController::SetSaleStatus(const std::vector<std::uint64_t>& item_ids, const std::vector<bool>& flags) {
  AdvanceBatch(item_ids, flags,
               Step{model::ItemState::kBidded, model::ItemState::kSold, "set sale status", "ItemNotBidded"});
}

void LifecycleController::SetShippingStatus(const std::vector<std::uint64_t>& item_ids,
                                            const std::vector<bool>&          flags) {
  AdvanceBatch(item_ids, flags,
               Step{model::ItemState::kSold, model::ItemState::kShipped, "set shipping status", "ItemNotSold"});
}

void LifecycleController::SetDeliveryStatus(const std::vector<std::uint64_t>& item_ids,
                                            const std::vector<bool>&          flags) {
  RequireParity(item_ids, flags, "set delivery status");

  auto tx = repository_->Begin();

  for (std::size_t i = 0; i < item_ids.size(); ++i) {
    auto item = LoadItem(*tx, item_ids[i], "set delivery status");
    if (item.state != model::ItemState::kShipped) {
      throw ledger::util::IneligibleTransition("ItemNotShipped: " + Describe(item));
    }
    item.location = flags[i] ? model::Location::kBuyer : model::Location::kTransit;
    ThrowIfDbError(repository_->UpdateItem(*tx, item), "set delivery status");
  }

  tx->Commit();
  LEDGER_LOG_INFO("delivery status applied", {ledger::observability::UintField("count", item_ids.size())});
}

void LifecycleController::Burn(std::uint64_t item_id) {
  auto tx      = repository_->Begin();
  auto item    = LoadItem(*tx, item_id, "burn");
  auto product = LoadProduct(*tx, item.product_id, "burn");

  accountant_.Debit(product, model::BucketOf(item.state));

  // the product may have been replaced since mint; labels must still resolve
  const auto slots = matcher_.MatchItemVariants(product.variants, item.variants);
  accountant_.RestoreVariantStock(product, slots);

  ThrowIfDbError(repository_->UpdateProduct(*tx, product), "burn: update product");
  ThrowIfDbError(repository_->DeleteItem(*tx, item_id), "burn: delete item");
  assets_->Burn(*tx, item_id);

  tx->Commit();
  LEDGER_LOG_INFO("item burned", {ledger::observability::UintField("item_id", item_id),
                                  ledger::observability::UintField("product_id", product.id)});
}

} // namespace ledger::core
