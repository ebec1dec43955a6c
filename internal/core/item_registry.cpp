#include "internal/core/item_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ledger::core {

using ledger::util::ThrowIfDbError;

ItemRegistry::ItemRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<registry::AssetRegistry> assets,
                           VariantMatcher matcher, std::string catalog_owner)
    : repository_(std::move(repository)),
      assets_(std::move(assets)),
      matcher_(std::move(matcher)),
      catalog_owner_(std::move(catalog_owner)) {
  if (catalog_owner_.empty()) {
    throw ledger::util::InvalidState("item registry: catalog owner must not be empty");
  }
}

db::model::ItemRecord ItemRegistry::LoadItem(db::Transaction& tx, std::uint64_t item_id, const char* context) {
  auto item = repository_->GetItem(tx, item_id);
  if (!item.has_value()) {
    throw ledger::util::NotFound(std::string(context) + ": no item found with id " + std::to_string(item_id));
  }
  return *item;
}

std::uint64_t ItemRegistry::MintItem(const MintRequest& request) {
  auto tx      = repository_->Begin();
  auto product = repository_->GetProduct(*tx, request.product_id);
  if (!product.has_value()) {
    throw ledger::util::NotFound("mint item: no product found with id " + std::to_string(request.product_id));
  }

  // validation for every label completes before any counter moves
  const auto slots = matcher_.MatchItemVariants(product->variants, request.variants);
  accountant_.ConsumeVariantStock(*product, slots);
  accountant_.Credit(*product, model::Bucket::kAvailable);

  db::model::ItemRecord item;
  item.product_id   = product->id;
  item.owner        = catalog_owner_;
  item.owners       = {catalog_owner_};
  item.variants     = request.variants;
  item.price        = request.price;
  item.location     = request.location;
  item.is_chipped   = request.is_chipped;
  item.is_digitized = request.is_digitized;
  item.state        = model::ItemState::kMinted;

  ThrowIfDbError(repository_->InsertItem(*tx, item), "mint item");
  ThrowIfDbError(repository_->UpdateProduct(*tx, *product), "mint item: update product");

  if (!request.metadata_ref.empty()) {
    db::model::MetadataRecord metadata;
    metadata.item_id       = item.id;
    metadata.uri           = request.metadata_ref;
    metadata.updated_at_ms = ledger::util::ToUnixMillis(ledger::util::Now());
    ThrowIfDbError(repository_->UpsertMetadata(*tx, metadata), "mint item: metadata");
  }

  assets_->Mint(*tx, catalog_owner_, item.id);
  tx->Commit();

  LEDGER_LOG_DEBUG("item minted", {ledger::observability::UintField("item_id", item.id),
                                   ledger::observability::UintField("product_id", item.product_id)});
  return item.id;
}

void ItemRegistry::UpdateItem(std::uint64_t item_id, std::uint64_t price, model::Location location, bool is_chipped,
                              bool is_digitized) {
  auto tx   = repository_->Begin();
  auto item = LoadItem(*tx, item_id, "update item");

  item.price        = price;
  item.location     = location;
  item.is_chipped   = is_chipped;
  item.is_digitized = is_digitized;

  ThrowIfDbError(repository_->UpdateItem(*tx, item), "update item");
  tx->Commit();
}

void ItemRegistry::SetMetadataRef(std::uint64_t item_id, const std::string& uri) {
  auto tx = repository_->Begin();
  (void)LoadItem(*tx, item_id, "set metadata");

  db::model::MetadataRecord metadata;
  metadata.item_id       = item_id;
  metadata.uri           = uri;
  metadata.updated_at_ms = ledger::util::ToUnixMillis(ledger::util::Now());
  ThrowIfDbError(repository_->UpsertMetadata(*tx, metadata), "set metadata");
  tx->Commit();
}

std::optional<std::string> ItemRegistry::GetMetadataRef(std::uint64_t item_id) {
  auto tx = repository_->Begin();
  (void)LoadItem(*tx, item_id, "get metadata");
  auto metadata = repository_->GetMetadata(*tx, item_id);
  tx->Commit();

  if (!metadata.has_value()) {
    return std::nullopt;
  }
  return metadata->uri;
}

void ItemRegistry::TransferItem(std::uint64_t item_id, const std::string& to) {
  auto tx   = repository_->Begin();
  auto item = LoadItem(*tx, item_id, "transfer item");

  assets_->Transfer(*tx, item_id, to);

  // the registry is authoritative; re-read rather than trusting `to`
  auto owner = assets_->OwnerOf(*tx, item_id);
  if (!owner.has_value()) {
    throw ledger::util::InvalidState("transfer item: asset " + std::to_string(item_id) + " vanished during transfer");
  }
  item.owner = *owner;
  item.owners.push_back(*owner);

  ThrowIfDbError(repository_->UpdateItem(*tx, item), "transfer item");
  tx->Commit();
}

std::string ItemRegistry::OwnerOf(std::uint64_t item_id) {
  auto tx    = repository_->Begin();
  auto owner = assets_->OwnerOf(*tx, item_id);
  tx->Commit();

  if (!owner.has_value()) {
    throw ledger::util::NotFound("owner of: no asset with id " + std::to_string(item_id));
  }
  return *owner;
}

db::model::ItemRecord ItemRegistry::GetItem(std::uint64_t item_id) {
  auto tx   = repository_->Begin();
  auto item = LoadItem(*tx, item_id, "get item");
  tx->Commit();
  return item;
}

std::vector<std::string> ItemRegistry::GetItemVariants(std::uint64_t item_id) {
  return GetItem(item_id).variants;
}

std::vector<db::model::ItemRecord> ItemRegistry::ListItems(std::uint64_t product_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetProduct(*tx, product_id).has_value()) {
    throw ledger::util::NotFound("list items: no product found with id " + std::to_string(product_id));
  }
  auto items = repository_->ListItemsByProduct(*tx, product_id);
  tx->Commit();
  return items;
}

std::uint64_t ItemRegistry::NextItemId() {
  auto tx   = repository_->Begin();
  auto next = repository_->NextItemId(*tx);
  tx->Commit();
  return next;
}

} // namespace ledger::core
