#include "internal/registry/repository_asset_registry.hpp"

#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace ledger::registry {

using ledger::util::ThrowIfDbError;

RepositoryAssetRegistry::RepositoryAssetRegistry(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void RepositoryAssetRegistry::Mint(db::Transaction& tx, const std::string& owner, std::uint64_t id) {
  if (owner.empty()) {
    throw ledger::util::InvalidState("mint asset: owner must not be empty");
  }
  ThrowIfDbError(repository_->InsertAsset(tx, db::model::AssetRecord{.id = id, .owner = owner}), "mint asset " + std::to_string(id));
}

void RepositoryAssetRegistry::Transfer(db::Transaction& tx, std::uint64_t id, const std::string& to) {
  if (to.empty()) {
    throw ledger::util::InvalidState("transfer asset: recipient must not be empty");
  }
  ThrowIfDbError(repository_->UpdateAsset(tx, db::model::AssetRecord{.id = id, .owner = to}), "transfer asset " + std::to_string(id));
}

void RepositoryAssetRegistry::Burn(db::Transaction& tx, std::uint64_t id) {
  ThrowIfDbError(repository_->DeleteAsset(tx, id), "burn asset " + std::to_string(id));
}

std::optional<std::string> RepositoryAssetRegistry::OwnerOf(db::Transaction& tx, std::uint64_t id) {
  auto asset = repository_->GetAsset(tx, id);
  if (!asset.has_value()) {
    return std::nullopt;
  }
  return asset->owner;
}

} // namespace ledger::registry
