#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/registry/asset_registry.hpp"

namespace ledger::registry {

// Keeps ownership in the ledger's own repository (asset table).
class RepositoryAssetRegistry final : public AssetRegistry {
 public:
  explicit RepositoryAssetRegistry(std::shared_ptr<db::Repository> repository);

  void Mint(db::Transaction& tx, const std::string& owner, std::uint64_t id) override;
  void Transfer(db::Transaction& tx, std::uint64_t id, const std::string& to) override;
  void Burn(db::Transaction& tx, std::uint64_t id) override;

  std::optional<std::string> OwnerOf(db::Transaction& tx, std::uint64_t id) override;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace ledger::registry
