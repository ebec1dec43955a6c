#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace ledger::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Products
// ------------------------------------------------------------

Result MemoryRepository::InsertProduct(Transaction& t, model::ProductRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_product_id++;
  s.products[r.id] = r;
  return Result::Ok();
}

std::optional<model::ProductRecord> MemoryRepository::GetProduct(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.products.find(id);
  if (it == s.products.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ProductRecord> MemoryRepository::ListProducts(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::ProductRecord> records;
  records.reserve(s.products.size());
  for (const auto& [_, record] : s.products) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateProduct(Transaction& t, const model::ProductRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.products.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.products[r.id] = r;
  return Result::Ok();
}

std::uint64_t MemoryRepository::NextProductId(Transaction& t) {
  return TX(t).View().next_product_id;
}

// ------------------------------------------------------------
// Items
// ------------------------------------------------------------

Result MemoryRepository::InsertItem(Transaction& t, model::ItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.products.contains(r.product_id)) return Result::Err(ErrorCode::ConstraintViolation, "item references unknown product");
  r.id = s.next_item_id++;
  s.items[r.id] = r;
  return Result::Ok();
}

std::optional<model::ItemRecord> MemoryRepository::GetItem(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ItemRecord> MemoryRepository::ListItemsByProduct(Transaction& t, std::uint64_t product_id) {
  std::vector<model::ItemRecord> out;
  for (const auto& [_, item] : TX(t).View().items)
    if (item.product_id == product_id) out.push_back(item);
  return out;
}

Result MemoryRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.items.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.items[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteItem(Transaction& t, std::uint64_t id) {
  auto& s = TX(t).Mutable();
  if (s.items.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  s.metadata.erase(id);
  return Result::Ok();
}

std::uint64_t MemoryRepository::NextItemId(Transaction& t) {
  return TX(t).View().next_item_id;
}

// ------------------------------------------------------------
// Metadata references
// ------------------------------------------------------------

Result MemoryRepository::UpsertMetadata(Transaction& t, const model::MetadataRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.items.contains(r.item_id)) return Result::Err(ErrorCode::ConstraintViolation, "metadata references unknown item");
  s.metadata[r.item_id] = r;
  return Result::Ok();
}

std::optional<model::MetadataRecord> MemoryRepository::GetMetadata(Transaction& t, std::uint64_t item_id) {
  const auto& s  = TX(t).View();
  auto        it = s.metadata.find(item_id);
  if (it == s.metadata.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------
// Assets
// ------------------------------------------------------------

Result MemoryRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.assets.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.assets[r.id] = r;
  return Result::Ok();
}

std::optional<model::AssetRecord> MemoryRepository::GetAsset(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.assets.find(id);
  if (it == s.assets.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.assets.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.assets[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteAsset(Transaction& t, std::uint64_t id) {
  auto& s = TX(t).Mutable();
  if (s.assets.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

} // namespace ledger::db::memory
