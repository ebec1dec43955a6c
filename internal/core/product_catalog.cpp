#include "internal/core/product_catalog.hpp"

#include <limits>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/db_error.hpp"
#include "internal/util/errors.hpp"

namespace ledger::core {

using ledger::util::ThrowIfDbError;

ProductCatalog::ProductCatalog(std::shared_ptr<db::Repository> repository, VariantMatcher matcher)
    : repository_(std::move(repository)), matcher_(std::move(matcher)) {
}

void ProductCatalog::ValidateLayout(const std::vector<std::string>& variants, const std::vector<std::uint64_t>& quantities) const {
  if (variants.size() != quantities.size()) {
    throw ledger::util::ParityError("variants and quantities differ in length: " + std::to_string(variants.size()) + " vs " +
                                    std::to_string(quantities.size()));
  }
  if (variants.empty()) {
    throw ledger::util::InvalidInventoryCount("product must declare at least one variant");
  }

  std::uint64_t              sum        = 0;
  std::uint64_t              separators = 0;
  std::vector<std::uint64_t> dimension_totals(1, 0);
  std::vector<std::size_t>   dimension_labels(1, 0);
  std::set<std::string>      seen;
  for (std::size_t i = 0; i < variants.size(); ++i) {
    if (matcher_.IsSeparator(variants[i])) {
      ++separators;
      dimension_totals.push_back(0);
      dimension_labels.push_back(0);
      continue;
    }
    // lookups resolve a label to its first slot, so a repeat could never be debited
    if (!seen.insert(variants[i]).second) {
      throw ledger::util::InvalidInventoryCount("invalid inventory count: label '" + variants[i] + "' appears more than once");
    }
    if (quantities[i] > std::numeric_limits<std::uint64_t>::max() - sum) {
      throw ledger::util::InvalidInventoryCount("variant quantities overflow");
    }
    sum += quantities[i];
    dimension_totals.back() += quantities[i];
    ++dimension_labels.back();
  }

  const std::uint64_t divisor = separators == 0 ? 1 : separators;
  if (sum % divisor != 0) {
    throw ledger::util::InvalidInventoryCount("invalid inventory count: variant total " + std::to_string(sum) +
                                              " is not divisible across " + std::to_string(divisor) + " separator(s)");
  }

  // every mint takes one unit from each dimension, so each must hold the same stock
  for (std::size_t d = 0; d < dimension_totals.size(); ++d) {
    if (dimension_labels[d] == 0) {
      throw ledger::util::InvalidInventoryCount("invalid inventory count: dimension " + std::to_string(d) + " has no labels");
    }
    if (dimension_totals[d] != dimension_totals.front()) {
      throw ledger::util::InvalidInventoryCount("invalid inventory count: dimension " + std::to_string(d) + " holds " +
                                                std::to_string(dimension_totals[d]) + " units, dimension 0 holds " +
                                                std::to_string(dimension_totals.front()));
    }
  }
}

std::uint64_t ProductCatalog::CreateProduct(const std::string& name, const std::vector<std::string>& variants,
                                            const std::vector<std::uint64_t>& quantities) {
  ValidateLayout(variants, quantities);

  db::model::ProductRecord record;
  record.name                 = name;
  record.variants             = variants;
  record.quantity_per_variant = quantities;
  record.inventory            = {0, 0, 0, 0};

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertProduct(*tx, record), "create product");
  tx->Commit();

  LEDGER_LOG_DEBUG("product created", {ledger::observability::UintField("product_id", record.id),
                                       ledger::observability::StringField("name", name)});
  return record.id;
}

void ProductCatalog::UpdateProduct(std::uint64_t product_id, const std::string& name, const std::vector<std::string>& variants,
                                   const std::vector<std::uint64_t>& quantities) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetProduct(*tx, product_id);
  if (!record.has_value()) {
    throw ledger::util::NotFound("update product: no product found with id " + std::to_string(product_id));
  }

  ValidateLayout(variants, quantities);

  record->name                 = name;
  record->variants             = variants;
  record->quantity_per_variant = quantities;
  ThrowIfDbError(repository_->UpdateProduct(*tx, *record), "update product");
  tx->Commit();
}

db::model::ProductRecord ProductCatalog::GetProduct(std::uint64_t product_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetProduct(*tx, product_id);
  if (!record.has_value()) {
    throw ledger::util::NotFound("get product: no product found with id " + std::to_string(product_id));
  }
  tx->Commit();
  return *record;
}

std::vector<db::model::ProductRecord> ProductCatalog::ListProducts() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListProducts(*tx);
  tx->Commit();
  return records;
}

std::uint64_t ProductCatalog::NextProductId() {
  auto tx   = repository_->Begin();
  auto next = repository_->NextProductId(*tx);
  tx->Commit();
  return next;
}

} // namespace ledger::core
