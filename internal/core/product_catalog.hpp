#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/variant_matcher.hpp"
#include "internal/db/api/repository.hpp"

namespace ledger::core {

/*
  ProductCatalog

  Owns product rows. Validates variant/quantity parity and the
  dimension consistency rule; never touches inventory buckets.
*/
class ProductCatalog {
 public:
  ProductCatalog(std::shared_ptr<db::Repository> repository, VariantMatcher matcher);

  std::uint64_t CreateProduct(const std::string& name, const std::vector<std::string>& variants,
                              const std::vector<std::uint64_t>& quantities);

  // Wholesale replacement. Outstanding items are not migrated.
  void UpdateProduct(std::uint64_t product_id, const std::string& name, const std::vector<std::string>& variants,
                     const std::vector<std::uint64_t>& quantities);

  db::model::ProductRecord              GetProduct(std::uint64_t product_id);
  std::vector<db::model::ProductRecord> ListProducts();

  // Id the next CreateProduct will receive.
  std::uint64_t NextProductId();

  /*
    Throws util::ParityError if the lengths differ. Throws
    util::InvalidInventoryCount if the list is empty, if the non-separator
    quantity sum is not divisible by the separator count (a list without
    separators uses divisor 1), or if the dimensions do not all hold the same
    total stock. A dimension without labels is rejected.
  */
  void ValidateLayout(const std::vector<std::string>& variants, const std::vector<std::uint64_t>& quantities) const;

  const VariantMatcher& Matcher() const {
    return matcher_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  VariantMatcher                  matcher_;
};

} // namespace ledger::core
