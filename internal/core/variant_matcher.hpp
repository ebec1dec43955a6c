#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ledger::core {

// Byte-exact label equality. Pure and total.
bool VariantEquals(std::string_view a, std::string_view b);

/*
  VariantMatcher

  Interprets a product's flat variant list as dimensions separated by a
  sentinel label, e.g. ["S", "M", "BUFFER", "red", "blue"] is two
  dimensions (size, color).
*/
class VariantMatcher {
 public:
  explicit VariantMatcher(std::string separator);

  const std::string& Separator() const {
    return separator_;
  }

  bool IsSeparator(std::string_view label) const;

  std::size_t SeparatorCount(const std::vector<std::string>& variants) const;

  // 0 for an empty list, otherwise separators + 1.
  std::size_t DimensionCount(const std::vector<std::string>& variants) const;

  // Dimension of the slot at index (number of separators before it).
  std::size_t DimensionOf(const std::vector<std::string>& variants, std::size_t index) const;

  // First non-separator slot whose label equals `label`, npos if none.
  std::size_t Find(const std::vector<std::string>& variants, std::string_view label) const;

  /*
    Resolves an item's labels to product slots, one per dimension.

    Throws util::VariantMismatch if a label has no slot, if two labels land
    in the same dimension, or if a dimension is left uncovered. Returned
    slots are in the order of `requested`.
  */
  std::vector<std::size_t> MatchItemVariants(const std::vector<std::string>& variants,
                                             const std::vector<std::string>& requested) const;

  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

 private:
  std::string separator_;
};

} // namespace ledger::core
