#include "internal/core/variant_matcher.hpp"

#include <cstring>

#include "internal/util/errors.hpp"

namespace ledger::core {

bool VariantEquals(std::string_view a, std::string_view b) {
  return a.size() == b.size() && (a.empty() || std::memcmp(a.data(), b.data(), a.size()) == 0);
}

VariantMatcher::VariantMatcher(std::string separator) : separator_(std::move(separator)) {
}

bool VariantMatcher::IsSeparator(std::string_view label) const {
  return VariantEquals(label, separator_);
}

std::size_t VariantMatcher::SeparatorCount(const std::vector<std::string>& variants) const {
  std::size_t count = 0;
  for (const auto& label : variants) {
    if (IsSeparator(label)) {
      ++count;
    }
  }
  return count;
}

std::size_t VariantMatcher::DimensionCount(const std::vector<std::string>& variants) const {
  if (variants.empty()) {
    return 0;
  }
  return SeparatorCount(variants) + 1;
}

std::size_t VariantMatcher::DimensionOf(const std::vector<std::string>& variants, std::size_t index) const {
  std::size_t dimension = 0;
  for (std::size_t i = 0; i < index && i < variants.size(); ++i) {
    if (IsSeparator(variants[i])) {
      ++dimension;
    }
  }
  return dimension;
}

std::size_t VariantMatcher::Find(const std::vector<std::string>& variants, std::string_view label) const {
  if (IsSeparator(label)) {
    return npos;
  }
  for (std::size_t i = 0; i < variants.size(); ++i) {
    if (VariantEquals(variants[i], label)) {
      return i;
    }
  }
  return npos;
}

std::vector<std::size_t> VariantMatcher::MatchItemVariants(const std::vector<std::string>& variants,
                                                           const std::vector<std::string>& requested) const {
  const auto               dimensions = DimensionCount(variants);
  std::vector<bool>        covered(dimensions, false);
  std::vector<std::size_t> slots;
  slots.reserve(requested.size());

  for (const auto& label : requested) {
    const auto slot = Find(variants, label);
    if (slot == npos) {
      throw ledger::util::VariantMismatch("no variant found for label '" + label + "'");
    }

    const auto dimension = DimensionOf(variants, slot);
    if (covered[dimension]) {
      throw ledger::util::VariantMismatch("label '" + label + "' repeats dimension " + std::to_string(dimension));
    }
    covered[dimension] = true;
    slots.push_back(slot);
  }

  if (slots.size() != dimensions) {
    throw ledger::util::VariantMismatch("item must name one label per dimension: expected " + std::to_string(dimensions) + ", got " +
                                        std::to_string(slots.size()));
  }
  return slots;
}

} // namespace ledger::core
