#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ledger::model {

enum class Location : std::uint8_t {
  kSeller  = 0,
  kHq      = 1,
  kPartner = 2,
  kTransit = 3,
  kBuyer   = 4,
};

constexpr std::string_view ToString(Location location) {
  switch (location) {
    case Location::kSeller:
      return "seller";
    case Location::kHq:
      return "hq";
    case Location::kPartner:
      return "partner";
    case Location::kTransit:
      return "transit";
    case Location::kBuyer:
      return "buyer";
    default:
      return "unknown";
  }
}

constexpr std::optional<Location> ParseLocation(std::string_view value) {
  if (value == "seller") return Location::kSeller;
  if (value == "hq") return Location::kHq;
  if (value == "partner") return Location::kPartner;
  if (value == "transit") return Location::kTransit;
  if (value == "buyer") return Location::kBuyer;
  return std::nullopt;
}

constexpr std::optional<Location> LocationFromInt(int value) {
  if (value < 0 || value > static_cast<int>(Location::kBuyer)) {
    return std::nullopt;
  }
  return static_cast<Location>(value);
}

} // namespace ledger::model
