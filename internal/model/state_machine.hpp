#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ledger::model {

/*
  Item lifecycle. Strictly forward:

    Minted -> Ready -> Bidded -> Sold -> Shipped

  Each state maps to exactly one inventory bucket on the item's product.
*/
enum class ItemState : std::uint8_t {
  kMinted  = 0,
  kReady   = 1,
  kBidded  = 2,
  kSold    = 3,
  kShipped = 4,
};

enum class Bucket : std::uint8_t {
  kAvailable = 0,
  kReserved  = 1,
  kSold      = 2,
  kShipped   = 3,
};

inline constexpr std::size_t kBucketCount = 4;

// [available, reserved, sold, shipped]
using Inventory = std::array<std::uint64_t, kBucketCount>;

constexpr std::size_t Index(Bucket bucket) {
  return static_cast<std::size_t>(bucket);
}

constexpr Bucket BucketOf(ItemState state) {
  switch (state) {
    case ItemState::kBidded:
      return Bucket::kReserved;
    case ItemState::kSold:
      return Bucket::kSold;
    case ItemState::kShipped:
      return Bucket::kShipped;
    case ItemState::kMinted:
    case ItemState::kReady:
    default:
      return Bucket::kAvailable;
  }
}

// Only single forward steps are legal.
constexpr bool CanTransition(ItemState from, ItemState to) {
  return static_cast<std::uint8_t>(to) == static_cast<std::uint8_t>(from) + 1;
}

// Flag views kept for callers that think in the legacy boolean encoding.
constexpr bool CanAuction(ItemState state) {
  return state >= ItemState::kReady;
}

constexpr bool HasBid(ItemState state) {
  return state >= ItemState::kBidded;
}

constexpr bool IsSold(ItemState state) {
  return state >= ItemState::kSold;
}

constexpr bool IsShipped(ItemState state) {
  return state == ItemState::kShipped;
}

constexpr std::string_view ToString(ItemState state) {
  switch (state) {
    case ItemState::kMinted:
      return "minted";
    case ItemState::kReady:
      return "ready";
    case ItemState::kBidded:
      return "bidded";
    case ItemState::kSold:
      return "sold";
    case ItemState::kShipped:
      return "shipped";
    default:
      return "unknown";
  }
}

constexpr std::string_view ToString(Bucket bucket) {
  switch (bucket) {
    case Bucket::kAvailable:
      return "available";
    case Bucket::kReserved:
      return "reserved";
    case Bucket::kSold:
      return "sold";
    case Bucket::kShipped:
      return "shipped";
    default:
      return "unknown";
  }
}

constexpr std::optional<ItemState> ItemStateFromInt(int value) {
  if (value < 0 || value > static_cast<int>(ItemState::kShipped)) {
    return std::nullopt;
  }
  return static_cast<ItemState>(value);
}

} // namespace ledger::model
