#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ledger::runtime::config {
class LedgerConfig;
}

namespace ledger::auth {

enum class Role : std::uint8_t {
  kCatalogOwner    = 0,
  kTrustedVerifier = 1,
};

std::string_view    ToString(Role role);
std::optional<Role> ParseRole(std::string_view value);

/*
  Explicit role assignment.

  An operator is a single account holding BOTH roles. Every mutating
  ledger call requires an operator; reads are open.
*/
class AccessControl {
 public:
  AccessControl() = default;

  // Seeds grants from config. The catalog owner always holds kCatalogOwner.
  static AccessControl FromConfig(const ledger::runtime::config::LedgerConfig& config);

  AccessControl(const AccessControl& other);
  AccessControl& operator=(const AccessControl& other);

  void Grant(const std::string& account, Role role);

  bool HasRole(const std::string& account, Role role) const;
  bool IsOperator(const std::string& account) const;

  // Throws util::AuthorizationError naming the missing role.
  void RequireOperator(const std::string& account) const;

 private:
  mutable std::shared_mutex                       mutex_;
  std::unordered_map<std::string, std::set<Role>> grants_;
};

} // namespace ledger::auth
