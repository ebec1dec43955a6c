#include "internal/auth/access_control.hpp"

#include <mutex>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace ledger::auth {

std::string_view ToString(Role role) {
  switch (role) {
    case Role::kCatalogOwner:
      return "catalog_owner";
    case Role::kTrustedVerifier:
      return "trusted_verifier";
    default:
      return "unknown";
  }
}

std::optional<Role> ParseRole(std::string_view value) {
  if (value == "catalog_owner") return Role::kCatalogOwner;
  if (value == "trusted_verifier") return Role::kTrustedVerifier;
  return std::nullopt;
}

AccessControl AccessControl::FromConfig(const ledger::runtime::config::LedgerConfig& config) {
  AccessControl acl;
  if (!config.catalog_owner().empty()) {
    acl.Grant(config.catalog_owner(), Role::kCatalogOwner);
  }
  for (const auto& grant : config.operators()) {
    for (const auto& name : grant.roles()) {
      auto role = ParseRole(name);
      if (!role.has_value()) {
        throw ledger::util::InvalidState("access control: unknown role '" + name + "'");
      }
      acl.Grant(grant.account(), *role);
    }
  }
  return acl;
}

AccessControl::AccessControl(const AccessControl& other) {
  std::shared_lock lock(other.mutex_);
  grants_ = other.grants_;
}

AccessControl& AccessControl::operator=(const AccessControl& other) {
  if (this == &other) {
    return *this;
  }
  std::scoped_lock lock(mutex_, other.mutex_);
  grants_ = other.grants_;
  return *this;
}

void AccessControl::Grant(const std::string& account, Role role) {
  std::unique_lock lock(mutex_);
  grants_[account].insert(role);
}

bool AccessControl::HasRole(const std::string& account, Role role) const {
  std::shared_lock lock(mutex_);
  auto it = grants_.find(account);
  return it != grants_.end() && it->second.contains(role);
}

bool AccessControl::IsOperator(const std::string& account) const {
  return HasRole(account, Role::kCatalogOwner) && HasRole(account, Role::kTrustedVerifier);
}

void AccessControl::RequireOperator(const std::string& account) const {
  for (auto role : {Role::kCatalogOwner, Role::kTrustedVerifier}) {
    if (!HasRole(account, role)) {
      throw ledger::util::AuthorizationError("caller '" + account + "' lacks role " + std::string(ToString(role)));
    }
  }
}

} // namespace ledger::auth
