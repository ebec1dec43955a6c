#pragma once

#include <memory>

namespace ledger::core {
class ProductCatalog;
class ItemRegistry;
class LifecycleController;
} // namespace ledger::core
namespace ledger::auth {
class AccessControl;
}

namespace ledger::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ledger::core::ProductCatalog>      catalog;
  std::shared_ptr<ledger::core::ItemRegistry>        items;
  std::shared_ptr<ledger::core::LifecycleController> lifecycle;
  std::shared_ptr<ledger::auth::AccessControl>       access;
};

} // namespace ledger::service
