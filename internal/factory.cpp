#include "factory.hpp"

#include <memory>

#include "internal/core/item_registry.hpp"
#include "internal/core/lifecycle_controller.hpp"
#include "internal/core/product_catalog.hpp"
#include "internal/core/variant_matcher.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/repository_asset_registry.hpp"
#include "internal/service/service_context.hpp"

namespace ledger::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const ledger::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    LEDGER_LOG_INFO("sqlite repository opened", {ledger::observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  LEDGER_LOG_INFO("memory repository selected");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Runtime BuildRuntime(const ledger::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Storage and registries
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);
  runtime.assets     = std::make_shared<registry::RepositoryAssetRegistry>(runtime.repository);
  runtime.access     = std::make_shared<auth::AccessControl>(auth::AccessControl::FromConfig(config.ledger()));

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  const core::VariantMatcher matcher(config.ledger().variant_separator());

  service::ServiceContext ctx;
  ctx.catalog   = std::make_shared<core::ProductCatalog>(runtime.repository, matcher);
  ctx.items     = std::make_shared<core::ItemRegistry>(runtime.repository, runtime.assets, matcher,
                                                   config.ledger().catalog_owner());
  ctx.lifecycle = std::make_shared<core::LifecycleController>(runtime.repository, runtime.assets, matcher);
  ctx.access    = runtime.access;

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  runtime.ledger_service = std::make_shared<service::LedgerService>(std::move(ctx));

  return runtime;
}

} // namespace ledger::factory
