#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/auth/access_control.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/registry/asset_registry.hpp"
#include "internal/service/ledger_service.hpp"

namespace ledger::factory {

/*
  Runtime

  Owns all long-lived objects behind the ledger.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<registry::AssetRegistry> assets;
  std::shared_ptr<auth::AccessControl>     access;

  std::shared_ptr<service::LedgerService> ledger_service;
};

/*
  BuildRuntime

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime BuildRuntime(const ledger::runtime::config::RuntimeConfig& config);

} // namespace ledger::factory
