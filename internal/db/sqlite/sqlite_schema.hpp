#pragma once

#include "sqlite_db.hpp"

namespace ledger::db::sqlite {

// Creates the ledger tables if missing and seeds the id counters.
void BootstrapSchema(SqliteDB& db);

} // namespace ledger::db::sqlite
