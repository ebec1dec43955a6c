#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace ledger::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS ledger_counter (name TEXT PRIMARY KEY, next_value INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO ledger_counter(name,next_value) VALUES ('product',0),('item',0);",
      "CREATE TABLE IF NOT EXISTS product (id INTEGER PRIMARY KEY, name TEXT NOT NULL, available INTEGER NOT NULL, reserved INTEGER NOT NULL, sold INTEGER NOT NULL, shipped INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS product_variant (product_id INTEGER NOT NULL REFERENCES product(id) ON DELETE CASCADE, position INTEGER NOT NULL, label TEXT NOT NULL, quantity INTEGER NOT NULL, PRIMARY KEY (product_id, position));",
      "CREATE TABLE IF NOT EXISTS item (id INTEGER PRIMARY KEY, product_id INTEGER NOT NULL REFERENCES product(id), owner TEXT NOT NULL, price INTEGER NOT NULL, location INTEGER NOT NULL, is_chipped INTEGER NOT NULL, is_digitized INTEGER NOT NULL, state INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS item_variant (item_id INTEGER NOT NULL REFERENCES item(id) ON DELETE CASCADE, position INTEGER NOT NULL, label TEXT NOT NULL, PRIMARY KEY (item_id, position));",
      "CREATE TABLE IF NOT EXISTS item_owner_history (item_id INTEGER NOT NULL REFERENCES item(id) ON DELETE CASCADE, position INTEGER NOT NULL, owner TEXT NOT NULL, PRIMARY KEY (item_id, position));",
      "CREATE TABLE IF NOT EXISTS item_metadata (item_id INTEGER PRIMARY KEY REFERENCES item(id) ON DELETE CASCADE, uri TEXT NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS asset (id INTEGER PRIMARY KEY, owner TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS item_product_idx ON item(product_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace ledger::db::sqlite
