#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace ledger::db::sqlite {

using ledger::db::ErrorCode;
using ledger::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static ledger::model::ItemState ColState(sqlite3_stmt* st, int col) {
    auto state = ledger::model::ItemStateFromInt(ColI32(st, col));
    if (!state.has_value()) {
        throw std::runtime_error("sqlite: item row has an unknown lifecycle state");
    }
    return *state;
}

static ledger::model::Location ColLocation(sqlite3_stmt* st, int col) {
    auto location = ledger::model::LocationFromInt(ColI32(st, col));
    if (!location.has_value()) {
        throw std::runtime_error("sqlite: item row has an unknown location");
    }
    return *location;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

std::uint64_t SqliteRepository::ReadCounter(sqlite3* db, const char* name) {
    Statement st(db, "SELECT next_value FROM ledger_counter WHERE name=?;");
    sqlite3_bind_text(st.get(), 1, name, -1, SQLITE_STATIC);
    if (st.Step() != SQLITE_ROW) {
        throw std::runtime_error(std::string("sqlite: missing counter ") + name);
    }
    return ColU64(st.get(), 0);
}

Result SqliteRepository::TakeCounter(sqlite3* db, const char* name, std::uint64_t* value) {
    *value = ReadCounter(db, name);

    Statement st(db, "UPDATE ledger_counter SET next_value=next_value+1 WHERE name=?;");
    sqlite3_bind_text(st.get(), 1, name, -1, SQLITE_STATIC);
    return Translate(db, st.Step());
}

std::uint64_t SqliteRepository::NextProductId(Transaction& t) {
    return ReadCounter(TX(t).Handle(), "product");
}

std::uint64_t SqliteRepository::NextItemId(Transaction& t) {
    return ReadCounter(TX(t).Handle(), "item");
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result SqliteRepository::WriteProductVariants(sqlite3* db, const model::ProductRecord& r) {
    {
        Statement del(db, "DELETE FROM product_variant WHERE product_id=?;");
        BindU64(del.get(), 1, r.id);
        auto res = Translate(db, del.Step());
        if (!res) return res;
    }

    for (std::size_t i = 0; i < r.variants.size(); ++i) {
        Statement st(db, "INSERT INTO product_variant(product_id,position,label,quantity) VALUES(?,?,?,?);");
        BindU64(st.get(), 1, r.id);
        BindU64(st.get(), 2, i);
        BindText(st.get(), 3, r.variants[i]);
        BindU64(st.get(), 4, i < r.quantity_per_variant.size() ? r.quantity_per_variant[i] : 0);
        auto res = Translate(db, st.Step());
        if (!res) return res;
    }
    return Result::Ok();
}

void SqliteRepository::LoadProductVariants(sqlite3* db, model::ProductRecord& r) {
    Statement st(db, "SELECT label,quantity FROM product_variant WHERE product_id=? ORDER BY position;");
    BindU64(st.get(), 1, r.id);

    r.variants.clear();
    r.quantity_per_variant.clear();
    while (st.Step() == SQLITE_ROW) {
        r.variants.push_back(ColText(st.get(), 0));
        r.quantity_per_variant.push_back(ColU64(st.get(), 1));
    }
}

Result SqliteRepository::InsertProduct(Transaction& t, model::ProductRecord& r) {
    auto* db = TX(t).Handle();

    auto res = TakeCounter(db, "product", &r.id);
    if (!res) return res;

    Statement st(db, "INSERT INTO product(id,name,available,reserved,sold,shipped) VALUES(?,?,?,?,?,?);");
    BindU64(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
    for (std::size_t b = 0; b < ledger::model::kBucketCount; ++b) {
        BindU64(st.get(), static_cast<int>(3 + b), r.inventory[b]);
    }
    res = Translate(db, st.Step());
    if (!res) return res;

    return WriteProductVariants(db, r);
}

std::optional<model::ProductRecord>
SqliteRepository::GetProduct(Transaction& t, std::uint64_t id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT id,name,available,reserved,sold,shipped FROM product WHERE id=?;");
    BindU64(st.get(), 1, id);

    if (st.Step() != SQLITE_ROW) {
        return std::nullopt;
    }

    model::ProductRecord r;
    r.id   = ColU64(st.get(), 0);
    r.name = ColText(st.get(), 1);
    for (std::size_t b = 0; b < ledger::model::kBucketCount; ++b) {
        r.inventory[b] = ColU64(st.get(), static_cast<int>(2 + b));
    }

    LoadProductVariants(db, r);
    return r;
}

std::vector<model::ProductRecord> SqliteRepository::ListProducts(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<std::uint64_t> ids;
    {
        Statement st(db, "SELECT id FROM product ORDER BY id;");
        while (st.Step() == SQLITE_ROW) ids.push_back(ColU64(st.get(), 0));
    }

    std::vector<model::ProductRecord> out;
    out.reserve(ids.size());
    for (auto id : ids) {
        if (auto product = GetProduct(t, id)) out.push_back(std::move(*product));
    }
    return out;
}

Result SqliteRepository::UpdateProduct(Transaction& t, const model::ProductRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE product SET name=?,available=?,reserved=?,sold=?,shipped=? WHERE id=?;");
    BindText(st.get(), 1, r.name);
    for (std::size_t b = 0; b < ledger::model::kBucketCount; ++b) {
        BindU64(st.get(), static_cast<int>(2 + b), r.inventory[b]);
    }
    BindU64(st.get(), 6, r.id);

    auto res = Translate(db, st.Step());
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);

    return WriteProductVariants(db, r);
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result SqliteRepository::WriteItemChildren(sqlite3* db, const model::ItemRecord& r) {
    {
        Statement del(db, "DELETE FROM item_variant WHERE item_id=?;");
        BindU64(del.get(), 1, r.id);
        auto res = Translate(db, del.Step());
        if (!res) return res;
    }
    for (std::size_t i = 0; i < r.variants.size(); ++i) {
        Statement st(db, "INSERT INTO item_variant(item_id,position,label) VALUES(?,?,?);");
        BindU64(st.get(), 1, r.id);
        BindU64(st.get(), 2, i);
        BindText(st.get(), 3, r.variants[i]);
        auto res = Translate(db, st.Step());
        if (!res) return res;
    }

    {
        Statement del(db, "DELETE FROM item_owner_history WHERE item_id=?;");
        BindU64(del.get(), 1, r.id);
        auto res = Translate(db, del.Step());
        if (!res) return res;
    }
    for (std::size_t i = 0; i < r.owners.size(); ++i) {
        Statement st(db, "INSERT INTO item_owner_history(item_id,position,owner) VALUES(?,?,?);");
        BindU64(st.get(), 1, r.id);
        BindU64(st.get(), 2, i);
        BindText(st.get(), 3, r.owners[i]);
        auto res = Translate(db, st.Step());
        if (!res) return res;
    }
    return Result::Ok();
}

void SqliteRepository::LoadItemChildren(sqlite3* db, model::ItemRecord& r) {
    r.variants.clear();
    {
        Statement st(db, "SELECT label FROM item_variant WHERE item_id=? ORDER BY position;");
        BindU64(st.get(), 1, r.id);
        while (st.Step() == SQLITE_ROW) r.variants.push_back(ColText(st.get(), 0));
    }

    r.owners.clear();
    {
        Statement st(db, "SELECT owner FROM item_owner_history WHERE item_id=? ORDER BY position;");
        BindU64(st.get(), 1, r.id);
        while (st.Step() == SQLITE_ROW) r.owners.push_back(ColText(st.get(), 0));
    }
}

Result SqliteRepository::InsertItem(Transaction& t, model::ItemRecord& r) {
    auto* db = TX(t).Handle();

    auto res = TakeCounter(db, "item", &r.id);
    if (!res) return res;

    Statement st(db,
                 "INSERT INTO item(id,product_id,owner,price,location,is_chipped,is_digitized,state) "
                 "VALUES(?,?,?,?,?,?,?,?);");
    BindU64(st.get(), 1, r.id);
    BindU64(st.get(), 2, r.product_id);
    BindText(st.get(), 3, r.owner);
    BindU64(st.get(), 4, r.price);
    BindI32(st.get(), 5, static_cast<int>(r.location));
    BindI32(st.get(), 6, r.is_chipped ? 1 : 0);
    BindI32(st.get(), 7, r.is_digitized ? 1 : 0);
    BindI32(st.get(), 8, static_cast<int>(r.state));

    res = Translate(db, st.Step());
    if (!res) return res;

    return WriteItemChildren(db, r);
}

std::optional<model::ItemRecord>
SqliteRepository::GetItem(Transaction& t, std::uint64_t id) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "SELECT id,product_id,owner,price,location,is_chipped,is_digitized,state "
                 "FROM item WHERE id=?;");
    BindU64(st.get(), 1, id);

    if (st.Step() != SQLITE_ROW) {
        return std::nullopt;
    }

    model::ItemRecord r;
    r.id           = ColU64(st.get(), 0);
    r.product_id   = ColU64(st.get(), 1);
    r.owner        = ColText(st.get(), 2);
    r.price        = ColU64(st.get(), 3);
    r.location     = ColLocation(st.get(), 4);
    r.is_chipped   = ColI32(st.get(), 5) != 0;
    r.is_digitized = ColI32(st.get(), 6) != 0;
    r.state        = ColState(st.get(), 7);

    LoadItemChildren(db, r);
    return r;
}

std::vector<model::ItemRecord>
SqliteRepository::ListItemsByProduct(Transaction& t, std::uint64_t product_id) {
    auto* db = TX(t).Handle();

    std::vector<std::uint64_t> ids;
    {
        Statement st(db, "SELECT id FROM item WHERE product_id=? ORDER BY id;");
        BindU64(st.get(), 1, product_id);
        while (st.Step() == SQLITE_ROW) ids.push_back(ColU64(st.get(), 0));
    }

    std::vector<model::ItemRecord> out;
    out.reserve(ids.size());
    for (auto id : ids) {
        if (auto item = GetItem(t, id)) out.push_back(std::move(*item));
    }
    return out;
}

Result SqliteRepository::UpdateItem(Transaction& t, const model::ItemRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "UPDATE item SET product_id=?,owner=?,price=?,location=?,is_chipped=?,is_digitized=?,state=? "
                 "WHERE id=?;");
    BindU64(st.get(), 1, r.product_id);
    BindText(st.get(), 2, r.owner);
    BindU64(st.get(), 3, r.price);
    BindI32(st.get(), 4, static_cast<int>(r.location));
    BindI32(st.get(), 5, r.is_chipped ? 1 : 0);
    BindI32(st.get(), 6, r.is_digitized ? 1 : 0);
    BindI32(st.get(), 7, static_cast<int>(r.state));
    BindU64(st.get(), 8, r.id);

    auto res = Translate(db, st.Step());
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);

    return WriteItemChildren(db, r);
}

Result SqliteRepository::DeleteItem(Transaction& t, std::uint64_t id) {
    auto* db = TX(t).Handle();

    // variants, owner history and metadata cascade
    Statement st(db, "DELETE FROM item WHERE id=?;");
    BindU64(st.get(), 1, id);

    auto res = Translate(db, st.Step());
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

// ------------------------------------------------------------------
// Metadata references
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMetadata(Transaction& t, const model::MetadataRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
                 "INSERT INTO item_metadata(item_id,uri,updated_at_ms) VALUES(?,?,?) "
                 "ON CONFLICT(item_id) DO UPDATE SET uri=excluded.uri, updated_at_ms=excluded.updated_at_ms;");
    BindU64(st.get(), 1, r.item_id);
    BindText(st.get(), 2, r.uri);
    BindU64(st.get(), 3, r.updated_at_ms);

    return Translate(db, st.Step());
}

std::optional<model::MetadataRecord>
SqliteRepository::GetMetadata(Transaction& t, std::uint64_t item_id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT item_id,uri,updated_at_ms FROM item_metadata WHERE item_id=?;");
    BindU64(st.get(), 1, item_id);

    if (st.Step() != SQLITE_ROW) {
        return std::nullopt;
    }

    model::MetadataRecord r;
    r.item_id       = ColU64(st.get(), 0);
    r.uri           = ColText(st.get(), 1);
    r.updated_at_ms = ColU64(st.get(), 2);
    return r;
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

Result SqliteRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO asset(id,owner) VALUES(?,?);");
    BindU64(st.get(), 1, r.id);
    BindText(st.get(), 2, r.owner);

    auto res = Translate(db, st.Step());
    if (res.code == ErrorCode::ConstraintViolation) {
        return Result::Err(ErrorCode::AlreadyExists, res.message);
    }
    return res;
}

std::optional<model::AssetRecord>
SqliteRepository::GetAsset(Transaction& t, std::uint64_t id) {
    auto* db = TX(t).Handle();

    Statement st(db, "SELECT id,owner FROM asset WHERE id=?;");
    BindU64(st.get(), 1, id);

    if (st.Step() != SQLITE_ROW) {
        return std::nullopt;
    }

    model::AssetRecord r;
    r.id    = ColU64(st.get(), 0);
    r.owner = ColText(st.get(), 1);
    return r;
}

Result SqliteRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE asset SET owner=? WHERE id=?;");
    BindText(st.get(), 1, r.owner);
    BindU64(st.get(), 2, r.id);

    auto res = Translate(db, st.Step());
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

Result SqliteRepository::DeleteAsset(Transaction& t, std::uint64_t id) {
    auto* db = TX(t).Handle();

    Statement st(db, "DELETE FROM asset WHERE id=?;");
    BindU64(st.get(), 1, id);

    auto res = Translate(db, st.Step());
    if (!res) return res;
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
}

} // namespace ledger::db::sqlite
