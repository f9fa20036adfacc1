#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <type_traits>

#include "internal/db/sql/identifiers.hpp"

namespace edgestore::db::sqlite {

using edgestore::db::ErrorCode;
using edgestore::db::Result;

namespace {

// Owns one prepared statement; finalized on scope exit.
class Stmt {
 public:
  Stmt(sqlite3* db, const std::string& sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Stmt() {
    if (st_) sqlite3_finalize(st_);
  }

  Stmt(const Stmt&)            = delete;
  Stmt& operator=(const Stmt&) = delete;

  bool ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }

  sqlite3_stmt* get() const {
    return st_;
  }

  // For reads: prepare failures are not representable in the return type.
  sqlite3_stmt* require() const {
    if (!ok()) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    }
    return st_;
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_ERROR;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindValue(sqlite3_stmt* st, int idx, const model::IndexValue& value) {
  std::visit(
      [&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
          sqlite3_bind_int(st, idx, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          BindI64(st, idx, v);
        } else if constexpr (std::is_same_v<T, double>) {
          sqlite3_bind_double(st, idx, v);
        } else {
          BindText(st, idx, v);
        }
      },
      value);
}

std::string ColText(sqlite3_stmt* st, int col) {
  // Strings may carry embedded NULs; the byte count is authoritative.
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

// Steps a read statement; true on SQLITE_ROW, false on SQLITE_DONE.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  const int primary = rc & 0xff;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    throw TransactionConflict(std::string("sqlite: ") + sqlite3_errmsg(db));
  }
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

std::string ValueColumnType(model::ColumnType type) {
  switch (type) {
    case model::ColumnType::kString:
      return "TEXT";
    case model::ColumnType::kNumber:
      return "REAL";
    case model::ColumnType::kInteger:
    case model::ColumnType::kDatetime:
    case model::ColumnType::kBoolean:
      return "INTEGER";
  }
  return "TEXT";
}

std::string CompareSql(model::CompareOp op) {
  switch (op) {
    case model::CompareOp::kEq:
      return "=";
    case model::CompareOp::kLt:
      return "<";
    case model::CompareOp::kLte:
      return "<=";
    case model::CompareOp::kGt:
      return ">";
    case model::CompareOp::kGte:
      return ">=";
    case model::CompareOp::kIn:
      return "IN";
  }
  return "=";
}

Result InvalidName(const std::string& name) {
  return Result::Err(ErrorCode::InternalError, "invalid identifier: " + name);
}

model::MirrorVersionRecord ReadVersion(sqlite3_stmt* st) {
  model::MirrorVersionRecord r;
  r.id         = ColU64(st, 0);
  r.dataset_id = ColText(st, 1);
  r.version    = ColText(st, 2);
  r.checksum   = ColText(st, 3);
  r.ts         = ColI64(st, 4);
  return r;
}

model::UserTableRecord ReadTable(sqlite3_stmt* st) {
  model::UserTableRecord r;
  r.id         = ColU64(st, 0);
  r.user_id    = ColText(st, 1);
  r.table_name = ColText(st, 2);
  r.phy_table  = ColText(st, 3);
  r.pk_path    = ColText(st, 4);
  r.ts_path    = ColText(st, 5);
  r.created_at = ColI64(st, 6);
  return r;
}

constexpr const char* kVersionColumns = "id,dataset_id,version,checksum,ts";
constexpr const char* kTableColumns   = "id,user_id,table_name,phy_table,pk_path,ts_path,created_at";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
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
// Readiness
// ------------------------------------------------------------------

Result SqliteRepository::MarkInitialized(Transaction& t, std::int64_t completed_at_ms) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "INSERT INTO init_complete(id,completed_at) VALUES(1,?) ON CONFLICT(id) DO NOTHING;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st.get(), 1, completed_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

bool SqliteRepository::IsInitialized(Transaction& t) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "SELECT 1 FROM init_complete WHERE id=1;");
  return StepRow(db, st.require());
}

// ------------------------------------------------------------------
// Mirror
// ------------------------------------------------------------------

Result SqliteRepository::InsertMirrorVersion(Transaction& t, model::MirrorVersionRecord& r) {
  auto* db = TX(t).Handle();
  Stmt  st(db,
           "INSERT INTO global_mirror_versions(dataset_id,version,checksum,ts) VALUES(?,?,?,?) "
           "ON CONFLICT(dataset_id,version) DO NOTHING;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.dataset_id);
  BindText(st.get(), 2, r.version);
  BindText(st.get(), 3, r.checksum);
  BindI64(st.get(), 4, r.ts);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists, "dataset version exists");

  r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::optional<model::MirrorVersionRecord> SqliteRepository::GetMirrorVersion(Transaction& t, const std::string& dataset_id,
                                                                             const std::string& version) {
  auto* db = TX(t).Handle();
  Stmt  st(db, std::string("SELECT ") + kVersionColumns + " FROM global_mirror_versions WHERE dataset_id=? AND version=?;");
  auto* s = st.require();
  BindText(s, 1, dataset_id);
  BindText(s, 2, version);

  if (!StepRow(db, s)) return std::nullopt;
  return ReadVersion(s);
}

std::optional<model::MirrorVersionRecord> SqliteRepository::GetLatestMirrorVersion(Transaction& t, const std::string& dataset_id) {
  auto* db = TX(t).Handle();
  Stmt  st(db, std::string("SELECT ") + kVersionColumns + " FROM global_mirror_versions WHERE dataset_id=? ORDER BY ts DESC, id DESC LIMIT 1;");
  auto* s = st.require();
  BindText(s, 1, dataset_id);

  if (!StepRow(db, s)) return std::nullopt;
  return ReadVersion(s);
}

std::vector<model::MirrorVersionRecord> SqliteRepository::ListMirrorVersions(Transaction& t, const std::string& dataset_id, std::size_t limit) {
  auto* db = TX(t).Handle();
  Stmt  st(db, std::string("SELECT ") + kVersionColumns + " FROM global_mirror_versions WHERE dataset_id=? ORDER BY ts DESC, id DESC LIMIT ?;");
  auto* s = st.require();
  BindText(s, 1, dataset_id);
  BindI64(s, 2, limit == 0 ? -1 : static_cast<std::int64_t>(limit));

  std::vector<model::MirrorVersionRecord> out;
  while (StepRow(db, s)) {
    out.push_back(ReadVersion(s));
  }
  return out;
}

Result SqliteRepository::InsertGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version,
                                          const std::vector<std::string>& items) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "INSERT INTO global_rows(dataset_id,version,item) VALUES(?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& item : items) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, dataset_id);
    BindText(st.get(), 2, version);
    BindText(st.get(), 3, item);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }
  return Result::Ok();
}

std::vector<model::GlobalRowRecord> SqliteRepository::ReadGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version,
                                                                     std::uint64_t after_id, std::size_t limit) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "SELECT id,dataset_id,version,item FROM global_rows WHERE dataset_id=? AND version=? AND id>? ORDER BY id LIMIT ?;");
  auto* s = st.require();
  BindText(s, 1, dataset_id);
  BindText(s, 2, version);
  BindU64(s, 3, after_id);
  BindI64(s, 4, limit == 0 ? -1 : static_cast<std::int64_t>(limit));

  std::vector<model::GlobalRowRecord> out;
  while (StepRow(db, s)) {
    model::GlobalRowRecord r;
    r.id         = ColU64(s, 0);
    r.dataset_id = ColText(s, 1);
    r.version    = ColText(s, 2);
    r.item       = ColText(s, 3);
    out.push_back(std::move(r));
  }
  return out;
}

std::uint64_t SqliteRepository::CountGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "SELECT COUNT(*) FROM global_rows WHERE dataset_id=? AND version=?;");
  auto* s = st.require();
  BindText(s, 1, dataset_id);
  BindText(s, 2, version);
  return StepRow(db, s) ? ColU64(s, 0) : 0;
}

// ------------------------------------------------------------------
// Contexts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertUserContext(Transaction& t, const model::UserContextRecord& r) {
  auto* db = TX(t).Handle();
  Stmt  st(db,
           "INSERT INTO user_contexts(user_id,dataset_id,ctx,ts) VALUES(?,?,?,?) "
           "ON CONFLICT(user_id,dataset_id) DO UPDATE SET ctx=excluded.ctx, ts=excluded.ts;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.user_id);
  BindText(st.get(), 2, r.dataset_id);
  BindText(st.get(), 3, r.ctx);
  BindI64(st.get(), 4, r.ts);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::UserContextRecord> SqliteRepository::GetUserContext(Transaction& t, const std::string& user_id, const std::string& dataset_id) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "SELECT id,user_id,dataset_id,ctx,ts FROM user_contexts WHERE user_id=? AND dataset_id=?;");
  auto* s = st.require();
  BindText(s, 1, user_id);
  BindText(s, 2, dataset_id);
  if (!StepRow(db, s)) return std::nullopt;

  model::UserContextRecord r;
  r.id         = ColU64(s, 0);
  r.user_id    = ColText(s, 1);
  r.dataset_id = ColText(s, 2);
  r.ctx        = ColText(s, 3);
  r.ts         = ColI64(s, 4);
  return r;
}

// ------------------------------------------------------------------
// View log
// ------------------------------------------------------------------

Result SqliteRepository::AppendUserViews(Transaction& t, std::vector<model::UserViewRecord>& rows) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "INSERT INTO user_views(user_id,dataset_id,version,item,ts) VALUES(?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (auto& row : rows) {
    sqlite3_reset(st.get());
    BindText(st.get(), 1, row.user_id);
    BindText(st.get(), 2, row.dataset_id);
    BindText(st.get(), 3, row.version);
    BindText(st.get(), 4, row.item);
    BindI64(st.get(), 5, row.ts);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
    row.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return Result::Ok();
}

std::vector<model::UserViewRecord> SqliteRepository::ReadUserViews(Transaction& t, const model::UserViewQuery& q) {
  auto*       db  = TX(t).Handle();
  std::string query = "SELECT id,user_id,dataset_id,version,item,ts FROM user_views WHERE user_id=? AND dataset_id=? AND id>? AND ts>=?";
  if (!q.version.empty()) query += " AND version=?";
  query += " ORDER BY id LIMIT ?;";

  Stmt  st(db, query);
  auto* s   = st.require();
  int   idx = 1;
  BindText(s, idx++, q.user_id);
  BindText(s, idx++, q.dataset_id);
  BindU64(s, idx++, q.after_id);
  BindI64(s, idx++, q.since_ts);
  if (!q.version.empty()) BindText(s, idx++, q.version);
  BindI64(s, idx, q.limit == 0 ? -1 : static_cast<std::int64_t>(q.limit));

  std::vector<model::UserViewRecord> out;
  while (StepRow(db, s)) {
    model::UserViewRecord r;
    r.id         = ColU64(s, 0);
    r.user_id    = ColText(s, 1);
    r.dataset_id = ColText(s, 2);
    r.version    = ColText(s, 3);
    r.item       = ColText(s, 4);
    r.ts         = ColI64(s, 5);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result SqliteRepository::InsertUserTable(Transaction& t, model::UserTableRecord& r) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "INSERT INTO userdb_tables(user_id,table_name,phy_table,pk_path,ts_path,created_at) VALUES(?,?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.user_id);
  BindText(st.get(), 2, r.table_name);
  BindText(st.get(), 3, r.phy_table);
  BindText(st.get(), 4, r.pk_path);
  BindText(st.get(), 5, r.ts_path);
  BindI64(st.get(), 6, r.created_at);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res.code == ErrorCode::ConstraintViolation) return Result::Err(ErrorCode::AlreadyExists, res.message);
  if (!res) return res;
  r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::optional<model::UserTableRecord> SqliteRepository::GetUserTable(Transaction& t, const std::string& user_id, const std::string& table_name) {
  auto* db = TX(t).Handle();
  Stmt  st(db, std::string("SELECT ") + kTableColumns + " FROM userdb_tables WHERE user_id=? AND table_name=?;");
  auto* s = st.require();
  BindText(s, 1, user_id);
  BindText(s, 2, table_name);
  if (!StepRow(db, s)) return std::nullopt;
  return ReadTable(s);
}

std::vector<model::UserTableRecord> SqliteRepository::ListUserTables(Transaction& t, const std::string& user_id) {
  auto* db = TX(t).Handle();
  Stmt  st(db, std::string("SELECT ") + kTableColumns + " FROM userdb_tables WHERE user_id=? ORDER BY table_name;");
  auto* s = st.require();
  BindText(s, 1, user_id);

  std::vector<model::UserTableRecord> out;
  while (StepRow(db, s)) {
    out.push_back(ReadTable(s));
  }
  return out;
}

Result SqliteRepository::DeleteUserTable(Transaction& t, const std::string& user_id, const std::string& table_name) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "DELETE FROM userdb_tables WHERE user_id=? AND table_name=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, user_id);
  BindText(st.get(), 2, table_name);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::InsertUserTableIndex(Transaction& t, model::UserTableIndexRecord& r) {
  auto* db = TX(t).Handle();

  // the unique key is checked first so that a missing parent row stays a ConstraintViolation
  {
    Stmt lookup(db, "SELECT 1 FROM userdb_table_indexes WHERE user_id=? AND table_name=? AND col_name=?;");
    if (!lookup.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(lookup.get(), 1, r.user_id);
    BindText(lookup.get(), 2, r.table_name);
    BindText(lookup.get(), 3, r.col_name);
    const int rc = sqlite3_step(lookup.get());
    if (rc == SQLITE_ROW) return Result::Err(ErrorCode::AlreadyExists, "index exists");
    auto res = Translate(db, rc);
    if (!res) return res;
  }

  Stmt st(db, "INSERT INTO userdb_table_indexes(user_id,table_name,col_name,json_path,col_type,state) VALUES(?,?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.user_id);
  BindText(st.get(), 2, r.table_name);
  BindText(st.get(), 3, r.col_name);
  BindText(st.get(), 4, r.json_path);
  BindText(st.get(), 5, std::string(model::ColumnTypeName(r.col_type)));
  BindText(st.get(), 6, std::string(model::IndexStateName(r.state)));

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

Result SqliteRepository::UpdateUserTableIndexState(Transaction& t, const std::string& user_id, const std::string& table_name,
                                                   const std::string& col_name, model::IndexState state) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "UPDATE userdb_table_indexes SET state=? WHERE user_id=? AND table_name=? AND col_name=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, std::string(model::IndexStateName(state)));
  BindText(st.get(), 2, user_id);
  BindText(st.get(), 3, table_name);
  BindText(st.get(), 4, col_name);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::UserTableIndexRecord> SqliteRepository::ListUserTableIndexes(Transaction& t, const std::string& user_id,
                                                                                const std::string& table_name) {
  auto* db = TX(t).Handle();
  Stmt  st(db,
           "SELECT id,user_id,table_name,col_name,json_path,col_type,state FROM userdb_table_indexes "
           "WHERE user_id=? AND table_name=? ORDER BY col_name;");
  auto* s = st.require();
  BindText(s, 1, user_id);
  BindText(s, 2, table_name);

  std::vector<model::UserTableIndexRecord> out;
  while (StepRow(db, s)) {
    model::UserTableIndexRecord r;
    r.id         = ColU64(s, 0);
    r.user_id    = ColText(s, 1);
    r.table_name = ColText(s, 2);
    r.col_name   = ColText(s, 3);
    r.json_path  = ColText(s, 4);
    r.col_type   = model::ParseColumnType(ColText(s, 5)).value_or(model::ColumnType::kString);
    r.state      = model::ParseIndexState(ColText(s, 6)).value_or(model::IndexState::kBuilding);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::DeleteUserTableIndex(Transaction& t, const std::string& user_id, const std::string& table_name,
                                              const std::string& col_name) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "DELETE FROM userdb_table_indexes WHERE user_id=? AND table_name=? AND col_name=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, user_id);
  BindText(st.get(), 2, table_name);
  BindText(st.get(), 3, col_name);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result SqliteRepository::CreateDocumentTable(Transaction& t, const std::string& phy_table) {
  if (!sql::IsValidIdentifier(phy_table)) return InvalidName(phy_table);
  auto*      db    = TX(t).Handle();
  const auto table = sql::Quote(phy_table);

  for (const auto& ddl : {
           "CREATE TABLE IF NOT EXISTS " + table + " (pk TEXT PRIMARY KEY, item TEXT NOT NULL, updated_at INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS " + sql::Quote(phy_table + "_updated_at") + " ON " + table + "(updated_at);",
       }) {
    Stmt st(db, ddl);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }
  return Result::Ok();
}

Result SqliteRepository::DropDocumentTable(Transaction& t, const std::string& phy_table) {
  if (!sql::IsValidIdentifier(phy_table)) return InvalidName(phy_table);
  auto* db = TX(t).Handle();
  Stmt  st(db, "DROP TABLE IF EXISTS " + sql::Quote(phy_table) + ";");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocument(Transaction& t, const std::string& phy_table, const std::string& pk) {
  if (!sql::IsValidIdentifier(phy_table)) throw std::runtime_error("invalid identifier: " + phy_table);
  auto* db = TX(t).Handle();
  Stmt  st(db, "SELECT pk,item,updated_at FROM " + sql::Quote(phy_table) + " WHERE pk=?;");
  auto* s = st.require();
  BindText(s, 1, pk);
  if (!StepRow(db, s)) return std::nullopt;

  model::DocumentRecord r;
  r.pk         = ColText(s, 0);
  r.item       = ColText(s, 1);
  r.updated_at = ColI64(s, 2);
  return r;
}

Result SqliteRepository::PutDocument(Transaction& t, const std::string& phy_table, const model::DocumentRecord& r, model::DocumentWriteMode mode) {
  if (!sql::IsValidIdentifier(phy_table)) return InvalidName(phy_table);
  auto*       db  = TX(t).Handle();
  std::string query = "INSERT INTO " + sql::Quote(phy_table) +
                    "(pk,item,updated_at) VALUES(?,?,?) "
                    "ON CONFLICT(pk) DO UPDATE SET item=excluded.item, updated_at=excluded.updated_at";
  if (mode == model::DocumentWriteMode::kIfNewer) {
    query += " WHERE updated_at < excluded.updated_at";
  }
  query += ";";

  Stmt st(db, query);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, r.pk);
  BindText(st.get(), 2, r.item);
  BindI64(st.get(), 3, r.updated_at);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "stored document is newer");
  return Result::Ok();
}

Result SqliteRepository::DeleteDocument(Transaction& t, const std::string& phy_table, const std::string& pk) {
  if (!sql::IsValidIdentifier(phy_table)) return InvalidName(phy_table);
  auto* db = TX(t).Handle();
  Stmt  st(db, "DELETE FROM " + sql::Quote(phy_table) + " WHERE pk=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, pk);
  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::DocumentRecord> SqliteRepository::ScanDocuments(Transaction& t, const std::string& phy_table, const model::DocumentScan& scan) {
  if (!sql::IsValidIdentifier(phy_table)) throw std::runtime_error("invalid identifier: " + phy_table);
  auto* db = TX(t).Handle();

  const bool  by_pk = scan.order == model::DocumentOrder::kByPk;
  std::string query   = "SELECT pk,item,updated_at FROM " + sql::Quote(phy_table) + " WHERE 1=1";
  if (scan.updated_since) query += " AND updated_at >= ?";
  if (by_pk && !scan.after_pk.empty()) query += " AND pk > ?";
  switch (scan.order) {
    case model::DocumentOrder::kByPk:
      query += " ORDER BY pk";
      break;
    case model::DocumentOrder::kUpdatedAsc:
      query += " ORDER BY updated_at ASC, pk ASC";
      break;
    case model::DocumentOrder::kUpdatedDesc:
      query += " ORDER BY updated_at DESC, pk ASC";
      break;
  }
  query += " LIMIT ?;";

  Stmt  st(db, query);
  auto* s   = st.require();
  int   idx = 1;
  if (scan.updated_since) BindI64(s, idx++, *scan.updated_since);
  if (by_pk && !scan.after_pk.empty()) BindText(s, idx++, scan.after_pk);
  BindI64(s, idx, scan.limit == 0 ? -1 : static_cast<std::int64_t>(scan.limit));

  std::vector<model::DocumentRecord> out;
  while (StepRow(db, s)) {
    model::DocumentRecord r;
    r.pk         = ColText(s, 0);
    r.item       = ColText(s, 1);
    r.updated_at = ColI64(s, 2);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Index tables
// ------------------------------------------------------------------

Result SqliteRepository::CreateIndexTable(Transaction& t, const std::string& phy_table, const std::string& col_name, model::ColumnType type) {
  auto*      db    = TX(t).Handle();
  const auto name  = sql::IndexTableName(phy_table, col_name);
  const auto table = sql::Quote(name);

  for (const auto& ddl : {
           "CREATE TABLE IF NOT EXISTS " + table + " (pk TEXT PRIMARY KEY, value " + ValueColumnType(type) + " NOT NULL);",
           "CREATE INDEX IF NOT EXISTS " + sql::Quote(name + "_value") + " ON " + table + "(value, pk);",
       }) {
    Stmt st(db, ddl);
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }
  return Result::Ok();
}

Result SqliteRepository::DropIndexTable(Transaction& t, const std::string& phy_table, const std::string& col_name) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "DROP TABLE IF EXISTS " + sql::Quote(sql::IndexTableName(phy_table, col_name)) + ";");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::PutIndexEntry(Transaction& t, const std::string& phy_table, const std::string& col_name, const model::IndexEntryRecord& e) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "INSERT INTO " + sql::Quote(sql::IndexTableName(phy_table, col_name)) +
                   "(pk,value) VALUES(?,?) ON CONFLICT(pk) DO UPDATE SET value=excluded.value;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, e.pk);
  BindValue(st.get(), 2, e.value);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteIndexEntry(Transaction& t, const std::string& phy_table, const std::string& col_name, const std::string& pk) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "DELETE FROM " + sql::Quote(sql::IndexTableName(phy_table, col_name)) + " WHERE pk=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, pk);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<std::string> SqliteRepository::FindIndexEntries(Transaction& t, const std::string& phy_table, const std::string& col_name,
                                                            const model::IndexLookup& lookup) {
  std::vector<std::string> out;
  if (lookup.operands.empty()) return out;

  auto*       db  = TX(t).Handle();
  std::string query = "SELECT pk FROM " + sql::Quote(sql::IndexTableName(phy_table, col_name)) + " WHERE value " + CompareSql(lookup.op);
  std::size_t binds = 1;
  if (lookup.op == model::CompareOp::kIn) {
    binds = lookup.operands.size();
    query += " (";
    for (std::size_t i = 0; i < binds; ++i) {
      query += i == 0 ? "?" : ",?";
    }
    query += ")";
  } else {
    query += " ?";
  }
  query += " ORDER BY pk;";

  Stmt  st(db, query);
  auto* s = st.require();
  for (std::size_t i = 0; i < binds; ++i) {
    BindValue(s, static_cast<int>(i + 1), lookup.operands[i]);
  }
  while (StepRow(db, s)) {
    out.push_back(ColText(s, 0));
  }
  return out;
}

std::uint64_t SqliteRepository::CountIndexEntries(Transaction& t, const std::string& phy_table, const std::string& col_name) {
  auto* db = TX(t).Handle();
  Stmt  st(db, "SELECT COUNT(*) FROM " + sql::Quote(sql::IndexTableName(phy_table, col_name)) + ";");
  auto* s = st.require();
  return StepRow(db, s) ? ColU64(s, 0) : 0;
}

} // namespace edgestore::db::sqlite
