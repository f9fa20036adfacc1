#include "pg_repository.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/db/sql/identifiers.hpp"

namespace edgestore::db::postgres {

namespace {

std::int64_t LimitOrAll(std::size_t limit) {
  // LIMIT NULL is "no limit" in postgres; a huge bound keeps the query text static
  return limit == 0 ? std::numeric_limits<std::int64_t>::max() : static_cast<std::int64_t>(limit);
}

bool HasNulByte(const std::string& s) {
  return s.find('\0') != std::string::npos;
}

void AppendValue(pqxx::params& params, const model::IndexValue& value) {
  std::visit([&](const auto& v) { params.append(v); }, value);
}

std::string ValueColumnType(model::ColumnType type) {
  switch (type) {
    case model::ColumnType::kString:
      return "TEXT COLLATE \"C\"";
    case model::ColumnType::kNumber:
      return "DOUBLE PRECISION";
    case model::ColumnType::kInteger:
    case model::ColumnType::kDatetime:
      return "BIGINT";
    case model::ColumnType::kBoolean:
      return "BOOLEAN";
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

void RequireIdentifier(const std::string& name) {
  if (!sql::IsValidIdentifier(name)) {
    throw std::invalid_argument("invalid identifier: " + name);
  }
}

model::MirrorVersionRecord ReadVersion(const pqxx::row& row) {
  model::MirrorVersionRecord r;
  r.id         = row[0].as<std::uint64_t>();
  r.dataset_id = row[1].c_str();
  r.version    = row[2].c_str();
  r.checksum   = row[3].c_str();
  r.ts         = row[4].as<std::int64_t>();
  return r;
}

model::UserTableRecord ReadTable(const pqxx::row& row) {
  model::UserTableRecord r;
  r.id         = row[0].as<std::uint64_t>();
  r.user_id    = row[1].c_str();
  r.table_name = row[2].c_str();
  r.phy_table  = row[3].c_str();
  r.pk_path    = row[4].c_str();
  r.ts_path    = row[5].c_str();
  r.created_at = row[6].as<std::int64_t>();
  return r;
}

model::DocumentRecord ReadDocument(const pqxx::row& row) {
  model::DocumentRecord r;
  r.pk         = row[0].c_str();
  r.item       = row[1].c_str();
  r.updated_at = row[2].as<std::int64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Readiness
// ------------------------------------------------------------------

Result PgRepository::MarkInitialized(Transaction& t, std::int64_t completed_at_ms) {
  try {
    TX(t).Work().exec_params("INSERT INTO init_complete(id,completed_at) VALUES(1,$1) ON CONFLICT(id) DO NOTHING;", completed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::IsInitialized(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT 1 FROM init_complete WHERE id=1;");
  return !res.empty();
}

// ------------------------------------------------------------------
// Mirror
// ------------------------------------------------------------------

Result PgRepository::InsertMirrorVersion(Transaction& t, model::MirrorVersionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO global_mirror_versions(dataset_id,version,checksum,ts) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(dataset_id,version) DO NOTHING RETURNING id;",
        r.dataset_id, r.version, r.checksum, r.ts);
    if (res.empty()) return Result::Err(ErrorCode::AlreadyExists, "dataset version exists");
    r.id = res[0][0].as<std::uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MirrorVersionRecord> PgRepository::GetMirrorVersion(Transaction& t, const std::string& dataset_id, const std::string& version) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,dataset_id,version,checksum,ts FROM global_mirror_versions WHERE dataset_id=$1 AND version=$2;", dataset_id, version);
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

std::optional<model::MirrorVersionRecord> PgRepository::GetLatestMirrorVersion(Transaction& t, const std::string& dataset_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,dataset_id,version,checksum,ts FROM global_mirror_versions WHERE dataset_id=$1 ORDER BY ts DESC, id DESC LIMIT 1;", dataset_id);
  if (res.empty()) return std::nullopt;
  return ReadVersion(res[0]);
}

std::vector<model::MirrorVersionRecord> PgRepository::ListMirrorVersions(Transaction& t, const std::string& dataset_id, std::size_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,dataset_id,version,checksum,ts FROM global_mirror_versions WHERE dataset_id=$1 ORDER BY ts DESC, id DESC LIMIT $2;", dataset_id,
      LimitOrAll(limit));

  std::vector<model::MirrorVersionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadVersion(row));
  }
  return out;
}

Result PgRepository::InsertGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version,
                                      const std::vector<std::string>& items) {
  try {
    for (const auto& item : items) {
      TX(t).Work().exec_params("INSERT INTO global_rows(dataset_id,version,item) VALUES($1,$2,$3::jsonb);", dataset_id, version, item);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::GlobalRowRecord> PgRepository::ReadGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version,
                                                                 std::uint64_t after_id, std::size_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,dataset_id,version,item::text FROM global_rows WHERE dataset_id=$1 AND version=$2 AND id>$3 ORDER BY id LIMIT $4;", dataset_id,
      version, static_cast<std::int64_t>(after_id), LimitOrAll(limit));

  std::vector<model::GlobalRowRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::GlobalRowRecord r;
    r.id         = row[0].as<std::uint64_t>();
    r.dataset_id = row[1].c_str();
    r.version    = row[2].c_str();
    r.item       = row[3].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

std::uint64_t PgRepository::CountGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM global_rows WHERE dataset_id=$1 AND version=$2;", dataset_id, version);
  return res[0][0].as<std::uint64_t>();
}

// ------------------------------------------------------------------
// Contexts
// ------------------------------------------------------------------

Result PgRepository::UpsertUserContext(Transaction& t, const model::UserContextRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO user_contexts(user_id,dataset_id,ctx,ts) VALUES($1,$2,$3::jsonb,$4) "
        "ON CONFLICT(user_id,dataset_id) DO UPDATE SET ctx=EXCLUDED.ctx, ts=EXCLUDED.ts;",
        r.user_id, r.dataset_id, r.ctx, r.ts);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UserContextRecord> PgRepository::GetUserContext(Transaction& t, const std::string& user_id, const std::string& dataset_id) {
  auto res = TX(t).Work().exec_params("SELECT id,user_id,dataset_id,ctx::text,ts FROM user_contexts WHERE user_id=$1 AND dataset_id=$2;", user_id,
                                      dataset_id);
  if (res.empty()) return std::nullopt;

  model::UserContextRecord r;
  r.id         = res[0][0].as<std::uint64_t>();
  r.user_id    = res[0][1].c_str();
  r.dataset_id = res[0][2].c_str();
  r.ctx        = res[0][3].c_str();
  r.ts         = res[0][4].as<std::int64_t>();
  return r;
}

// ------------------------------------------------------------------
// View log
// ------------------------------------------------------------------

Result PgRepository::AppendUserViews(Transaction& t, std::vector<model::UserViewRecord>& rows) {
  try {
    for (auto& row : rows) {
      auto res = TX(t).Work().exec_params(
          "INSERT INTO user_views(user_id,dataset_id,version,item,ts) VALUES($1,$2,$3,$4::jsonb,$5) RETURNING id;", row.user_id, row.dataset_id,
          row.version, row.item, row.ts);
      row.id = res[0][0].as<std::uint64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UserViewRecord> PgRepository::ReadUserViews(Transaction& t, const model::UserViewQuery& q) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,user_id,dataset_id,version,item::text,ts FROM user_views "
      "WHERE user_id=$1 AND dataset_id=$2 AND id>$3 AND ts>=$4 AND ($5 = '' OR version=$5) ORDER BY id LIMIT $6;",
      q.user_id, q.dataset_id, static_cast<std::int64_t>(q.after_id), q.since_ts, q.version, LimitOrAll(q.limit));

  std::vector<model::UserViewRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::UserViewRecord r;
    r.id         = row[0].as<std::uint64_t>();
    r.user_id    = row[1].c_str();
    r.dataset_id = row[2].c_str();
    r.version    = row[3].c_str();
    r.item       = row[4].c_str();
    r.ts         = row[5].as<std::int64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result PgRepository::InsertUserTable(Transaction& t, model::UserTableRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO userdb_tables(user_id,table_name,phy_table,pk_path,ts_path,created_at) VALUES($1,$2,$3,$4,$5,$6) RETURNING id;", r.user_id,
        r.table_name, r.phy_table, r.pk_path, r.ts_path, r.created_at);
    r.id = res[0][0].as<std::uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UserTableRecord> PgRepository::GetUserTable(Transaction& t, const std::string& user_id, const std::string& table_name) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,user_id,table_name,phy_table,pk_path,ts_path,created_at FROM userdb_tables WHERE user_id=$1 AND table_name=$2;", user_id,
      table_name);
  if (res.empty()) return std::nullopt;
  return ReadTable(res[0]);
}

std::vector<model::UserTableRecord> PgRepository::ListUserTables(Transaction& t, const std::string& user_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,user_id,table_name,phy_table,pk_path,ts_path,created_at FROM userdb_tables WHERE user_id=$1 ORDER BY table_name;", user_id);

  std::vector<model::UserTableRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadTable(row));
  }
  return out;
}

Result PgRepository::DeleteUserTable(Transaction& t, const std::string& user_id, const std::string& table_name) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM userdb_tables WHERE user_id=$1 AND table_name=$2;", user_id, table_name);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertUserTableIndex(Transaction& t, model::UserTableIndexRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO userdb_table_indexes(user_id,table_name,col_name,json_path,col_type,state) VALUES($1,$2,$3,$4,$5,$6) RETURNING id;", r.user_id,
        r.table_name, r.col_name, r.json_path, std::string(model::ColumnTypeName(r.col_type)), std::string(model::IndexStateName(r.state)));
    r.id = res[0][0].as<std::uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateUserTableIndexState(Transaction& t, const std::string& user_id, const std::string& table_name, const std::string& col_name,
                                               model::IndexState state) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE userdb_table_indexes SET state=$1 WHERE user_id=$2 AND table_name=$3 AND col_name=$4;",
                                        std::string(model::IndexStateName(state)), user_id, table_name, col_name);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UserTableIndexRecord> PgRepository::ListUserTableIndexes(Transaction& t, const std::string& user_id,
                                                                            const std::string& table_name) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,user_id,table_name,col_name,json_path,col_type,state FROM userdb_table_indexes "
      "WHERE user_id=$1 AND table_name=$2 ORDER BY col_name;",
      user_id, table_name);

  std::vector<model::UserTableIndexRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::UserTableIndexRecord r;
    r.id         = row[0].as<std::uint64_t>();
    r.user_id    = row[1].c_str();
    r.table_name = row[2].c_str();
    r.col_name   = row[3].c_str();
    r.json_path  = row[4].c_str();
    r.col_type   = model::ParseColumnType(row[5].c_str()).value_or(model::ColumnType::kString);
    r.state      = model::ParseIndexState(row[6].c_str()).value_or(model::IndexState::kBuilding);
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteUserTableIndex(Transaction& t, const std::string& user_id, const std::string& table_name, const std::string& col_name) {
  try {
    auto res = TX(t).Work().exec_params("DELETE FROM userdb_table_indexes WHERE user_id=$1 AND table_name=$2 AND col_name=$3;", user_id, table_name,
                                        col_name);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result PgRepository::CreateDocumentTable(Transaction& t, const std::string& phy_table) {
  try {
    RequireIdentifier(phy_table);
    const auto table = sql::Quote(phy_table);
    TX(t).Work().exec("CREATE TABLE IF NOT EXISTS " + table + " (pk TEXT COLLATE \"C\" PRIMARY KEY, item JSONB NOT NULL, updated_at BIGINT NOT NULL);");
    TX(t).Work().exec("CREATE INDEX IF NOT EXISTS " + sql::Quote(phy_table + "_updated_at") + " ON " + table + "(updated_at);");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DropDocumentTable(Transaction& t, const std::string& phy_table) {
  try {
    RequireIdentifier(phy_table);
    TX(t).Work().exec("DROP TABLE IF EXISTS " + sql::Quote(phy_table) + ";");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DocumentRecord> PgRepository::GetDocument(Transaction& t, const std::string& phy_table, const std::string& pk) {
  RequireIdentifier(phy_table);
  auto res = TX(t).Work().exec_params("SELECT pk,item::text,updated_at FROM " + sql::Quote(phy_table) + " WHERE pk=$1;", pk);
  if (res.empty()) return std::nullopt;
  return ReadDocument(res[0]);
}

Result PgRepository::PutDocument(Transaction& t, const std::string& phy_table, const model::DocumentRecord& r, model::DocumentWriteMode mode) {
  if (HasNulByte(r.pk)) return Result::Err(ErrorCode::Unsupported, "postgres text cannot hold NUL bytes");
  try {
    RequireIdentifier(phy_table);
    const auto  table = sql::Quote(phy_table);
    std::string query = "INSERT INTO " + table +
                        "(pk,item,updated_at) VALUES($1,$2::jsonb,$3) "
                        "ON CONFLICT(pk) DO UPDATE SET item=EXCLUDED.item, updated_at=EXCLUDED.updated_at";
    if (mode == model::DocumentWriteMode::kIfNewer) {
      query += " WHERE " + table + ".updated_at < EXCLUDED.updated_at";
    }
    query += ";";

    auto res = TX(t).Work().exec_params(query, r.pk, r.item, r.updated_at);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "stored document is newer");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDocument(Transaction& t, const std::string& phy_table, const std::string& pk) {
  try {
    RequireIdentifier(phy_table);
    auto res = TX(t).Work().exec_params("DELETE FROM " + sql::Quote(phy_table) + " WHERE pk=$1;", pk);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::DocumentRecord> PgRepository::ScanDocuments(Transaction& t, const std::string& phy_table, const model::DocumentScan& scan) {
  RequireIdentifier(phy_table);

  const bool   by_pk = scan.order == model::DocumentOrder::kByPk;
  pqxx::params params;
  std::string  query = "SELECT pk,item::text,updated_at FROM " + sql::Quote(phy_table) + " WHERE TRUE";
  if (scan.updated_since) {
    params.append(*scan.updated_since);
    query += " AND updated_at >= $" + std::to_string(params.size());
  }
  if (by_pk && !scan.after_pk.empty()) {
    params.append(scan.after_pk);
    query += " AND pk > $" + std::to_string(params.size());
  }
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
  params.append(LimitOrAll(scan.limit));
  query += " LIMIT $" + std::to_string(params.size()) + ";";

  auto                               res = TX(t).Work().exec_params(query, params);
  std::vector<model::DocumentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadDocument(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Index tables
// ------------------------------------------------------------------

Result PgRepository::CreateIndexTable(Transaction& t, const std::string& phy_table, const std::string& col_name, model::ColumnType type) {
  try {
    const auto name  = sql::IndexTableName(phy_table, col_name);
    const auto table = sql::Quote(name);
    TX(t).Work().exec("CREATE TABLE IF NOT EXISTS " + table + " (pk TEXT COLLATE \"C\" PRIMARY KEY, value " + ValueColumnType(type) + " NOT NULL);");
    TX(t).Work().exec("CREATE INDEX IF NOT EXISTS " + sql::Quote(name + "_value") + " ON " + table + "(value, pk);");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DropIndexTable(Transaction& t, const std::string& phy_table, const std::string& col_name) {
  try {
    TX(t).Work().exec("DROP TABLE IF EXISTS " + sql::Quote(sql::IndexTableName(phy_table, col_name)) + ";");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::PutIndexEntry(Transaction& t, const std::string& phy_table, const std::string& col_name, const model::IndexEntryRecord& e) {
  const auto* text = std::get_if<std::string>(&e.value);
  if (HasNulByte(e.pk) || (text && HasNulByte(*text))) {
    return Result::Err(ErrorCode::Unsupported, "postgres text cannot hold NUL bytes");
  }
  try {
    pqxx::params params;
    params.append(e.pk);
    AppendValue(params, e.value);
    TX(t).Work().exec_params("INSERT INTO " + sql::Quote(sql::IndexTableName(phy_table, col_name)) +
                                 "(pk,value) VALUES($1,$2) ON CONFLICT(pk) DO UPDATE SET value=EXCLUDED.value;",
                             params);
    return Result::Ok();
  } catch (const std::exception& ex) {
    return Translate(ex);
  }
}

Result PgRepository::DeleteIndexEntry(Transaction& t, const std::string& phy_table, const std::string& col_name, const std::string& pk) {
  try {
    TX(t).Work().exec_params("DELETE FROM " + sql::Quote(sql::IndexTableName(phy_table, col_name)) + " WHERE pk=$1;", pk);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::FindIndexEntries(Transaction& t, const std::string& phy_table, const std::string& col_name,
                                                        const model::IndexLookup& lookup) {
  std::vector<std::string> out;
  if (lookup.operands.empty()) return out;

  pqxx::params params;
  std::string  query = "SELECT pk FROM " + sql::Quote(sql::IndexTableName(phy_table, col_name)) + " WHERE value " + CompareSql(lookup.op);
  if (lookup.op == model::CompareOp::kIn) {
    query += " (";
    for (std::size_t i = 0; i < lookup.operands.size(); ++i) {
      AppendValue(params, lookup.operands[i]);
      query += (i == 0 ? "$" : ",$") + std::to_string(i + 1);
    }
    query += ")";
  } else {
    AppendValue(params, lookup.operands.front());
    query += " $1";
  }
  query += " ORDER BY pk;";

  auto res = TX(t).Work().exec_params(query, params);
  out.reserve(res.size());
  for (const auto& row : res) {
    out.emplace_back(row[0].c_str());
  }
  return out;
}

std::uint64_t PgRepository::CountIndexEntries(Transaction& t, const std::string& phy_table, const std::string& col_name) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM " + sql::Quote(sql::IndexTableName(phy_table, col_name)) + ";");
  return res[0][0].as<std::uint64_t>();
}

} // namespace edgestore::db::postgres
