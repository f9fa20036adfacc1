#include "user_table_engine.hpp"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/identifiers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/change_feed.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/transaction_runner.hpp"
#include "internal/userdb/document_values.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_path.hpp"

namespace edgestore::userdb {

using db::model::ColumnType;
using db::model::DocumentRecord;
using db::model::IndexState;
using db::model::IndexValue;
using db::model::UserTableIndexRecord;
using db::model::UserTableRecord;

namespace {

constexpr const char* kFallbackTsPath  = "$.updated_at";
constexpr std::size_t kBackfillPageSize = 256;

struct BoundIndex {
  UserTableIndexRecord record;
  util::JsonPath       path;
};

// Catalog row with its paths parsed, loaded inside the caller's transaction.
struct BoundTable {
  UserTableRecord         record;
  util::JsonPath          pk_path;
  util::JsonPath          ts_path;
  std::vector<BoundIndex> indexes;

  const BoundIndex* FindIndex(const std::string& col_name) const {
    for (const auto& index : indexes) {
      if (index.record.col_name == col_name) return &index;
    }
    return nullptr;
  }
};

struct PreparedWrite {
  DocumentRecord                         record;
  std::vector<std::optional<IndexValue>> values;
};

struct BackfillOutcome {
  std::uint64_t              indexed = 0;
  std::optional<std::string> failure;
};

std::string Describe(const std::string& user_id, const std::string& table_name) {
  return "table '" + table_name + "' of user '" + user_id + "'";
}

BoundTable LoadTable(db::Repository& repo, db::Transaction& tx, const std::string& user_id, const std::string& table_name,
                     std::string_view operation) {
  auto record = repo.GetUserTable(tx, user_id, table_name);
  if (!record) {
    throw util::NotFound(std::string(operation) + ": " + Describe(user_id, table_name) + " does not exist");
  }

  BoundTable bound;
  bound.pk_path = util::JsonPath::Parse(record->pk_path);
  bound.ts_path = util::JsonPath::Parse(record->ts_path);
  for (auto& index : repo.ListUserTableIndexes(tx, user_id, table_name)) {
    auto path = util::JsonPath::Parse(index.json_path);
    bound.indexes.push_back(BoundIndex{std::move(index), std::move(path)});
  }
  bound.record = std::move(*record);
  return bound;
}

// Validates and extracts everything before the first mutation.
PreparedWrite Prepare(const BoundTable& table, const util::Json& doc, const UpsertOptions& upsert, std::int64_t now_ms) {
  if (!util::IsObject(doc)) {
    throw util::InvalidArgument("document must be a JSON object");
  }

  PreparedWrite write;
  write.record.pk = ExtractPrimaryKey(doc, table.pk_path);
  if (upsert.client_ts) {
    write.record.updated_at = *upsert.client_ts;
  } else {
    write.record.updated_at = ExtractTimestamp(doc, table.ts_path).value_or(now_ms);
  }
  write.record.item = util::ToJson(doc);

  write.values.reserve(table.indexes.size());
  for (const auto& index : table.indexes) {
    write.values.push_back(ExtractColumnValue(doc, index.path, index.record.col_type));
  }
  return write;
}

// false when the stored document is at least as new (nothing was written)
bool Apply(db::Repository& repo, db::Transaction& tx, const BoundTable& table, const PreparedWrite& write, WriteMode mode) {
  const auto doc_mode = mode == WriteMode::kForce ? db::model::DocumentWriteMode::kReplace : db::model::DocumentWriteMode::kIfNewer;
  const auto stored   = repo.PutDocument(tx, table.record.phy_table, write.record, doc_mode);
  if (stored.code == db::ErrorCode::Conflict) {
    return false;
  }
  service::ThrowIfDbError(stored, "write document");

  for (std::size_t i = 0; i < table.indexes.size(); ++i) {
    const auto& col = table.indexes[i].record.col_name;
    if (write.values[i]) {
      service::ThrowIfDbError(repo.PutIndexEntry(tx, table.record.phy_table, col, {write.record.pk, *write.values[i]}), "write index entry");
    } else {
      service::ThrowIfDbError(repo.DeleteIndexEntry(tx, table.record.phy_table, col, write.record.pk), "clear index entry");
    }
  }
  return true;
}

StoredDocument ToStored(const DocumentRecord& record) {
  return StoredDocument{record.pk, util::ParseJson(record.item), record.updated_at};
}

db::model::IndexLookup BuildLookup(const Predicate& predicate, ColumnType type) {
  db::model::IndexLookup lookup;
  lookup.op = predicate.op;
  for (const auto& operand : predicate.operands) {
    lookup.operands.push_back(CoerceOperand(operand, type));
  }
  return lookup;
}

void RequireIdentifiers(const std::string& user_id, const std::string& table_name, std::string_view operation) {
  if (user_id.empty() || table_name.empty()) {
    throw util::InvalidArgument(std::string(operation) + ": user_id and table_name must not be empty");
  }
}

} // namespace

UserTableEngine::UserTableEngine(service::ServiceContext ctx, std::shared_ptr<TableLockRegistry> locks) : ctx_(std::move(ctx)), locks_(std::move(locks)) {
  if (!locks_) {
    throw std::invalid_argument("UserTableEngine requires a lock registry");
  }
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

UserTableRecord UserTableEngine::CreateTable(const TableSpec& spec, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.CreateTable";
  return service::ObserveOperation(kRoute, spec.user_id, [&] {
    ctx_.RequireWriter(kRoute);
    RequireIdentifiers(spec.user_id, spec.table_name, kRoute);

    UserTableRecord record;
    record.user_id    = spec.user_id;
    record.table_name = spec.table_name;
    record.phy_table  = spec.phy_table.empty() ? db::sql::DocumentTableName(spec.user_id, spec.table_name) : spec.phy_table;
    record.pk_path    = spec.pk_path;
    record.ts_path    = spec.ts_path;
    if (record.ts_path.empty()) {
      record.ts_path = ctx_.config.userdb().default_ts_path().empty() ? kFallbackTsPath : ctx_.config.userdb().default_ts_path();
    }

    if (!db::sql::IsValidIdentifier(record.phy_table) || db::sql::IsReservedTableName(record.phy_table)) {
      throw util::InvalidArgument(std::string(kRoute) + ": physical table name '" + record.phy_table + "' is not allowed");
    }
    if (util::JsonPath::Parse(record.pk_path).IsRoot()) {
      throw util::InvalidPath(std::string(kRoute) + ": pk_path must select a field");
    }
    util::JsonPath::Parse(record.ts_path);

    auto             lock = locks_->Acquire(spec.user_id, spec.table_name);
    std::unique_lock guard(*lock);

    service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      record.created_at = ctx_.NowMs();
      auto inserted     = ctx_.repository->InsertUserTable(tx, record);
      if (inserted.code == db::ErrorCode::AlreadyExists || inserted.code == db::ErrorCode::ConstraintViolation) {
        throw util::AlreadyExists(std::string(kRoute) + ": " + Describe(spec.user_id, spec.table_name) + " or its physical table already exists");
      }
      service::ThrowIfDbError(inserted, "register table");
      service::ThrowIfDbError(ctx_.repository->CreateDocumentTable(tx, record.phy_table), "create document table");
    });

    EDGESTORE_LOG_INFO("user table created", {observability::StringField("user_id", spec.user_id), observability::StringField("table", spec.table_name),
                                              observability::StringField("phy_table", record.phy_table)});
    return record;
  });
}

TableDescription UserTableEngine::DescribeTable(const std::string& user_id, const std::string& table_name, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.DescribeTable";
  return service::ObserveOperation(kRoute, user_id, [&] {
    return service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      auto&            repo  = *ctx_.repository;
      auto             bound = LoadTable(repo, tx, user_id, table_name, kRoute);
      TableDescription out;
      for (auto& index : bound.indexes) {
        const auto entries = repo.CountIndexEntries(tx, bound.record.phy_table, index.record.col_name);
        out.indexes.push_back(IndexDescription{std::move(index.record), entries});
      }
      out.table = std::move(bound.record);
      return out;
    });
  });
}

std::vector<UserTableRecord> UserTableEngine::ListTables(const std::string& user_id, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.ListTables";
  return service::ObserveOperation(kRoute, user_id, [&] {
    return service::RunInTransaction(ctx_, options, kRoute,
                                     [&](db::Transaction& tx, const util::Deadline&) { return ctx_.repository->ListUserTables(tx, user_id); });
  });
}

void UserTableEngine::DropTable(const std::string& user_id, const std::string& table_name, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.DropTable";
  service::ObserveOperation(kRoute, user_id, [&] {
    ctx_.RequireWriter(kRoute);

    auto             lock = locks_->Acquire(user_id, table_name);
    std::unique_lock guard(*lock);

    service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline& deadline) {
      auto& repo  = *ctx_.repository;
      auto  bound = LoadTable(repo, tx, user_id, table_name, kRoute);
      for (const auto& index : bound.indexes) {
        deadline.Check(kRoute);
        service::ThrowIfDbError(repo.DropIndexTable(tx, bound.record.phy_table, index.record.col_name), "drop index table");
        service::ThrowIfDbError(repo.DeleteUserTableIndex(tx, user_id, table_name, index.record.col_name), "unregister index");
      }
      service::ThrowIfDbError(repo.DropDocumentTable(tx, bound.record.phy_table), "drop document table");
      service::ThrowIfDbError(repo.DeleteUserTable(tx, user_id, table_name), "unregister table");
    });

    EDGESTORE_LOG_INFO("user table dropped", {observability::StringField("user_id", user_id), observability::StringField("table", table_name)});
  });
}

// ---------------------------------------------------------------------------
// Indexes
// ---------------------------------------------------------------------------

IndexBuildResult UserTableEngine::CreateIndex(const std::string& user_id, const std::string& table_name, const IndexSpec& spec,
                                              const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.CreateIndex";
  return service::ObserveOperation(kRoute, user_id, [&] {
    ctx_.RequireWriter(kRoute);
    RequireIdentifiers(user_id, table_name, kRoute);
    if (!db::sql::IsValidIdentifier(spec.col_name)) {
      throw util::InvalidArgument(std::string(kRoute) + ": column name '" + spec.col_name + "' must match [A-Za-z_][A-Za-z0-9_]{0,62}");
    }
    const auto path = util::JsonPath::Parse(spec.json_path);
    if (path.IsRoot()) {
      throw util::InvalidPath(std::string(kRoute) + ": index path must select a field");
    }

    auto             lock = locks_->Acquire(user_id, table_name);
    std::unique_lock guard(*lock);

    const auto max_indexes = ctx_.config.userdb().max_indexes_per_table();

    const bool resumed = service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      auto& repo  = *ctx_.repository;
      auto  bound = LoadTable(repo, tx, user_id, table_name, kRoute);

      if (const auto* existing = bound.FindIndex(spec.col_name)) {
        if (existing->record.json_path != spec.json_path || existing->record.col_type != spec.col_type) {
          throw util::AlreadyExists(std::string(kRoute) + ": index '" + spec.col_name + "' exists with a different definition");
        }
        if (existing->record.state == IndexState::kReady) {
          throw util::AlreadyExists(std::string(kRoute) + ": index '" + spec.col_name + "' already exists");
        }
        return true;
      }
      if (max_indexes > 0 && bound.indexes.size() >= max_indexes) {
        throw util::InvalidArgument(std::string(kRoute) + ": " + Describe(user_id, table_name) + " already has " + std::to_string(max_indexes) +
                                    " indexes");
      }

      UserTableIndexRecord record;
      record.user_id    = user_id;
      record.table_name = table_name;
      record.col_name   = spec.col_name;
      record.json_path  = spec.json_path;
      record.col_type   = spec.col_type;
      record.state      = IndexState::kBuilding;
      service::ThrowIfDbError(repo.InsertUserTableIndex(tx, record), "register index");
      service::ThrowIfDbError(repo.CreateIndexTable(tx, bound.record.phy_table, spec.col_name, spec.col_type), "create index table");
      return false;
    });

    // Backfill in primary-key order; a failure still commits what was indexed.
    const auto outcome = service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline& deadline) {
      auto& repo  = *ctx_.repository;
      auto  bound = LoadTable(repo, tx, user_id, table_name, kRoute);
      const auto& phy = bound.record.phy_table;

      BackfillOutcome        out;
      db::model::DocumentScan scan;
      scan.order = db::model::DocumentOrder::kByPk;
      scan.limit = kBackfillPageSize;
      for (;;) {
        deadline.Check(kRoute);
        const auto page = repo.ScanDocuments(tx, phy, scan);
        for (const auto& doc : page) {
          std::optional<IndexValue> value;
          try {
            value = ExtractColumnValue(util::ParseJson(doc.item), path, spec.col_type);
          } catch (const util::InvalidPath& ex) {
            out.failure = "document '" + doc.pk + "': " + ex.what();
            return out;
          }
          if (value) {
            service::ThrowIfDbError(repo.PutIndexEntry(tx, phy, spec.col_name, {doc.pk, *value}), "backfill index entry");
            ++out.indexed;
          }
        }
        if (page.size() < kBackfillPageSize) {
          break;
        }
        scan.after_pk = page.back().pk;
      }
      service::ThrowIfDbError(repo.UpdateUserTableIndexState(tx, user_id, table_name, spec.col_name, IndexState::kReady), "mark index ready");
      return out;
    });

    if (outcome.failure) {
      EDGESTORE_LOG_WARN("index backfill stopped", {observability::StringField("user_id", user_id), observability::StringField("table", table_name),
                                                    observability::StringField("column", spec.col_name),
                                                    observability::IntField("indexed", static_cast<std::int64_t>(outcome.indexed))});
      throw util::InvalidPath(std::string(kRoute) + ": " + *outcome.failure + "; the index stays building, fix the document and repeat CreateIndex");
    }

    EDGESTORE_LOG_INFO("index ready", {observability::StringField("user_id", user_id), observability::StringField("table", table_name),
                                       observability::StringField("column", spec.col_name), observability::BoolField("resumed", resumed),
                                       observability::IntField("indexed", static_cast<std::int64_t>(outcome.indexed))});
    return IndexBuildResult{outcome.indexed, resumed};
  });
}

void UserTableEngine::DropIndex(const std::string& user_id, const std::string& table_name, const std::string& col_name,
                                const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.DropIndex";
  service::ObserveOperation(kRoute, user_id, [&] {
    ctx_.RequireWriter(kRoute);

    auto             lock = locks_->Acquire(user_id, table_name);
    std::unique_lock guard(*lock);

    service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      auto& repo  = *ctx_.repository;
      auto  bound = LoadTable(repo, tx, user_id, table_name, kRoute);
      if (!bound.FindIndex(col_name)) {
        throw util::NotFound(std::string(kRoute) + ": index '" + col_name + "' does not exist on " + Describe(user_id, table_name));
      }
      service::ThrowIfDbError(repo.DropIndexTable(tx, bound.record.phy_table, col_name), "drop index table");
      service::ThrowIfDbError(repo.DeleteUserTableIndex(tx, user_id, table_name, col_name), "unregister index");
    });
  });
}

// ---------------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------------

UpsertResult UserTableEngine::Upsert(const std::string& user_id, const std::string& table_name, const util::Json& doc, const UpsertOptions& upsert,
                                     const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.Upsert";
  return service::ObserveOperation(kRoute, user_id, [&] {
    ctx_.RequireWriter(kRoute);

    auto             lock = locks_->Acquire(user_id, table_name);
    std::shared_lock guard(*lock);

    const auto result = service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      auto&      repo  = *ctx_.repository;
      const auto bound = LoadTable(repo, tx, user_id, table_name, kRoute);
      const auto write = Prepare(bound, doc, upsert, ctx_.NowMs());
      if (!Apply(repo, tx, bound, write, upsert.mode)) {
        observability::Metrics::Instance().RecordStaleWrite();
        throw util::StaleWrite(std::string(kRoute) + ": document '" + write.record.pk + "' is stored with a timestamp >= " +
                               std::to_string(write.record.updated_at));
      }
      return UpsertResult{write.record.pk, write.record.updated_at};
    });
    ctx_.Announce(service::UpsertEvent(user_id, table_name, result.pk, result.ts, doc));
    return result;
  });
}

std::vector<BatchRowResult> UserTableEngine::UpsertBatch(const std::string& user_id, const std::string& table_name, const std::vector<util::Json>& docs,
                                                         const UpsertOptions& upsert, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.UpsertBatch";
  return service::ObserveOperation(kRoute, user_id, [&] {
    ctx_.RequireWriter(kRoute);

    auto             lock = locks_->Acquire(user_id, table_name);
    std::shared_lock guard(*lock);

    auto results = service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline& deadline) {
      auto&      repo  = *ctx_.repository;
      const auto bound = LoadTable(repo, tx, user_id, table_name, kRoute);
      const auto now   = ctx_.NowMs();

      std::vector<PreparedWrite> writes;
      writes.reserve(docs.size());
      for (const auto& doc : docs) {
        writes.push_back(Prepare(bound, doc, upsert, now));
      }

      std::vector<BatchRowResult> out;
      out.reserve(writes.size());
      for (const auto& write : writes) {
        deadline.Check(kRoute);
        const bool written = Apply(repo, tx, bound, write, upsert.mode);
        if (!written) {
          observability::Metrics::Instance().RecordStaleWrite();
        }
        out.push_back(BatchRowResult{write.record.pk, write.record.updated_at, !written});
      }
      return out;
    });
    for (std::size_t i = 0; i < results.size(); ++i) {
      if (!results[i].stale) {
        ctx_.Announce(service::UpsertEvent(user_id, table_name, results[i].pk, results[i].ts, docs[i]));
      }
    }
    return results;
  });
}

StoredDocument UserTableEngine::Get(const std::string& user_id, const std::string& table_name, const std::string& pk,
                                    const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.Get";
  return service::ObserveOperation(kRoute, user_id, [&] {
    return service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      auto&      repo  = *ctx_.repository;
      const auto table = repo.GetUserTable(tx, user_id, table_name);
      if (!table) {
        throw util::NotFound(std::string(kRoute) + ": " + Describe(user_id, table_name) + " does not exist");
      }
      auto record = repo.GetDocument(tx, table->phy_table, pk);
      if (!record) {
        throw util::NotFound(std::string(kRoute) + ": document '" + pk + "' does not exist in " + Describe(user_id, table_name));
      }
      return ToStored(*record);
    });
  });
}

std::uint64_t UserTableEngine::Delete(const std::string& user_id, const std::string& table_name, const std::vector<std::string>& pks,
                                      const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.Delete";
  return service::ObserveOperation(kRoute, user_id, [&] {
    ctx_.RequireWriter(kRoute);

    auto             lock = locks_->Acquire(user_id, table_name);
    std::shared_lock guard(*lock);

    std::vector<std::string> removed_pks;
    const auto count = service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline& deadline) {
      auto&         repo    = *ctx_.repository;
      const auto    bound   = LoadTable(repo, tx, user_id, table_name, kRoute);
      std::uint64_t deleted = 0;
      removed_pks.clear();
      for (const auto& pk : pks) {
        deadline.Check(kRoute);
        const auto removed = repo.DeleteDocument(tx, bound.record.phy_table, pk);
        if (removed.code == db::ErrorCode::NotFound) {
          continue;
        }
        service::ThrowIfDbError(removed, "delete document");
        for (const auto& index : bound.indexes) {
          service::ThrowIfDbError(repo.DeleteIndexEntry(tx, bound.record.phy_table, index.record.col_name, pk), "delete index entry");
        }
        removed_pks.push_back(pk);
        ++deleted;
      }
      return deleted;
    });
    for (const auto& pk : removed_pks) {
      ctx_.Announce(service::DeleteEvent(user_id, table_name, pk));
    }
    return count;
  });
}

QueryResult UserTableEngine::Query(const std::string& user_id, const std::string& table_name, const std::string& col_name, const Predicate& predicate,
                                   const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.Query";
  return service::ObserveOperation(kRoute, user_id, [&] {
    if (predicate.operands.empty() || (predicate.op != db::model::CompareOp::kIn && predicate.operands.size() != 1)) {
      throw util::InvalidArgument(std::string(kRoute) + ": '" + std::string(CompareOpName(predicate.op)) + "' takes " +
                                  (predicate.op == db::model::CompareOp::kIn ? "at least one operand" : "exactly one operand"));
    }

    return service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline& deadline) {
      auto&       repo  = *ctx_.repository;
      const auto  bound = LoadTable(repo, tx, user_id, table_name, kRoute);
      const auto& phy   = bound.record.phy_table;
      const auto* index = bound.FindIndex(col_name);

      QueryResult out;
      if (index && index->record.state == IndexState::kReady) {
        out.plan.indexed      = true;
        out.plan.index_column = col_name;
        for (const auto& pk : repo.FindIndexEntries(tx, phy, col_name, BuildLookup(predicate, index->record.col_type))) {
          if (auto record = repo.GetDocument(tx, phy, pk)) {
            out.documents.push_back(ToStored(*record));
          }
        }
        return out;
      }

      // building or undeclared column: full scan in primary-key order
      const auto path   = index ? index->path : util::JsonPath::Parse(col_name.rfind('$', 0) == 0 ? col_name : "$." + col_name);
      const auto type   = index ? index->record.col_type : InferColumnType(predicate.operands.front());
      const auto lookup = BuildLookup(predicate, type);

      deadline.Check(kRoute);
      for (const auto& record : repo.ScanDocuments(tx, phy, db::model::DocumentScan{})) {
        ++out.plan.scanned_documents;
        auto doc   = util::ParseJson(record.item);
        auto value = TryExtractColumnValue(doc, path, type);
        if (value && db::model::MatchesLookup(*value, lookup)) {
          out.documents.push_back(StoredDocument{record.pk, std::move(doc), record.updated_at});
        }
      }
      return out;
    });
  });
}

std::vector<StoredDocument> UserTableEngine::List(const std::string& user_id, const std::string& table_name, const ListOptions& list,
                                                  const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserTableEngine.List";
  return service::ObserveOperation(kRoute, user_id, [&] {
    const auto& limits = ctx_.config.userdb();

    db::model::DocumentScan scan;
    scan.updated_since = list.since;
    scan.order         = list.order;
    scan.after_pk      = list.after_pk;
    scan.limit         = list.limit == 0 ? limits.default_list_limit() : list.limit;
    if (limits.max_list_limit() > 0) {
      scan.limit = std::min<std::size_t>(scan.limit == 0 ? limits.max_list_limit() : scan.limit, limits.max_list_limit());
    }

    return service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      auto&      repo  = *ctx_.repository;
      const auto table = repo.GetUserTable(tx, user_id, table_name);
      if (!table) {
        throw util::NotFound(std::string(kRoute) + ": " + Describe(user_id, table_name) + " does not exist");
      }
      std::vector<StoredDocument> out;
      for (const auto& record : repo.ScanDocuments(tx, table->phy_table, scan)) {
        out.push_back(ToStored(record));
      }
      return out;
    });
  });
}

} // namespace edgestore::userdb
