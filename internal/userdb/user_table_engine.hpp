#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/document_record.hpp"
#include "internal/db/model/index_entry.hpp"
#include "internal/db/model/user_table_record.hpp"
#include "internal/service/service_context.hpp"
#include "internal/userdb/table_lock_registry.hpp"
#include "internal/util/json.hpp"

namespace edgestore::userdb {

struct TableSpec {
  std::string user_id;
  std::string table_name;
  // derived from (user_id, table_name) when empty
  std::string phy_table;
  std::string pk_path;
  // userdb.default_ts_path when empty
  std::string ts_path;
};

struct IndexSpec {
  std::string           col_name;
  std::string           json_path;
  db::model::ColumnType col_type = db::model::ColumnType::kString;
};

struct IndexDescription {
  db::model::UserTableIndexRecord index;
  std::uint64_t                   entries = 0;
};

struct TableDescription {
  db::model::UserTableRecord    table;
  std::vector<IndexDescription> indexes;
};

struct IndexBuildResult {
  std::uint64_t indexed = 0;
  // true when an earlier, interrupted build of the same definition was continued
  bool resumed = false;
};

enum class WriteMode {
  // stored ts >= incoming ts rejects the write
  kLastWriterWins,
  // unconditional replace
  kForce,
};

struct UpsertOptions {
  WriteMode                   mode = WriteMode::kLastWriterWins;
  std::optional<std::int64_t> client_ts;
};

struct UpsertResult {
  std::string  pk;
  std::int64_t ts = 0;
};

struct BatchRowResult {
  std::string  pk;
  std::int64_t ts    = 0;
  bool         stale = false;
};

struct StoredDocument {
  std::string  pk;
  util::Json   doc;
  std::int64_t updated_at = 0;
};

struct ListOptions {
  std::optional<std::int64_t> since;
  // 0 = userdb.default_list_limit; clamped to userdb.max_list_limit
  std::size_t              limit = 0;
  db::model::DocumentOrder order = db::model::DocumentOrder::kByPk;
  std::string              after_pk;
};

// kIn uses every operand, the other operators exactly the first.
struct Predicate {
  db::model::CompareOp    op = db::model::CompareOp::kEq;
  std::vector<util::Json> operands;
};

struct QueryPlan {
  bool          indexed = false;
  std::string   index_column;
  std::uint64_t scanned_documents = 0;
};

struct QueryResult {
  std::vector<StoredDocument> documents;
  QueryPlan                   plan;
};

/*
  UserTableEngine

  Per-user document tables with typed secondary indexes.

  Table lifecycle:

      unregistered -> registered -> registered (N indexes) -> dropped

  - a document write and its index updates commit together
  - last-writer-wins on the document timestamp; equal ts is stale
  - a building index is maintained by writes but never answers queries
  - CreateIndex / DropIndex / DropTable hold the table lock exclusively,
    writes hold it shared, queries read committed state without it
*/
class UserTableEngine {
 public:
  UserTableEngine(service::ServiceContext ctx, std::shared_ptr<TableLockRegistry> locks);

  db::model::UserTableRecord CreateTable(const TableSpec& spec, const service::OperationOptions& options = {});

  TableDescription DescribeTable(const std::string& user_id, const std::string& table_name, const service::OperationOptions& options = {});

  // ordered by table name
  std::vector<db::model::UserTableRecord> ListTables(const std::string& user_id, const service::OperationOptions& options = {});

  void DropTable(const std::string& user_id, const std::string& table_name, const service::OperationOptions& options = {});

  // Backfills in primary-key order. A type mismatch throws InvalidPath at the
  // first offending document; entries already written are kept and the index
  // stays building until CreateIndex is repeated with the same definition.
  IndexBuildResult CreateIndex(const std::string& user_id, const std::string& table_name, const IndexSpec& spec,
                               const service::OperationOptions& options = {});

  void DropIndex(const std::string& user_id, const std::string& table_name, const std::string& col_name,
                 const service::OperationOptions& options = {});

  // Throws StaleWrite when the stored document is at least as new.
  UpsertResult Upsert(const std::string& user_id, const std::string& table_name, const util::Json& doc, const UpsertOptions& upsert = {},
                      const service::OperationOptions& options = {});

  // One atomic unit; stale rows are reported, not raised.
  std::vector<BatchRowResult> UpsertBatch(const std::string& user_id, const std::string& table_name, const std::vector<util::Json>& docs,
                                          const UpsertOptions& upsert = {}, const service::OperationOptions& options = {});

  StoredDocument Get(const std::string& user_id, const std::string& table_name, const std::string& pk, const service::OperationOptions& options = {});

  // Returns the number of documents removed; unknown keys are ignored.
  std::uint64_t Delete(const std::string& user_id, const std::string& table_name, const std::vector<std::string>& pks,
                       const service::OperationOptions& options = {});

  // Matching documents ordered by primary key.
  QueryResult Query(const std::string& user_id, const std::string& table_name, const std::string& col_name, const Predicate& predicate,
                    const service::OperationOptions& options = {});

  std::vector<StoredDocument> List(const std::string& user_id, const std::string& table_name, const ListOptions& list = {},
                                   const service::OperationOptions& options = {});

 private:
  service::ServiceContext            ctx_;
  std::shared_ptr<TableLockRegistry> locks_;
};

} // namespace edgestore::userdb
