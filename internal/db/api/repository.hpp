#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/context_record.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/index_entry.hpp"
#include "internal/db/model/mirror_record.hpp"
#include "internal/db/model/user_table_record.hpp"
#include "internal/db/model/view_record.hpp"

namespace edgestore::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Unique keys are enforced by the backend and reported as AlreadyExists
  - Every mutating call returns a Result; read-only repositories answer
    PermissionDenied without touching storage

  The DB is the source of truth for:
    mirrored dataset versions and rows
    user contexts and the view log
    UserDB catalog, documents and index entries
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Readiness marker (init_complete)
  // ---------------------------------------------------------------------

  // Idempotent: the first call wins, later calls keep the original time.
  virtual Result MarkInitialized(Transaction&, std::int64_t completed_at_ms) = 0;

  virtual bool IsInitialized(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Dataset mirror
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists when (dataset_id, version) is taken.
  virtual Result InsertMirrorVersion(Transaction&, model::MirrorVersionRecord& record) = 0;

  virtual std::optional<model::MirrorVersionRecord> GetMirrorVersion(Transaction&, const std::string& dataset_id, const std::string& version) = 0;

  // greatest ts, ties broken by greatest id
  virtual std::optional<model::MirrorVersionRecord> GetLatestMirrorVersion(Transaction&, const std::string& dataset_id) = 0;

  // newest first; limit 0 = all
  virtual std::vector<model::MirrorVersionRecord> ListMirrorVersions(Transaction&, const std::string& dataset_id, std::size_t limit) = 0;

  // Rows keep the order of items.
  virtual Result InsertGlobalRows(Transaction&, const std::string& dataset_id, const std::string& version,
                                  const std::vector<std::string>& items) = 0;

  // Insertion order, rows with id > after_id; limit 0 = all.
  virtual std::vector<model::GlobalRowRecord> ReadGlobalRows(Transaction&, const std::string& dataset_id, const std::string& version,
                                                             std::uint64_t after_id, std::size_t limit) = 0;

  virtual std::uint64_t CountGlobalRows(Transaction&, const std::string& dataset_id, const std::string& version) = 0;

  // ---------------------------------------------------------------------
  // User contexts
  // ---------------------------------------------------------------------

  virtual Result UpsertUserContext(Transaction&, const model::UserContextRecord&) = 0;

  virtual std::optional<model::UserContextRecord> GetUserContext(Transaction&, const std::string& user_id, const std::string& dataset_id) = 0;

  // ---------------------------------------------------------------------
  // View log
  // ---------------------------------------------------------------------

  // Assigns ids in append order.
  virtual Result AppendUserViews(Transaction&, std::vector<model::UserViewRecord>& rows) = 0;

  virtual std::vector<model::UserViewRecord> ReadUserViews(Transaction&, const model::UserViewQuery& query) = 0;

  // ---------------------------------------------------------------------
  // UserDB catalog
  // ---------------------------------------------------------------------

  // Assigns record.id. AlreadyExists when (user_id, table_name) or phy_table is taken.
  virtual Result InsertUserTable(Transaction&, model::UserTableRecord& record) = 0;

  virtual std::optional<model::UserTableRecord> GetUserTable(Transaction&, const std::string& user_id, const std::string& table_name) = 0;

  virtual std::vector<model::UserTableRecord> ListUserTables(Transaction&, const std::string& user_id) = 0;

  virtual Result DeleteUserTable(Transaction&, const std::string& user_id, const std::string& table_name) = 0;

  virtual Result InsertUserTableIndex(Transaction&, model::UserTableIndexRecord& record) = 0;

  virtual Result UpdateUserTableIndexState(Transaction&, const std::string& user_id, const std::string& table_name, const std::string& col_name,
                                           model::IndexState state) = 0;

  // ordered by col_name
  virtual std::vector<model::UserTableIndexRecord> ListUserTableIndexes(Transaction&, const std::string& user_id, const std::string& table_name) = 0;

  virtual Result DeleteUserTableIndex(Transaction&, const std::string& user_id, const std::string& table_name, const std::string& col_name) = 0;

  // ---------------------------------------------------------------------
  // UserDB documents (one physical table per UserDB table)
  // ---------------------------------------------------------------------

  virtual Result CreateDocumentTable(Transaction&, const std::string& phy_table) = 0;

  virtual Result DropDocumentTable(Transaction&, const std::string& phy_table) = 0;

  virtual std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string& phy_table, const std::string& pk) = 0;

  // kIfNewer answers Conflict when the stored updated_at >= incoming.
  virtual Result PutDocument(Transaction&, const std::string& phy_table, const model::DocumentRecord& record,
                             model::DocumentWriteMode mode) = 0;

  // NotFound when the pk is absent.
  virtual Result DeleteDocument(Transaction&, const std::string& phy_table, const std::string& pk) = 0;

  virtual std::vector<model::DocumentRecord> ScanDocuments(Transaction&, const std::string& phy_table, const model::DocumentScan& scan) = 0;

  // ---------------------------------------------------------------------
  // UserDB secondary index tables (one per indexed column)
  // ---------------------------------------------------------------------

  virtual Result CreateIndexTable(Transaction&, const std::string& phy_table, const std::string& col_name, model::ColumnType type) = 0;

  virtual Result DropIndexTable(Transaction&, const std::string& phy_table, const std::string& col_name) = 0;

  // Replaces any previous entry for pk.
  virtual Result PutIndexEntry(Transaction&, const std::string& phy_table, const std::string& col_name, const model::IndexEntryRecord& entry) = 0;

  virtual Result DeleteIndexEntry(Transaction&, const std::string& phy_table, const std::string& col_name, const std::string& pk) = 0;

  // Matching primary keys in ascending order.
  virtual std::vector<std::string> FindIndexEntries(Transaction&, const std::string& phy_table, const std::string& col_name,
                                                    const model::IndexLookup& lookup) = 0;

  virtual std::uint64_t CountIndexEntries(Transaction&, const std::string& phy_table, const std::string& col_name) = 0;
};

} // namespace edgestore::db
