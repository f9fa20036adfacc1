#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace edgestore::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result MarkInitialized(Transaction&, std::int64_t completed_at_ms) override;
  bool   IsInitialized(Transaction&) override;

  Result InsertMirrorVersion(Transaction&, model::MirrorVersionRecord&) override;
  std::optional<model::MirrorVersionRecord> GetMirrorVersion(Transaction&, const std::string& dataset_id, const std::string& version) override;
  std::optional<model::MirrorVersionRecord> GetLatestMirrorVersion(Transaction&, const std::string& dataset_id) override;
  std::vector<model::MirrorVersionRecord>   ListMirrorVersions(Transaction&, const std::string& dataset_id, std::size_t limit) override;
  Result InsertGlobalRows(Transaction&, const std::string& dataset_id, const std::string& version, const std::vector<std::string>& items) override;
  std::vector<model::GlobalRowRecord> ReadGlobalRows(Transaction&, const std::string& dataset_id, const std::string& version, std::uint64_t after_id,
                                                     std::size_t limit) override;
  std::uint64_t CountGlobalRows(Transaction&, const std::string& dataset_id, const std::string& version) override;

  Result UpsertUserContext(Transaction&, const model::UserContextRecord&) override;
  std::optional<model::UserContextRecord> GetUserContext(Transaction&, const std::string& user_id, const std::string& dataset_id) override;

  Result AppendUserViews(Transaction&, std::vector<model::UserViewRecord>& rows) override;
  std::vector<model::UserViewRecord> ReadUserViews(Transaction&, const model::UserViewQuery& query) override;

  Result InsertUserTable(Transaction&, model::UserTableRecord&) override;
  std::optional<model::UserTableRecord> GetUserTable(Transaction&, const std::string& user_id, const std::string& table_name) override;
  std::vector<model::UserTableRecord>   ListUserTables(Transaction&, const std::string& user_id) override;
  Result DeleteUserTable(Transaction&, const std::string& user_id, const std::string& table_name) override;
  Result InsertUserTableIndex(Transaction&, model::UserTableIndexRecord&) override;
  Result UpdateUserTableIndexState(Transaction&, const std::string& user_id, const std::string& table_name, const std::string& col_name,
                                   model::IndexState state) override;
  std::vector<model::UserTableIndexRecord> ListUserTableIndexes(Transaction&, const std::string& user_id, const std::string& table_name) override;
  Result DeleteUserTableIndex(Transaction&, const std::string& user_id, const std::string& table_name, const std::string& col_name) override;

  Result CreateDocumentTable(Transaction&, const std::string& phy_table) override;
  Result DropDocumentTable(Transaction&, const std::string& phy_table) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, const std::string& phy_table, const std::string& pk) override;
  Result PutDocument(Transaction&, const std::string& phy_table, const model::DocumentRecord&, model::DocumentWriteMode mode) override;
  Result DeleteDocument(Transaction&, const std::string& phy_table, const std::string& pk) override;
  std::vector<model::DocumentRecord> ScanDocuments(Transaction&, const std::string& phy_table, const model::DocumentScan& scan) override;

  Result CreateIndexTable(Transaction&, const std::string& phy_table, const std::string& col_name, model::ColumnType type) override;
  Result DropIndexTable(Transaction&, const std::string& phy_table, const std::string& col_name) override;
  Result PutIndexEntry(Transaction&, const std::string& phy_table, const std::string& col_name, const model::IndexEntryRecord&) override;
  Result DeleteIndexEntry(Transaction&, const std::string& phy_table, const std::string& col_name, const std::string& pk) override;
  std::vector<std::string> FindIndexEntries(Transaction&, const std::string& phy_table, const std::string& col_name,
                                            const model::IndexLookup& lookup) override;
  std::uint64_t CountIndexEntries(Transaction&, const std::string& phy_table, const std::string& col_name) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace edgestore::db::postgres
