#include "read_only_repository.hpp"

#include <stdexcept>

namespace edgestore::db::guard {

ReadOnlyRepository::ReadOnlyRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  if (!inner_) {
    throw std::invalid_argument("ReadOnlyRepository: inner repository is null");
  }
}

Result ReadOnlyRepository::Denied(const char* operation) {
  return Result::Err(ErrorCode::PermissionDenied, std::string(operation) + " requires the writer capability");
}

std::unique_ptr<Transaction> ReadOnlyRepository::Begin() {
  return inner_->Begin();
}

Result ReadOnlyRepository::MarkInitialized(Transaction&, std::int64_t) {
  return Denied("MarkInitialized");
}

bool ReadOnlyRepository::IsInitialized(Transaction& t) {
  return inner_->IsInitialized(t);
}

// ------------------------------------------------------------------
// Mirror
// ------------------------------------------------------------------

Result ReadOnlyRepository::InsertMirrorVersion(Transaction&, model::MirrorVersionRecord&) {
  return Denied("InsertMirrorVersion");
}

std::optional<model::MirrorVersionRecord> ReadOnlyRepository::GetMirrorVersion(Transaction& t, const std::string& dataset_id,
                                                                               const std::string& version) {
  return inner_->GetMirrorVersion(t, dataset_id, version);
}

std::optional<model::MirrorVersionRecord> ReadOnlyRepository::GetLatestMirrorVersion(Transaction& t, const std::string& dataset_id) {
  return inner_->GetLatestMirrorVersion(t, dataset_id);
}

std::vector<model::MirrorVersionRecord> ReadOnlyRepository::ListMirrorVersions(Transaction& t, const std::string& dataset_id, std::size_t limit) {
  return inner_->ListMirrorVersions(t, dataset_id, limit);
}

Result ReadOnlyRepository::InsertGlobalRows(Transaction&, const std::string&, const std::string&, const std::vector<std::string>&) {
  return Denied("InsertGlobalRows");
}

std::vector<model::GlobalRowRecord> ReadOnlyRepository::ReadGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version,
                                                                       std::uint64_t after_id, std::size_t limit) {
  return inner_->ReadGlobalRows(t, dataset_id, version, after_id, limit);
}

std::uint64_t ReadOnlyRepository::CountGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version) {
  return inner_->CountGlobalRows(t, dataset_id, version);
}

// ------------------------------------------------------------------
// Contexts and views
// ------------------------------------------------------------------

Result ReadOnlyRepository::UpsertUserContext(Transaction&, const model::UserContextRecord&) {
  return Denied("UpsertUserContext");
}

std::optional<model::UserContextRecord> ReadOnlyRepository::GetUserContext(Transaction& t, const std::string& user_id,
                                                                           const std::string& dataset_id) {
  return inner_->GetUserContext(t, user_id, dataset_id);
}

Result ReadOnlyRepository::AppendUserViews(Transaction&, std::vector<model::UserViewRecord>&) {
  return Denied("AppendUserViews");
}

std::vector<model::UserViewRecord> ReadOnlyRepository::ReadUserViews(Transaction& t, const model::UserViewQuery& query) {
  return inner_->ReadUserViews(t, query);
}

// ------------------------------------------------------------------
// Catalog
// ------------------------------------------------------------------

Result ReadOnlyRepository::InsertUserTable(Transaction&, model::UserTableRecord&) {
  return Denied("InsertUserTable");
}

std::optional<model::UserTableRecord> ReadOnlyRepository::GetUserTable(Transaction& t, const std::string& user_id, const std::string& table_name) {
  return inner_->GetUserTable(t, user_id, table_name);
}

std::vector<model::UserTableRecord> ReadOnlyRepository::ListUserTables(Transaction& t, const std::string& user_id) {
  return inner_->ListUserTables(t, user_id);
}

Result ReadOnlyRepository::DeleteUserTable(Transaction&, const std::string&, const std::string&) {
  return Denied("DeleteUserTable");
}

Result ReadOnlyRepository::InsertUserTableIndex(Transaction&, model::UserTableIndexRecord&) {
  return Denied("InsertUserTableIndex");
}

Result ReadOnlyRepository::UpdateUserTableIndexState(Transaction&, const std::string&, const std::string&, const std::string&, model::IndexState) {
  return Denied("UpdateUserTableIndexState");
}

std::vector<model::UserTableIndexRecord> ReadOnlyRepository::ListUserTableIndexes(Transaction& t, const std::string& user_id,
                                                                                  const std::string& table_name) {
  return inner_->ListUserTableIndexes(t, user_id, table_name);
}

Result ReadOnlyRepository::DeleteUserTableIndex(Transaction&, const std::string&, const std::string&, const std::string&) {
  return Denied("DeleteUserTableIndex");
}

// ------------------------------------------------------------------
// Documents and index tables
// ------------------------------------------------------------------

Result ReadOnlyRepository::CreateDocumentTable(Transaction&, const std::string&) {
  return Denied("CreateDocumentTable");
}

Result ReadOnlyRepository::DropDocumentTable(Transaction&, const std::string&) {
  return Denied("DropDocumentTable");
}

std::optional<model::DocumentRecord> ReadOnlyRepository::GetDocument(Transaction& t, const std::string& phy_table, const std::string& pk) {
  return inner_->GetDocument(t, phy_table, pk);
}

Result ReadOnlyRepository::PutDocument(Transaction&, const std::string&, const model::DocumentRecord&, model::DocumentWriteMode) {
  return Denied("PutDocument");
}

Result ReadOnlyRepository::DeleteDocument(Transaction&, const std::string&, const std::string&) {
  return Denied("DeleteDocument");
}

std::vector<model::DocumentRecord> ReadOnlyRepository::ScanDocuments(Transaction& t, const std::string& phy_table, const model::DocumentScan& scan) {
  return inner_->ScanDocuments(t, phy_table, scan);
}

Result ReadOnlyRepository::CreateIndexTable(Transaction&, const std::string&, const std::string&, model::ColumnType) {
  return Denied("CreateIndexTable");
}

Result ReadOnlyRepository::DropIndexTable(Transaction&, const std::string&, const std::string&) {
  return Denied("DropIndexTable");
}

Result ReadOnlyRepository::PutIndexEntry(Transaction&, const std::string&, const std::string&, const model::IndexEntryRecord&) {
  return Denied("PutIndexEntry");
}

Result ReadOnlyRepository::DeleteIndexEntry(Transaction&, const std::string&, const std::string&, const std::string&) {
  return Denied("DeleteIndexEntry");
}

std::vector<std::string> ReadOnlyRepository::FindIndexEntries(Transaction& t, const std::string& phy_table, const std::string& col_name,
                                                              const model::IndexLookup& lookup) {
  return inner_->FindIndexEntries(t, phy_table, col_name, lookup);
}

std::uint64_t ReadOnlyRepository::CountIndexEntries(Transaction& t, const std::string& phy_table, const std::string& col_name) {
  return inner_->CountIndexEntries(t, phy_table, col_name);
}

} // namespace edgestore::db::guard
