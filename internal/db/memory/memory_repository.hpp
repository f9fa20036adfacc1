#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace edgestore::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // Unit of conflict detection: concurrent writers of the same section
  // conflict, writers of disjoint sections both commit.
  enum class Section : std::size_t { kReadiness, kMirror, kContexts, kViews, kCatalog, kDocuments };
  static constexpr std::size_t kSectionCount = 6;
  using SectionVersions                      = std::array<std::uint64_t, kSectionCount>;

  using Key2 = std::pair<std::string, std::string>;
  using Key3 = std::tuple<std::string, std::string, std::string>;

  struct IndexTable {
    model::ColumnType                          type = model::ColumnType::kString;
    std::map<std::string, model::IndexValue>   by_pk;
  };

  struct State {
    bool         initialized     = false;
    std::int64_t initialized_at  = 0;

    std::map<Key2, model::MirrorVersionRecord>          versions;
    std::map<Key2, std::vector<model::GlobalRowRecord>> rows;
    std::map<Key2, model::UserContextRecord>            contexts;
    std::vector<model::UserViewRecord>                  views;

    std::map<Key2, model::UserTableRecord>      tables;
    std::map<Key3, model::UserTableIndexRecord> indexes;

    // phy_table -> pk -> document
    std::unordered_map<std::string, std::map<std::string, model::DocumentRecord>> documents;
    // phy_table#col_name -> entries
    std::unordered_map<std::string, IndexTable> index_tables;

    std::uint64_t next_version_id = 1;
    std::uint64_t next_row_id     = 1;
    std::uint64_t next_context_id = 1;
    std::uint64_t next_view_id    = 1;
    std::uint64_t next_table_id   = 1;
    std::uint64_t next_index_id   = 1;
  };

  // Moves the fields owned by one section.
  static void TakeSection(State& dst, State& src, Section section);

  std::mutex      mutex_;
  State           committed_;
  SectionVersions section_versions_{};
};

} // namespace edgestore::db::memory
