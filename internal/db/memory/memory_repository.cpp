#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace edgestore::db::memory {

namespace {

std::string IndexTableKey(const std::string& phy_table, const std::string& col_name) {
  return phy_table + "#" + col_name;
}

bool Before(const model::MirrorVersionRecord& a, const model::MirrorVersionRecord& b) {
  if (a.ts != b.ts) return a.ts < b.ts;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

void MemoryRepository::TakeSection(State& dst, State& src, Section section) {
  switch (section) {
    case Section::kReadiness:
      dst.initialized    = src.initialized;
      dst.initialized_at = src.initialized_at;
      return;
    case Section::kMirror:
      dst.versions        = std::move(src.versions);
      dst.rows            = std::move(src.rows);
      dst.next_version_id = src.next_version_id;
      dst.next_row_id     = src.next_row_id;
      return;
    case Section::kContexts:
      dst.contexts        = std::move(src.contexts);
      dst.next_context_id = src.next_context_id;
      return;
    case Section::kViews:
      dst.views        = std::move(src.views);
      dst.next_view_id = src.next_view_id;
      return;
    case Section::kCatalog:
      dst.tables        = std::move(src.tables);
      dst.indexes       = std::move(src.indexes);
      dst.next_table_id = src.next_table_id;
      dst.next_index_id = src.next_index_id;
      return;
    case Section::kDocuments:
      dst.documents    = std::move(src.documents);
      dst.index_tables = std::move(src.index_tables);
      return;
  }
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------
// Readiness
// ---------------------------------------------------------------------

Result MemoryRepository::MarkInitialized(Transaction& t, std::int64_t completed_at_ms) {
  if (TX(t).View().initialized) return Result::Ok();
  auto& s          = TX(t).Mutable(Section::kReadiness);
  s.initialized    = true;
  s.initialized_at = completed_at_ms;
  return Result::Ok();
}

bool MemoryRepository::IsInitialized(Transaction& t) {
  return TX(t).View().initialized;
}

// ---------------------------------------------------------------------
// Mirror
// ---------------------------------------------------------------------

Result MemoryRepository::InsertMirrorVersion(Transaction& t, model::MirrorVersionRecord& r) {
  const Key2 key{r.dataset_id, r.version};
  if (TX(t).View().versions.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "dataset version exists");
  auto& s = TX(t).Mutable(Section::kMirror);
  r.id    = s.next_version_id++;
  s.versions.emplace(key, r);
  return Result::Ok();
}

std::optional<model::MirrorVersionRecord> MemoryRepository::GetMirrorVersion(Transaction& t, const std::string& dataset_id,
                                                                             const std::string& version) {
  const auto& s  = TX(t).View();
  auto        it = s.versions.find(Key2{dataset_id, version});
  if (it == s.versions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::MirrorVersionRecord> MemoryRepository::GetLatestMirrorVersion(Transaction& t, const std::string& dataset_id) {
  std::optional<model::MirrorVersionRecord> latest;
  for (const auto& [key, record] : TX(t).View().versions) {
    if (key.first != dataset_id) continue;
    if (!latest || Before(*latest, record)) latest = record;
  }
  return latest;
}

std::vector<model::MirrorVersionRecord> MemoryRepository::ListMirrorVersions(Transaction& t, const std::string& dataset_id, std::size_t limit) {
  std::vector<model::MirrorVersionRecord> out;
  for (const auto& [key, record] : TX(t).View().versions) {
    if (key.first == dataset_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return Before(b, a); });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

Result MemoryRepository::InsertGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version,
                                          const std::vector<std::string>& items) {
  auto& s    = TX(t).Mutable(Section::kMirror);
  auto& rows = s.rows[Key2{dataset_id, version}];
  for (const auto& item : items) {
    model::GlobalRowRecord row;
    row.id         = s.next_row_id++;
    row.dataset_id = dataset_id;
    row.version    = version;
    row.item       = item;
    rows.push_back(std::move(row));
  }
  return Result::Ok();
}

std::vector<model::GlobalRowRecord> MemoryRepository::ReadGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version,
                                                                     std::uint64_t after_id, std::size_t limit) {
  std::vector<model::GlobalRowRecord> out;
  const auto&                         s  = TX(t).View();
  auto                                it = s.rows.find(Key2{dataset_id, version});
  if (it == s.rows.end()) return out;

  for (const auto& row : it->second) {
    if (row.id <= after_id) continue;
    out.push_back(row);
    if (limit > 0 && out.size() >= limit) break;
  }
  return out;
}

std::uint64_t MemoryRepository::CountGlobalRows(Transaction& t, const std::string& dataset_id, const std::string& version) {
  const auto& s  = TX(t).View();
  auto        it = s.rows.find(Key2{dataset_id, version});
  return it == s.rows.end() ? 0 : it->second.size();
}

// ---------------------------------------------------------------------
// Contexts
// ---------------------------------------------------------------------

Result MemoryRepository::UpsertUserContext(Transaction& t, const model::UserContextRecord& r) {
  auto&      s   = TX(t).Mutable(Section::kContexts);
  const Key2 key{r.user_id, r.dataset_id};
  auto       it = s.contexts.find(key);
  if (it == s.contexts.end()) {
    auto stored = r;
    stored.id   = s.next_context_id++;
    s.contexts.emplace(key, std::move(stored));
    return Result::Ok();
  }
  it->second.ctx = r.ctx;
  it->second.ts  = r.ts;
  return Result::Ok();
}

std::optional<model::UserContextRecord> MemoryRepository::GetUserContext(Transaction& t, const std::string& user_id, const std::string& dataset_id) {
  const auto& s  = TX(t).View();
  auto        it = s.contexts.find(Key2{user_id, dataset_id});
  if (it == s.contexts.end()) return std::nullopt;
  return it->second;
}

// ---------------------------------------------------------------------
// View log
// ---------------------------------------------------------------------

Result MemoryRepository::AppendUserViews(Transaction& t, std::vector<model::UserViewRecord>& rows) {
  auto& s = TX(t).Mutable(Section::kViews);
  for (auto& row : rows) {
    row.id = s.next_view_id++;
    s.views.push_back(row);
  }
  return Result::Ok();
}

std::vector<model::UserViewRecord> MemoryRepository::ReadUserViews(Transaction& t, const model::UserViewQuery& q) {
  std::vector<model::UserViewRecord> out;
  for (const auto& row : TX(t).View().views) {
    if (row.id <= q.after_id || row.user_id != q.user_id || row.dataset_id != q.dataset_id) continue;
    if (!q.version.empty() && row.version != q.version) continue;
    if (row.ts < q.since_ts) continue;
    out.push_back(row);
    if (q.limit > 0 && out.size() >= q.limit) break;
  }
  return out;
}

// ---------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------

Result MemoryRepository::InsertUserTable(Transaction& t, model::UserTableRecord& r) {
  const auto& view = TX(t).View();
  const Key2  key{r.user_id, r.table_name};
  if (view.tables.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "table exists");
  for (const auto& [_, table] : view.tables) {
    if (table.phy_table == r.phy_table) return Result::Err(ErrorCode::AlreadyExists, "physical table in use");
  }
  auto& s = TX(t).Mutable(Section::kCatalog);
  r.id    = s.next_table_id++;
  s.tables.emplace(key, r);
  return Result::Ok();
}

std::optional<model::UserTableRecord> MemoryRepository::GetUserTable(Transaction& t, const std::string& user_id, const std::string& table_name) {
  const auto& s  = TX(t).View();
  auto        it = s.tables.find(Key2{user_id, table_name});
  if (it == s.tables.end()) return std::nullopt;
  return it->second;
}

std::vector<model::UserTableRecord> MemoryRepository::ListUserTables(Transaction& t, const std::string& user_id) {
  std::vector<model::UserTableRecord> out;
  for (const auto& [key, table] : TX(t).View().tables) {
    if (key.first == user_id) out.push_back(table);
  }
  return out;
}

Result MemoryRepository::DeleteUserTable(Transaction& t, const std::string& user_id, const std::string& table_name) {
  const Key2 key{user_id, table_name};
  if (!TX(t).View().tables.contains(key)) return Result::Err(ErrorCode::NotFound);
  auto& s = TX(t).Mutable(Section::kCatalog);
  s.tables.erase(key);
  for (auto it = s.indexes.begin(); it != s.indexes.end();) {
    if (std::get<0>(it->first) == user_id && std::get<1>(it->first) == table_name) {
      it = s.indexes.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

Result MemoryRepository::InsertUserTableIndex(Transaction& t, model::UserTableIndexRecord& r) {
  const auto& view = TX(t).View();
  if (!view.tables.contains(Key2{r.user_id, r.table_name})) return Result::Err(ErrorCode::ConstraintViolation, "table not registered");
  const Key3 key{r.user_id, r.table_name, r.col_name};
  if (view.indexes.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "index exists");
  auto& s = TX(t).Mutable(Section::kCatalog);
  r.id    = s.next_index_id++;
  s.indexes.emplace(key, r);
  return Result::Ok();
}

Result MemoryRepository::UpdateUserTableIndexState(Transaction& t, const std::string& user_id, const std::string& table_name,
                                                   const std::string& col_name, model::IndexState state) {
  const Key3 key{user_id, table_name, col_name};
  if (!TX(t).View().indexes.contains(key)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable(Section::kCatalog).indexes.at(key).state = state;
  return Result::Ok();
}

std::vector<model::UserTableIndexRecord> MemoryRepository::ListUserTableIndexes(Transaction& t, const std::string& user_id,
                                                                                const std::string& table_name) {
  std::vector<model::UserTableIndexRecord> out;
  for (const auto& [key, index] : TX(t).View().indexes) {
    if (std::get<0>(key) == user_id && std::get<1>(key) == table_name) out.push_back(index);
  }
  return out;
}

Result MemoryRepository::DeleteUserTableIndex(Transaction& t, const std::string& user_id, const std::string& table_name,
                                              const std::string& col_name) {
  const Key3 key{user_id, table_name, col_name};
  if (!TX(t).View().indexes.contains(key)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable(Section::kCatalog).indexes.erase(key);
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Documents
// ---------------------------------------------------------------------

Result MemoryRepository::CreateDocumentTable(Transaction& t, const std::string& phy_table) {
  if (TX(t).View().documents.contains(phy_table)) return Result::Ok();
  TX(t).Mutable(Section::kDocuments).documents.try_emplace(phy_table);
  return Result::Ok();
}

Result MemoryRepository::DropDocumentTable(Transaction& t, const std::string& phy_table) {
  if (!TX(t).View().documents.contains(phy_table)) return Result::Ok();
  TX(t).Mutable(Section::kDocuments).documents.erase(phy_table);
  return Result::Ok();
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocument(Transaction& t, const std::string& phy_table, const std::string& pk) {
  const auto& s     = TX(t).View();
  auto        table = s.documents.find(phy_table);
  if (table == s.documents.end()) return std::nullopt;
  auto it = table->second.find(pk);
  if (it == table->second.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::PutDocument(Transaction& t, const std::string& phy_table, const model::DocumentRecord& r, model::DocumentWriteMode mode) {
  const auto& view  = TX(t).View();
  auto        table = view.documents.find(phy_table);
  if (table == view.documents.end()) return Result::Err(ErrorCode::NotFound, "no such document table");

  if (mode == model::DocumentWriteMode::kIfNewer) {
    auto existing = table->second.find(r.pk);
    if (existing != table->second.end() && existing->second.updated_at >= r.updated_at) {
      return Result::Err(ErrorCode::Conflict, "stored document is newer");
    }
  }
  TX(t).Mutable(Section::kDocuments).documents[phy_table][r.pk] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteDocument(Transaction& t, const std::string& phy_table, const std::string& pk) {
  const auto& view  = TX(t).View();
  auto        table = view.documents.find(phy_table);
  if (table == view.documents.end() || !table->second.contains(pk)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable(Section::kDocuments).documents[phy_table].erase(pk);
  return Result::Ok();
}

std::vector<model::DocumentRecord> MemoryRepository::ScanDocuments(Transaction& t, const std::string& phy_table, const model::DocumentScan& scan) {
  std::vector<model::DocumentRecord> out;
  const auto&                        s     = TX(t).View();
  auto                               table = s.documents.find(phy_table);
  if (table == s.documents.end()) return out;

  const bool by_pk = scan.order == model::DocumentOrder::kByPk;
  auto       it    = by_pk && !scan.after_pk.empty() ? table->second.upper_bound(scan.after_pk) : table->second.begin();
  for (; it != table->second.end(); ++it) {
    if (scan.updated_since && it->second.updated_at < *scan.updated_since) continue;
    out.push_back(it->second);
    if (by_pk && scan.limit > 0 && out.size() >= scan.limit) return out;
  }
  if (by_pk) return out;

  const bool ascending = scan.order == model::DocumentOrder::kUpdatedAsc;
  std::stable_sort(out.begin(), out.end(), [ascending](const model::DocumentRecord& a, const model::DocumentRecord& b) {
    return ascending ? a.updated_at < b.updated_at : a.updated_at > b.updated_at;
  });
  if (scan.limit > 0 && out.size() > scan.limit) out.resize(scan.limit);
  return out;
}

// ---------------------------------------------------------------------
// Index tables
// ---------------------------------------------------------------------

Result MemoryRepository::CreateIndexTable(Transaction& t, const std::string& phy_table, const std::string& col_name, model::ColumnType type) {
  const auto key = IndexTableKey(phy_table, col_name);
  if (TX(t).View().index_tables.contains(key)) return Result::Ok();
  TX(t).Mutable(Section::kDocuments).index_tables[key].type = type;
  return Result::Ok();
}

Result MemoryRepository::DropIndexTable(Transaction& t, const std::string& phy_table, const std::string& col_name) {
  const auto key = IndexTableKey(phy_table, col_name);
  if (!TX(t).View().index_tables.contains(key)) return Result::Ok();
  TX(t).Mutable(Section::kDocuments).index_tables.erase(key);
  return Result::Ok();
}

Result MemoryRepository::PutIndexEntry(Transaction& t, const std::string& phy_table, const std::string& col_name, const model::IndexEntryRecord& e) {
  const auto key = IndexTableKey(phy_table, col_name);
  if (!TX(t).View().index_tables.contains(key)) return Result::Err(ErrorCode::NotFound, "no such index table");
  TX(t).Mutable(Section::kDocuments).index_tables[key].by_pk[e.pk] = e.value;
  return Result::Ok();
}

Result MemoryRepository::DeleteIndexEntry(Transaction& t, const std::string& phy_table, const std::string& col_name, const std::string& pk) {
  const auto& view = TX(t).View();
  const auto  key  = IndexTableKey(phy_table, col_name);
  auto        it   = view.index_tables.find(key);
  if (it == view.index_tables.end() || !it->second.by_pk.contains(pk)) return Result::Ok();
  TX(t).Mutable(Section::kDocuments).index_tables[key].by_pk.erase(pk);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::FindIndexEntries(Transaction& t, const std::string& phy_table, const std::string& col_name,
                                                             const model::IndexLookup& lookup) {
  std::vector<std::string> out;
  const auto&              s  = TX(t).View();
  auto                     it = s.index_tables.find(IndexTableKey(phy_table, col_name));
  if (it == s.index_tables.end()) return out;

  for (const auto& [pk, value] : it->second.by_pk) {
    if (model::MatchesLookup(value, lookup)) out.push_back(pk);
  }
  return out;
}

std::uint64_t MemoryRepository::CountIndexEntries(Transaction& t, const std::string& phy_table, const std::string& col_name) {
  const auto& s  = TX(t).View();
  auto        it = s.index_tables.find(IndexTableKey(phy_table, col_name));
  return it == s.index_tables.end() ? 0 : it->second.by_pk.size();
}

} // namespace edgestore::db::memory
