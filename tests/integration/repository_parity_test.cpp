#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/json.hpp"

namespace {

using edgestore::db::ErrorCode;
using edgestore::db::Repository;
namespace model = edgestore::db::model;

std::int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// postgres stores jsonb, which does not keep the original text
bool SameJson(const std::string& stored, const std::string& expected) {
  return edgestore::util::ToJson(edgestore::util::ParseJson(stored)) == edgestore::util::ToJson(edgestore::util::ParseJson(expected));
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<bool()>                             supports_nul_text;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void VerifyReadinessMarker(Repository& repo) {
  // BuildRepository writes the marker; writing it again is harmless
  auto tx = repo.Begin();
  assert(repo.IsInitialized(*tx));
  assert(repo.MarkInitialized(*tx, NowMs()));
  assert(repo.IsInitialized(*tx));
  tx->Commit();
}

void VerifyMirrorVersions(Repository& repo, const std::string& dataset) {
  {
    auto tx = repo.Begin();

    model::MirrorVersionRecord v1{0, dataset, "v1", "c1", 100};
    assert(repo.InsertMirrorVersion(*tx, v1));
    assert(v1.id != 0);
    assert(repo.InsertGlobalRows(*tx, dataset, "v1", {R"({"sku":"A1"})", R"({"sku":"A2"})", R"({"sku":"A3"})"}));

    model::MirrorVersionRecord again{0, dataset, "v1", "other", 100};
    assert(repo.InsertMirrorVersion(*tx, again).code == ErrorCode::AlreadyExists);

    // equal ts: the later insert is the latest
    model::MirrorVersionRecord v2{0, dataset, "v2", "c2", 100};
    assert(repo.InsertMirrorVersion(*tx, v2));
    assert(v2.id > v1.id);
    tx->Commit();
  }

  auto tx = repo.Begin();
  auto latest = repo.GetLatestMirrorVersion(*tx, dataset);
  assert(latest.has_value());
  assert(latest->version == "v2");

  const auto listed = repo.ListMirrorVersions(*tx, dataset, 0);
  assert(listed.size() == 2);
  assert(listed[0].version == "v2");
  assert(listed[1].version == "v1");
  assert(repo.ListMirrorVersions(*tx, dataset, 1).size() == 1);

  auto v1 = repo.GetMirrorVersion(*tx, dataset, "v1");
  assert(v1.has_value());
  assert(v1->checksum == "c1");
  assert(!repo.GetMirrorVersion(*tx, dataset, "v9").has_value());

  assert(repo.CountGlobalRows(*tx, dataset, "v1") == 3);
  assert(repo.CountGlobalRows(*tx, dataset, "v2") == 0);

  const auto first = repo.ReadGlobalRows(*tx, dataset, "v1", 0, 2);
  assert(first.size() == 2);
  assert(SameJson(first[0].item, R"({"sku":"A1"})"));
  assert(SameJson(first[1].item, R"({"sku":"A2"})"));
  const auto rest = repo.ReadGlobalRows(*tx, dataset, "v1", first.back().id, 2);
  assert(rest.size() == 1);
  assert(SameJson(rest[0].item, R"({"sku":"A3"})"));
  tx->Commit();
}

void VerifyContextsAndViews(Repository& repo, const std::string& user) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertUserContext(*tx, model::UserContextRecord{0, user, "catalog", R"({"region":"EU"})", 10}));
    assert(repo.UpsertUserContext(*tx, model::UserContextRecord{0, user, "catalog", R"({"region":"US"})", 5}));

    std::vector<model::UserViewRecord> views;
    views.push_back(model::UserViewRecord{0, user, "catalog", "v1", R"({"sku":"A1"})", 100});
    views.push_back(model::UserViewRecord{0, user, "catalog", "v1", R"({"sku":"A2"})", 100});
    views.push_back(model::UserViewRecord{0, user, "catalog", "v2", R"({"sku":"B1"})", 200});
    assert(repo.AppendUserViews(*tx, views));
    assert(views[0].id < views[1].id && views[1].id < views[2].id);
    tx->Commit();
  }

  auto tx = repo.Begin();
  auto ctx = repo.GetUserContext(*tx, user, "catalog");
  assert(ctx.has_value());
  assert(ctx->ts == 5);
  assert(!repo.GetUserContext(*tx, user, "prices").has_value());

  model::UserViewQuery all;
  all.user_id    = user;
  all.dataset_id = "catalog";
  assert(repo.ReadUserViews(*tx, all).size() == 3);

  model::UserViewQuery v1 = all;
  v1.version              = "v1";
  v1.limit                = 1;
  const auto page         = repo.ReadUserViews(*tx, v1);
  assert(page.size() == 1);
  v1.after_id = page[0].id;
  const auto next = repo.ReadUserViews(*tx, v1);
  assert(next.size() == 1);
  assert(SameJson(next[0].item, R"({"sku":"A2"})"));

  model::UserViewQuery recent = all;
  recent.since_ts             = 150;
  const auto newer            = repo.ReadUserViews(*tx, recent);
  assert(newer.size() == 1);
  assert(newer[0].version == "v2");
  tx->Commit();
}

void VerifyUserDbDocuments(Repository& repo, const std::string& user, const std::string& phy) {
  {
    auto tx = repo.Begin();

    model::UserTableRecord table;
    table.user_id    = user;
    table.table_name = "orders";
    table.phy_table  = phy;
    table.pk_path    = "$.id";
    table.ts_path    = "$.updated_at";
    table.created_at = NowMs();
    assert(repo.InsertUserTable(*tx, table));
    assert(repo.CreateDocumentTable(*tx, phy));

    model::UserTableRecord clash = table;
    clash.table_name             = "orders_copy";
    assert(repo.InsertUserTable(*tx, clash).code == ErrorCode::AlreadyExists);

    model::UserTableIndexRecord index;
    index.user_id    = user;
    index.table_name = "orders";
    index.col_name   = "amount";
    index.json_path  = "$.amount";
    index.col_type   = model::ColumnType::kNumber;
    index.state      = model::IndexState::kBuilding;
    assert(repo.InsertUserTableIndex(*tx, index));
    assert(repo.InsertUserTableIndex(*tx, index).code == ErrorCode::AlreadyExists);
    assert(repo.CreateIndexTable(*tx, phy, "amount", model::ColumnType::kNumber));
    assert(repo.UpdateUserTableIndexState(*tx, user, "orders", "amount", model::IndexState::kReady));

    const auto ifnewer = model::DocumentWriteMode::kIfNewer;
    assert(repo.PutDocument(*tx, phy, {"b", R"({"id":"b","amount":2})", 20}, ifnewer));
    assert(repo.PutDocument(*tx, phy, {"a", R"({"id":"a","amount":1})", 30}, ifnewer));
    assert(repo.PutDocument(*tx, phy, {"c", R"({"id":"c","amount":3})", 10}, ifnewer));
    assert(repo.PutDocument(*tx, phy, {"a", R"({"id":"a","amount":9})", 30}, ifnewer).code == ErrorCode::Conflict);
    assert(repo.PutDocument(*tx, phy, {"c", R"({"id":"c","amount":3})", 5}, model::DocumentWriteMode::kReplace));

    assert(repo.PutIndexEntry(*tx, phy, "amount", {"a", 1.0}));
    assert(repo.PutIndexEntry(*tx, phy, "amount", {"b", 2.0}));
    assert(repo.PutIndexEntry(*tx, phy, "amount", {"c", 7.0}));
    assert(repo.PutIndexEntry(*tx, phy, "amount", {"c", 3.0}));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto a  = repo.GetDocument(*tx, phy, "a");
    assert(a.has_value());
    assert(SameJson(a->item, R"({"id":"a","amount":1})"));
    assert(repo.GetDocument(*tx, phy, "c")->updated_at == 5);

    model::DocumentScan by_pk;
    const auto          all = repo.ScanDocuments(*tx, phy, by_pk);
    assert(all.size() == 3);
    assert(all[0].pk == "a" && all[1].pk == "b" && all[2].pk == "c");

    by_pk.after_pk = "a";
    by_pk.limit    = 1;
    const auto after = repo.ScanDocuments(*tx, phy, by_pk);
    assert(after.size() == 1 && after[0].pk == "b");

    model::DocumentScan newest;
    newest.order         = model::DocumentOrder::kUpdatedDesc;
    newest.updated_since = 20;
    const auto recent    = repo.ScanDocuments(*tx, phy, newest);
    assert(recent.size() == 2);
    assert(recent[0].pk == "a" && recent[1].pk == "b");

    assert(repo.CountIndexEntries(*tx, phy, "amount") == 3);

    model::IndexLookup gt;
    gt.op       = model::CompareOp::kGt;
    gt.operands = {1.0};
    assert((repo.FindIndexEntries(*tx, phy, "amount", gt) == std::vector<std::string>{"b", "c"}));

    model::IndexLookup in;
    in.op       = model::CompareOp::kIn;
    in.operands = {3.0, 1.0, 42.0};
    assert((repo.FindIndexEntries(*tx, phy, "amount", in) == std::vector<std::string>{"a", "c"}));

    const auto indexes = repo.ListUserTableIndexes(*tx, user, "orders");
    assert(indexes.size() == 1);
    assert(indexes[0].state == model::IndexState::kReady);
    assert(indexes[0].col_type == model::ColumnType::kNumber);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteDocument(*tx, phy, "b"));
    assert(repo.DeleteDocument(*tx, phy, "b").code == ErrorCode::NotFound);
    assert(repo.DeleteIndexEntry(*tx, phy, "amount", "b"));
    assert(repo.CountIndexEntries(*tx, phy, "amount") == 2);

    assert(repo.DropIndexTable(*tx, phy, "amount"));
    assert(repo.DeleteUserTableIndex(*tx, user, "orders", "amount"));
    assert(repo.DropDocumentTable(*tx, phy));
    assert(repo.DeleteUserTable(*tx, user, "orders"));
    assert(repo.DeleteUserTable(*tx, user, "orders").code == ErrorCode::NotFound);
    assert(!repo.GetUserTable(*tx, user, "orders").has_value());
    assert(repo.ListUserTables(*tx, user).empty());
    tx->Commit();
  }
}

void VerifyEmbeddedNulKeys(BackendFactory& backend, Repository& repo, const std::string& phy) {
  using namespace std::string_literals;
  const auto pk_x = "a\0x"s;
  const auto pk_y = "a\0y"s;
  const auto ifnewer = model::DocumentWriteMode::kIfNewer;

  auto tx = repo.Begin();
  assert(repo.CreateDocumentTable(*tx, phy));
  assert(repo.CreateIndexTable(*tx, phy, "tag", model::ColumnType::kString));

  if (!backend.supports_nul_text()) {
    assert(repo.PutDocument(*tx, phy, {pk_x, R"({"id":"a\u0000x"})", 1}, ifnewer).code == ErrorCode::Unsupported);
    assert(repo.PutIndexEntry(*tx, phy, "tag", {"k", pk_x}).code == ErrorCode::Unsupported);
    tx->Rollback();
    return;
  }

  assert(repo.PutDocument(*tx, phy, {pk_x, R"({"id":"a\u0000x"})", 1}, ifnewer));
  assert(repo.PutDocument(*tx, phy, {pk_y, R"({"id":"a\u0000y"})", 1}, ifnewer));
  assert(repo.PutIndexEntry(*tx, phy, "tag", {pk_x, "t\0one"s}));
  assert(repo.PutIndexEntry(*tx, phy, "tag", {pk_y, "t\0two"s}));

  model::DocumentScan all;
  const auto          docs = repo.ScanDocuments(*tx, phy, all);
  assert(docs.size() == 2);
  assert(docs[0].pk == pk_x && docs[1].pk == pk_y);
  assert(repo.GetDocument(*tx, phy, pk_y)->pk.size() == 3);

  model::DocumentScan after;
  after.after_pk   = pk_x;
  const auto tail  = repo.ScanDocuments(*tx, phy, after);
  assert(tail.size() == 1 && tail[0].pk == pk_y);

  model::IndexLookup eq;
  eq.op       = model::CompareOp::kEq;
  eq.operands = {"t\0two"s};
  assert((repo.FindIndexEntries(*tx, phy, "tag", eq) == std::vector<std::string>{pk_y}));

  assert(repo.DropIndexTable(*tx, phy, "tag"));
  assert(repo.DropDocumentTable(*tx, phy));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& dataset) {
  {
    auto                       tx = repo.Begin();
    model::MirrorVersionRecord version{0, dataset, "v1", "c1", 1};
    assert(repo.InsertMirrorVersion(*tx, version));
    assert(repo.InsertGlobalRows(*tx, dataset, "v1", {"{}"}));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetMirrorVersion(*check_tx, dataset, "v1").has_value());
  assert(repo.CountGlobalRows(*check_tx, dataset, "v1") == 0);
  check_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& dataset) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto                       tx = repo->Begin();
    model::MirrorVersionRecord version{0, dataset, "v1", "c1", 7};
    assert(repo->InsertMirrorVersion(*tx, version));
    assert(repo->InsertGlobalRows(*tx, dataset, "v1", {R"({"k":"v"})"}));
    assert(repo->UpsertUserContext(*tx, model::UserContextRecord{0, "u-restart", dataset, R"({"a":1})", 3}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto latest = repo->GetLatestMirrorVersion(*tx, dataset);
  assert(latest.has_value());
  assert(latest->version == "v1");
  const auto rows = repo->ReadGlobalRows(*tx, dataset, "v1", 0, 0);
  assert(rows.size() == 1);
  assert(SameJson(rows[0].item, R"({"k":"v"})"));
  assert(repo->GetUserContext(*tx, "u-restart", dataset)->ts == 3);
  assert(repo->IsInitialized(*tx));
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return edgestore::factory::BuildRepository(edgestore::runtime::config::RuntimeConfig{}); },
      .supports_restart = []() { return false; },
      .supports_nul_text = []() { return true; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if EDGESTORE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("edgestore_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    edgestore::runtime::config::RuntimeConfig config;
    auto*                                     sqlite = config.mutable_database()->mutable_sqlite();
    sqlite->set_path(db_path);
    sqlite->set_wal_mode(true);
    sqlite->set_busy_timeout_ms(2000);
    return edgestore::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .supports_nul_text = []() { return true; },
      .restart =
          [make_repo](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = make_repo();
          },
      .cleanup =
          [db_path]() {
            std::error_code ec;
            std::filesystem::remove(db_path, ec);
            std::filesystem::remove(db_path + "-wal", ec);
            std::filesystem::remove(db_path + "-shm", ec);
          },
  };
}
#endif

#if EDGESTORE_DB_POSTGRES
std::optional<BackendFactory> MakePostgresFactory() {
  const char* uri = std::getenv("EDGESTORE_TEST_POSTGRES_URI");
  if (!uri || std::string(uri).empty()) {
    return std::nullopt;
  }

  auto make_repo = [conn = std::string(uri)]() {
    edgestore::runtime::config::RuntimeConfig config;
    auto*                                     postgres = config.mutable_database()->mutable_postgres();
    postgres->set_connection_uri(conn);
    postgres->set_max_connections(2);
    return edgestore::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .supports_nul_text = []() { return false; },
      .restart =
          [make_repo](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = make_repo();
          },
      .cleanup = []() {},
  };
}
#endif

void RunBackend(BackendFactory& backend) {
  // unique names so a shared database can be reused between runs
  const auto suffix = std::to_string(NowMs());
  auto       repo   = backend.make_repository();

  VerifyReadinessMarker(*repo);
  VerifyMirrorVersions(*repo, "ds_" + backend.name + "_" + suffix);
  VerifyContextsAndViews(*repo, "user_" + backend.name + "_" + suffix);
  VerifyUserDbDocuments(*repo, "user_" + backend.name + "_" + suffix, "t_" + backend.name + "_" + suffix);
  VerifyRollbackBehavior(*repo, "rollback_" + backend.name + "_" + suffix);
  VerifyEmbeddedNulKeys(backend, *repo, "nul_" + backend.name + "_" + suffix);

  repo.reset();
  VerifyRestartDurability(backend, "restart_" + backend.name + "_" + suffix);

  std::cout << "edgestore_integration_repository_parity[" << backend.name << "]: pass\n";
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if EDGESTORE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if EDGESTORE_DB_POSTGRES
  if (auto postgres = MakePostgresFactory()) {
    backends.push_back(*postgres);
  }
#endif

  for (auto& backend : backends) {
    RunBackend(backend);
  }
  return 0;
}
