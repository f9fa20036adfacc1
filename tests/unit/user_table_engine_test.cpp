#include <cassert>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/readiness.hpp"
#include "internal/service/service_context.hpp"
#include "internal/userdb/table_lock_registry.hpp"
#include "internal/userdb/user_table_engine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using edgestore::db::model::ColumnType;
using edgestore::db::model::CompareOp;
using edgestore::db::model::DocumentOrder;
using edgestore::db::model::IndexState;
using edgestore::userdb::IndexSpec;
using edgestore::userdb::ListOptions;
using edgestore::userdb::Predicate;
using edgestore::userdb::StoredDocument;
using edgestore::userdb::TableSpec;
using edgestore::userdb::UpsertOptions;
using edgestore::userdb::UserTableEngine;
using edgestore::userdb::WriteMode;
using edgestore::util::ErrorKind;
using edgestore::util::Json;
using edgestore::util::ParseJson;
using edgestore::util::ToJson;

struct Harness {
  std::shared_ptr<edgestore::db::memory::MemoryRepository> repo  = std::make_shared<edgestore::db::memory::MemoryRepository>();
  std::shared_ptr<edgestore::userdb::TableLockRegistry>    locks = std::make_shared<edgestore::userdb::TableLockRegistry>();
  edgestore::runtime::config::RuntimeConfig                config = edgestore::config::ConfigLoader::LoadFromString("");
  std::int64_t                                             now    = 1000;

  Harness() {
    auto       tx     = repo->Begin();
    const auto marked = repo->MarkInitialized(*tx, 1);
    assert(marked);
    tx->Commit();
  }

  UserTableEngine Engine() {
    edgestore::service::ServiceContext ctx;
    ctx.repository = repo;
    ctx.readiness  = std::make_shared<edgestore::service::ReadinessGate>(repo);
    ctx.config     = config;
    ctx.now_ms     = [this] { return now; };
    return UserTableEngine(ctx, locks);
  }
};

ErrorKind KindOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const edgestore::util::Error& ex) {
    return ex.Kind();
  }
  assert(false && "expected an error");
  return ErrorKind::kInvalidArgument;
}

TableSpec Orders() {
  return TableSpec{"u1", "orders", "t_u1_orders", "$.id", "$.updated_at"};
}

Predicate Eq(const char* json) {
  return Predicate{CompareOp::kEq, {ParseJson(json)}};
}

std::vector<std::string> Pks(const std::vector<StoredDocument>& docs) {
  std::vector<std::string> out;
  for (const auto& doc : docs) {
    out.push_back(doc.pk);
  }
  return out;
}

void TestIndexedQuery() {
  Harness h;
  auto    engine = h.Engine();

  const auto table = engine.CreateTable(Orders());
  assert(table.phy_table == "t_u1_orders");

  const auto upserted = engine.Upsert("u1", "orders", ParseJson(R"({"id":"o1","updated_at":5,"status":"open"})"));
  assert(upserted.pk == "o1");
  assert(upserted.ts == 5);

  const auto built = engine.CreateIndex("u1", "orders", IndexSpec{"status", "$.status", ColumnType::kString});
  assert(built.indexed == 1);
  assert(!built.resumed);

  const auto result = engine.Query("u1", "orders", "status", Eq(R"("open")"));
  assert(result.plan.indexed);
  assert(result.plan.index_column == "status");
  assert(result.documents.size() == 1);
  assert(result.documents[0].pk == "o1");
  assert(result.documents[0].updated_at == 5);
}

void TestStaleWriteIsRejected() {
  Harness h;
  auto    engine = h.Engine();
  engine.CreateTable(Orders());
  engine.CreateIndex("u1", "orders", IndexSpec{"status", "$.status", ColumnType::kString});
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"o1","updated_at":5,"status":"open"})"));

  assert(KindOf([&] { engine.Upsert("u1", "orders", ParseJson(R"({"id":"o1","updated_at":3,"status":"closed"})")); }) == ErrorKind::kStaleWrite);
  // equal ts is stale as well
  assert(KindOf([&] { engine.Upsert("u1", "orders", ParseJson(R"({"id":"o1","updated_at":5,"status":"closed"})")); }) == ErrorKind::kStaleWrite);

  const auto stored = engine.Get("u1", "orders", "o1");
  assert(stored.doc.struct_value().fields().at("status").string_value() == "open");
  assert(engine.Query("u1", "orders", "status", Eq(R"("closed")")).documents.empty());

  // force replaces regardless of ts and keeps the index in step
  UpsertOptions force;
  force.mode = WriteMode::kForce;
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"o1","updated_at":1,"status":"closed"})"), force);
  assert(engine.Get("u1", "orders", "o1").updated_at == 1);
  assert(engine.Query("u1", "orders", "status", Eq(R"("open")")).documents.empty());
  assert(Pks(engine.Query("u1", "orders", "status", Eq(R"("closed")")).documents) == std::vector<std::string>{"o1"});
}

void TestTimestampSources() {
  Harness h;
  auto    engine = h.Engine();
  engine.CreateTable(Orders());

  // absent ts falls back to the clock
  h.now = 777;
  assert(engine.Upsert("u1", "orders", ParseJson(R"({"id":"a"})")).ts == 777);

  // explicit client ts wins over the document field
  UpsertOptions client;
  client.client_ts = 900;
  assert(engine.Upsert("u1", "orders", ParseJson(R"({"id":"b","updated_at":5})"), client).ts == 900);

  // ISO-8601 in the document
  assert(engine.Upsert("u1", "orders", ParseJson(R"({"id":"c","updated_at":"1970-01-01T00:00:01Z"})")).ts == 1000);

  assert(KindOf([&] { engine.Upsert("u1", "orders", ParseJson(R"({"id":"d","updated_at":"yesterday"})")); }) == ErrorKind::kInvalidPath);
  assert(KindOf([&] { engine.Upsert("u1", "orders", ParseJson(R"({"updated_at":5})")); }) == ErrorKind::kInvalidPath);
  assert(KindOf([&] { engine.Upsert("u1", "orders", ParseJson("[1]")); }) == ErrorKind::kInvalidArgument);
}

void TestIndexAndScanAgree() {
  Harness h;
  auto    engine = h.Engine();
  engine.CreateTable(Orders());
  for (int i = 0; i < 12; ++i) {
    engine.Upsert("u1", "orders",
                  ParseJson("{\"id\":\"o" + std::to_string(10 + i) + "\",\"updated_at\":1,\"amount\":" + std::to_string(i % 5) + "}"));
  }
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"o99","updated_at":1})"));

  const std::vector<Predicate> predicates = {
      Eq("2"),
      Predicate{CompareOp::kLt, {ParseJson("2")}},
      Predicate{CompareOp::kLte, {ParseJson("2")}},
      Predicate{CompareOp::kGt, {ParseJson("3")}},
      Predicate{CompareOp::kGte, {ParseJson("3")}},
      Predicate{CompareOp::kIn, {ParseJson("0"), ParseJson("4"), ParseJson("7")}},
  };

  std::vector<std::vector<std::string>> scanned;
  for (const auto& predicate : predicates) {
    const auto result = engine.Query("u1", "orders", "amount", predicate);
    assert(!result.plan.indexed);
    assert(result.plan.scanned_documents == 13);
    scanned.push_back(Pks(result.documents));
  }

  const auto built = engine.CreateIndex("u1", "orders", IndexSpec{"amount", "$.amount", ColumnType::kNumber});
  assert(built.indexed == 12);

  for (std::size_t i = 0; i < predicates.size(); ++i) {
    const auto result = engine.Query("u1", "orders", "amount", predicates[i]);
    assert(result.plan.indexed);
    assert(Pks(result.documents) == scanned[i]);
  }
  assert(scanned[0] == (std::vector<std::string>{"o12", "o17"}));
}

void TestFailedBackfillResumes() {
  Harness h;
  auto    engine = h.Engine();
  engine.CreateTable(Orders());
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"a1","updated_at":1,"amount":1})"));
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"a2","updated_at":1,"amount":"two"})"));
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"a3","updated_at":1,"amount":3})"));

  const IndexSpec amount{"amount", "$.amount", ColumnType::kNumber};
  assert(KindOf([&] { engine.CreateIndex("u1", "orders", amount); }) == ErrorKind::kInvalidPath);

  // the entries written before the failure are kept, the index keeps building
  auto described = engine.DescribeTable("u1", "orders");
  assert(described.indexes.size() == 1);
  assert(described.indexes[0].index.state == IndexState::kBuilding);
  assert(described.indexes[0].entries == 1);

  // a building index never answers queries
  auto before = engine.Query("u1", "orders", "amount", Predicate{CompareOp::kGte, {ParseJson("1")}});
  assert(!before.plan.indexed);
  assert(Pks(before.documents) == (std::vector<std::string>{"a1", "a3"}));

  // a different definition under the same name is refused
  assert(KindOf([&] { engine.CreateIndex("u1", "orders", IndexSpec{"amount", "$.total", ColumnType::kNumber}); }) == ErrorKind::kAlreadyExists);

  engine.Upsert("u1", "orders", ParseJson(R"({"id":"a2","updated_at":2,"amount":2})"));
  const auto resumed = engine.CreateIndex("u1", "orders", amount);
  assert(resumed.resumed);
  assert(resumed.indexed == 3);

  auto after = engine.Query("u1", "orders", "amount", Predicate{CompareOp::kGt, {ParseJson("1")}});
  assert(after.plan.indexed);
  assert(Pks(after.documents) == (std::vector<std::string>{"a2", "a3"}));

  assert(KindOf([&] { engine.CreateIndex("u1", "orders", amount); }) == ErrorKind::kAlreadyExists);
}

void TestWritesRejectMismatchedIndexedValues() {
  Harness h;
  auto    engine = h.Engine();
  engine.CreateTable(Orders());
  engine.CreateIndex("u1", "orders", IndexSpec{"amount", "$.amount", ColumnType::kNumber});
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"a1","updated_at":1,"amount":1})"));

  assert(KindOf([&] { engine.Upsert("u1", "orders", ParseJson(R"({"id":"a1","updated_at":2,"amount":"x"})")); }) == ErrorKind::kInvalidPath);
  assert(engine.Get("u1", "orders", "a1").updated_at == 1);

  // removing the field removes the entry
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"a1","updated_at":3})"));
  assert(engine.DescribeTable("u1", "orders").indexes[0].entries == 0);
  assert(engine.Query("u1", "orders", "amount", Eq("1")).documents.empty());
}

void TestBatchReportsStaleRows() {
  Harness h;
  auto    engine = h.Engine();
  engine.CreateTable(Orders());
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"o1","updated_at":10})"));

  const auto results = engine.UpsertBatch("u1", "orders",
                                          {ParseJson(R"({"id":"o1","updated_at":9})"), ParseJson(R"({"id":"o2","updated_at":1})"),
                                           ParseJson(R"({"id":"o3","updated_at":1})")});
  assert(results.size() == 3);
  assert(results[0].pk == "o1" && results[0].stale);
  assert(!results[1].stale && !results[2].stale);
  assert(engine.Get("u1", "orders", "o1").updated_at == 10);

  // one invalid document rejects the whole batch
  assert(KindOf([&] {
           engine.UpsertBatch("u1", "orders", {ParseJson(R"({"id":"o4","updated_at":1})"), ParseJson(R"({"updated_at":1})")});
         }) == ErrorKind::kInvalidPath);
  assert(KindOf([&] { engine.Get("u1", "orders", "o4"); }) == ErrorKind::kNotFound);
}

void TestDeleteAndList() {
  Harness h;
  h.config.mutable_userdb()->set_default_list_limit(2);
  h.config.mutable_userdb()->set_max_list_limit(3);
  auto engine = h.Engine();
  engine.CreateTable(Orders());
  engine.CreateIndex("u1", "orders", IndexSpec{"status", "$.status", ColumnType::kString});

  engine.Upsert("u1", "orders", ParseJson(R"({"id":"a","updated_at":30,"status":"open"})"));
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"b","updated_at":10,"status":"open"})"));
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"c","updated_at":20,"status":"open"})"));
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"d","updated_at":40,"status":"open"})"));

  assert(Pks(engine.List("u1", "orders")) == (std::vector<std::string>{"a", "b"}));

  ListOptions all;
  all.limit = 50;
  assert(engine.List("u1", "orders", all).size() == 3);

  ListOptions page;
  page.limit    = 3;
  page.after_pk = "b";
  assert(Pks(engine.List("u1", "orders", page)) == (std::vector<std::string>{"c", "d"}));

  ListOptions newest;
  newest.limit = 3;
  newest.order = DocumentOrder::kUpdatedDesc;
  assert(Pks(engine.List("u1", "orders", newest)) == (std::vector<std::string>{"d", "a", "c"}));

  ListOptions since;
  since.limit = 3;
  since.since = 20;
  since.order = DocumentOrder::kUpdatedAsc;
  assert(Pks(engine.List("u1", "orders", since)) == (std::vector<std::string>{"c", "a", "d"}));

  assert(engine.Delete("u1", "orders", {"a", "zz", "c"}) == 2);
  assert(KindOf([&] { engine.Get("u1", "orders", "a"); }) == ErrorKind::kNotFound);
  assert(Pks(engine.Query("u1", "orders", "status", Eq(R"("open")")).documents) == (std::vector<std::string>{"b", "d"}));
  assert(engine.DescribeTable("u1", "orders").indexes[0].entries == 2);
}

void TestDropIndexAndTable() {
  Harness h;
  auto    engine = h.Engine();
  engine.CreateTable(Orders());
  engine.CreateIndex("u1", "orders", IndexSpec{"status", "$.status", ColumnType::kString});
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"o1","updated_at":1,"status":"open"})"));

  engine.DropIndex("u1", "orders", "status");
  assert(engine.DescribeTable("u1", "orders").indexes.empty());
  assert(!engine.Query("u1", "orders", "status", Eq(R"("open")")).plan.indexed);
  assert(KindOf([&] { engine.DropIndex("u1", "orders", "status"); }) == ErrorKind::kNotFound);

  engine.CreateIndex("u1", "orders", IndexSpec{"status", "$.status", ColumnType::kString});
  engine.DropTable("u1", "orders");

  {
    auto tx = h.repo->Begin();
    assert(!h.repo->GetUserTable(*tx, "u1", "orders"));
    assert(h.repo->ListUserTableIndexes(*tx, "u1", "orders").empty());
    assert(h.repo->ScanDocuments(*tx, "t_u1_orders", {}).empty());
    assert(h.repo->CountIndexEntries(*tx, "t_u1_orders", "status") == 0);
  }
  assert(KindOf([&] { engine.Get("u1", "orders", "o1"); }) == ErrorKind::kNotFound);
  assert(KindOf([&] { engine.DropTable("u1", "orders"); }) == ErrorKind::kNotFound);

  // the name is free again and starts empty
  engine.CreateTable(Orders());
  assert(engine.List("u1", "orders").empty());
}

void TestCatalogValidation() {
  Harness h;
  h.config.mutable_userdb()->set_max_indexes_per_table(2);
  auto engine = h.Engine();

  const auto derived = engine.CreateTable(TableSpec{"u1", "notes", "", "$.id", ""});
  assert(derived.phy_table.rfind("udb_", 0) == 0);
  assert(derived.ts_path == "$.updated_at");

  engine.CreateTable(Orders());
  assert(KindOf([&] { engine.CreateTable(Orders()); }) == ErrorKind::kAlreadyExists);
  // same physical name under another logical table
  assert(KindOf([&] { engine.CreateTable(TableSpec{"u2", "orders", "t_u1_orders", "$.id", ""}); }) == ErrorKind::kAlreadyExists);
  assert(KindOf([&] { engine.CreateTable(TableSpec{"u1", "bad", "drop table;", "$.id", ""}); }) == ErrorKind::kInvalidArgument);
  assert(KindOf([&] { engine.CreateTable(TableSpec{"u1", "sys", "userdb_tables", "$.id", ""}); }) == ErrorKind::kInvalidArgument);
  assert(KindOf([&] { engine.CreateTable(TableSpec{"u1", "root", "", "$", ""}); }) == ErrorKind::kInvalidPath);
  assert(KindOf([&] { engine.CreateTable(TableSpec{"u1", "broken", "", "$.[", ""}); }) == ErrorKind::kInvalidPath);

  assert(KindOf([&] { engine.CreateIndex("u1", "orders", IndexSpec{"bad-name", "$.x", ColumnType::kString}); }) == ErrorKind::kInvalidArgument);
  assert(KindOf([&] { engine.CreateIndex("u1", "missing", IndexSpec{"x", "$.x", ColumnType::kString}); }) == ErrorKind::kNotFound);

  engine.CreateIndex("u1", "orders", IndexSpec{"a", "$.a", ColumnType::kString});
  engine.CreateIndex("u1", "orders", IndexSpec{"b", "$.b", ColumnType::kBoolean});
  assert(KindOf([&] { engine.CreateIndex("u1", "orders", IndexSpec{"c", "$.c", ColumnType::kInteger}); }) == ErrorKind::kInvalidArgument);

  const auto tables = engine.ListTables("u1");
  assert(tables.size() == 2);
  assert(tables[0].table_name == "notes");
  assert(tables[1].table_name == "orders");
  assert(engine.ListTables("u2").empty());

  assert(KindOf([&] { engine.Query("u1", "orders", "a", Predicate{CompareOp::kEq, {}}); }) == ErrorKind::kInvalidArgument);
  assert(KindOf([&] { engine.Query("u1", "orders", "a", Predicate{CompareOp::kEq, {ParseJson("1"), ParseJson("2")}}); }) ==
         ErrorKind::kInvalidArgument);
  assert(KindOf([&] { engine.Query("u1", "orders", "a", Eq("1")); }) == ErrorKind::kInvalidArgument);
}

void TestLockRegistryOnlyTracksHeldLocks() {
  Harness h;
  auto    engine = h.Engine();
  engine.CreateTable(Orders());
  engine.Upsert("u1", "orders", ParseJson(R"({"id":"a","updated_at":1})"));
  assert(h.locks->Size() == 0);

  for (int i = 0; i < 1000; ++i) {
    const auto table = "missing_" + std::to_string(i);
    assert(KindOf([&] { engine.Upsert("u1", table, ParseJson(R"({"id":"a"})")); }) == ErrorKind::kNotFound);
    assert(KindOf([&] { engine.Delete("u1", table, {"a"}); }) == ErrorKind::kNotFound);
    assert(KindOf([&] { engine.CreateIndex("u1", table, IndexSpec{"amount", "$.amount", ColumnType::kNumber}); }) == ErrorKind::kNotFound);
  }
  assert(h.locks->Size() == 0);

  auto held  = h.locks->Acquire("u1", "orders");
  auto again = h.locks->Acquire("u1", "orders");
  assert(held == again);
  assert(h.locks->Size() == 1);
  held.reset();
  assert(h.locks->Size() == 1);
  again.reset();
  assert(h.locks->Size() == 0);

  auto fresh = h.locks->Acquire("u1", "orders");
  assert(fresh);
  assert(h.locks->Size() == 1);
}

} // namespace

int main() {
  TestIndexedQuery();
  TestStaleWriteIsRejected();
  TestTimestampSources();
  TestIndexAndScanAgree();
  TestFailedBackfillResumes();
  TestWritesRejectMismatchedIndexedValues();
  TestBatchReportsStaleRows();
  TestDeleteAndList();
  TestDropIndexAndTable();
  TestCatalogValidation();
  TestLockRegistryOnlyTracksHeldLocks();

  std::cout << "edgestore_unit_user_table_engine: pass\n";
  return 0;
}
