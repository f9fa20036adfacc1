#include <cassert>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/context/user_context_store.hpp"
#include "internal/db/guard/read_only_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/mirror/dataset_mirror.hpp"
#include "internal/service/readiness.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using edgestore::util::ErrorKind;
using edgestore::util::Json;
using edgestore::util::ParseJson;

ErrorKind KindOf(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const edgestore::util::Error& ex) {
    return ex.Kind();
  }
  assert(false && "expected an error");
  return ErrorKind::kInvalidArgument;
}

void TestReaderIsRefusedByServices() {
  auto app = edgestore::factory::Build(edgestore::config::ConfigLoader::LoadFromString(""));

  app.writer.mirror->PublishVersion("catalog", "v1", "c1", {ParseJson(R"({"sku":"A1"})")}, 1000);
  app.writer.tables->CreateTable(edgestore::userdb::TableSpec{"u1", "orders", "", "$.id", ""});
  app.writer.tables->Upsert("u1", "orders", ParseJson(R"({"id":"o1","updated_at":1})"));

  auto& reader = app.reader;
  assert(KindOf([&] { reader.mirror->PublishVersion("catalog", "v2", "c2", {}, 2000); }) == ErrorKind::kUnauthorized);
  assert(KindOf([&] { reader.mirror->PublishSnapshot("catalog", {}); }) == ErrorKind::kUnauthorized);
  assert(KindOf([&] { reader.contexts->SetContext("u1", "catalog", ParseJson("{}"), 1); }) == ErrorKind::kUnauthorized);
  assert(KindOf([&] { reader.views->MaterializeView("u1", "catalog"); }) == ErrorKind::kUnauthorized);
  assert(KindOf([&] { reader.tables->CreateTable(edgestore::userdb::TableSpec{"u1", "more", "", "$.id", ""}); }) == ErrorKind::kUnauthorized);
  assert(KindOf([&] {
           reader.tables->CreateIndex("u1", "orders", edgestore::userdb::IndexSpec{"id", "$.id", edgestore::db::model::ColumnType::kString});
         }) == ErrorKind::kUnauthorized);
  assert(KindOf([&] { reader.tables->Upsert("u1", "orders", ParseJson(R"({"id":"o2","updated_at":1})")); }) == ErrorKind::kUnauthorized);
  assert(KindOf([&] { reader.tables->Delete("u1", "orders", {"o1"}); }) == ErrorKind::kUnauthorized);
  assert(KindOf([&] { reader.tables->DropTable("u1", "orders"); }) == ErrorKind::kUnauthorized);

  // reads go through
  assert(reader.mirror->GetLatestVersion("catalog").version == "v1");
  assert(reader.tables->Get("u1", "orders", "o1").pk == "o1");
  assert(reader.tables->ListTables("u1").size() == 1);
}

void TestStorageGuardDeniesWrites() {
  auto inner = std::make_shared<edgestore::db::memory::MemoryRepository>();
  {
    auto       tx     = inner->Begin();
    const auto marked = inner->MarkInitialized(*tx, 1);
    assert(marked);
    tx->Commit();
  }
  auto guarded = std::make_shared<edgestore::db::guard::ReadOnlyRepository>(inner);

  {
    auto                                     tx = guarded->Begin();
    edgestore::db::model::MirrorVersionRecord record;
    record.dataset_id = "catalog";
    record.version    = "v1";
    record.checksum   = "c1";
    assert(guarded->InsertMirrorVersion(*tx, record).code == edgestore::db::ErrorCode::PermissionDenied);
    assert(guarded->CreateDocumentTable(*tx, "t_x").code == edgestore::db::ErrorCode::PermissionDenied);
    assert(guarded->IsInitialized(*tx));
  }

  // a writer-capability service over the guard still fails at the storage layer
  edgestore::service::ServiceContext ctx;
  ctx.repository = guarded;
  ctx.readiness  = std::make_shared<edgestore::service::ReadinessGate>(guarded);
  ctx.config     = edgestore::config::ConfigLoader::LoadFromString("");
  edgestore::context::UserContextStore store(ctx);
  assert(KindOf([&] { store.SetContext("u1", "catalog", ParseJson("{}"), 1); }) == ErrorKind::kUnauthorized);

  auto tx = inner->Begin();
  assert(!inner->GetUserContext(*tx, "u1", "catalog"));
}

void TestNotInitializedUntilMarked() {
  auto repo = std::make_shared<edgestore::db::memory::MemoryRepository>();

  edgestore::service::ServiceContext ctx;
  ctx.repository = repo;
  ctx.readiness  = std::make_shared<edgestore::service::ReadinessGate>(repo);
  ctx.config     = edgestore::config::ConfigLoader::LoadFromString("");
  ctx.now_ms     = [] { return std::int64_t{1000}; };

  edgestore::mirror::DatasetMirror mirror(ctx);
  assert(!ctx.readiness->IsReady());
  assert(KindOf([&] { mirror.PublishVersion("catalog", "v1", "c1", {}, 1); }) == ErrorKind::kNotInitialized);
  assert(KindOf([&] { mirror.GetLatestVersion("catalog"); }) == ErrorKind::kNotInitialized);

  {
    auto       tx     = repo->Begin();
    const auto marked = repo->MarkInitialized(*tx, 500);
    assert(marked);
    tx->Commit();
  }
  {
    // a second marker keeps the first
    auto       tx    = repo->Begin();
    const auto again = repo->MarkInitialized(*tx, 900);
    assert(again);
    tx->Commit();
  }

  assert(ctx.readiness->IsReady());
  assert(mirror.PublishVersion("catalog", "v1", "c1", {}, 1).created);
  assert(mirror.GetLatestVersion("catalog").row_count == 0);
}

} // namespace

int main() {
  TestReaderIsRefusedByServices();
  TestStorageGuardDeniesWrites();
  TestNotInitializedUntilMarked();

  std::cout << "edgestore_unit_capability_readiness: pass\n";
  return 0;
}
