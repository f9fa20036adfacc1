#include <cassert>
#include <iostream>
#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/context/user_context_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/readiness.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using edgestore::context::UserContextStore;
using edgestore::util::ParseJson;
using edgestore::util::ToJson;

UserContextStore MakeStore() {
  auto repo = std::make_shared<edgestore::db::memory::MemoryRepository>();
  {
    auto       tx     = repo->Begin();
    const auto marked = repo->MarkInitialized(*tx, 1);
    assert(marked);
    tx->Commit();
  }

  edgestore::service::ServiceContext ctx;
  ctx.repository = repo;
  ctx.readiness  = std::make_shared<edgestore::service::ReadinessGate>(repo);
  ctx.config     = edgestore::config::ConfigLoader::LoadFromString("");
  return UserContextStore(ctx);
}

void TestSetThenGet() {
  auto store = MakeStore();
  store.SetContext("u1", "catalog", ParseJson(R"({"region":"EU"})"), 100);

  const auto stored = store.GetContext("u1", "catalog");
  assert(ToJson(stored.ctx) == R"({"region":"EU"})");
  assert(stored.ts == 100);
}

void TestUpsertIsUnconditional() {
  auto store = MakeStore();
  store.SetContext("u1", "catalog", ParseJson(R"({"region":"EU"})"), 100);

  // an older ts still replaces the stored context
  store.SetContext("u1", "catalog", ParseJson(R"({"region":"US"})"), 50);
  const auto stored = store.GetContext("u1", "catalog");
  assert(ToJson(stored.ctx) == R"({"region":"US"})");
  assert(stored.ts == 50);
}

void TestContextsAreScopedPerUserAndDataset() {
  auto store = MakeStore();
  store.SetContext("u1", "catalog", ParseJson(R"({"region":"EU"})"), 1);
  store.SetContext("u2", "catalog", ParseJson(R"({"region":"APAC"})"), 1);

  assert(ToJson(store.GetContext("u2", "catalog").ctx) == R"({"region":"APAC"})");

  bool not_found = false;
  try {
    store.GetContext("u1", "prices");
  } catch (const edgestore::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestContextMustBeObject() {
  auto store = MakeStore();

  bool invalid = false;
  try {
    store.SetContext("u1", "catalog", ParseJson("[1,2]"), 1);
  } catch (const edgestore::util::InvalidArgument&) {
    invalid = true;
  }
  assert(invalid);
}

} // namespace

int main() {
  TestSetThenGet();
  TestUpsertIsUnconditional();
  TestContextsAreScopedPerUserAndDataset();
  TestContextMustBeObject();

  std::cout << "edgestore_unit_user_context_store: pass\n";
  return 0;
}
