#include <cassert>

#include <atomic>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
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
using edgestore::userdb::IndexSpec;
using edgestore::userdb::Predicate;
using edgestore::userdb::TableSpec;
using edgestore::userdb::UserTableEngine;
using edgestore::util::ParseJson;

constexpr int kThreads   = 6;
constexpr int kPerThread = 15;

UserTableEngine MakeEngine(std::shared_ptr<edgestore::db::memory::MemoryRepository> repo, std::shared_ptr<edgestore::userdb::TableLockRegistry> locks) {
  edgestore::service::ServiceContext ctx;
  ctx.repository = repo;
  ctx.readiness  = std::make_shared<edgestore::service::ReadinessGate>(repo);
  ctx.config     = edgestore::config::ConfigLoader::LoadFromString("");
  ctx.config.mutable_transactions()->set_max_conflict_retries(10000);
  ctx.now_ms = [] { return std::int64_t{1}; };
  return UserTableEngine(ctx, std::move(locks));
}

void TestConcurrentUpsertsConverge() {
  auto repo  = std::make_shared<edgestore::db::memory::MemoryRepository>();
  auto locks = std::make_shared<edgestore::userdb::TableLockRegistry>();
  {
    auto       tx     = repo->Begin();
    const auto marked = repo->MarkInitialized(*tx, 1);
    assert(marked);
    tx->Commit();
  }

  auto engine = MakeEngine(repo, locks);
  engine.CreateTable(TableSpec{"u1", "counters", "", "$.id", "$.ts"});
  engine.CreateIndex("u1", "counters", IndexSpec{"ts", "$.ts", ColumnType::kInteger});

  std::atomic<int>         written{0};
  std::atomic<int>         stale{0};
  std::atomic<int>         failed{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      auto local = MakeEngine(repo, locks);
      for (int i = 0; i < kPerThread; ++i) {
        // interleaved timestamps: every thread writes both old and new values
        const int ts = i * kThreads + t + 1;
        try {
          local.Upsert("u1", "counters", ParseJson("{\"id\":\"k\",\"ts\":" + std::to_string(ts) + "}"));
          ++written;
        } catch (const edgestore::util::StaleWrite&) {
          ++stale;
        } catch (const edgestore::util::Error&) {
          ++failed;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  constexpr int kMaxTs = kThreads * kPerThread;
  assert(failed == 0);
  assert(written + stale == kMaxTs);
  assert(written >= 1);

  const auto doc = engine.Get("u1", "counters", "k");
  assert(doc.updated_at == kMaxTs);

  const auto described = engine.DescribeTable("u1", "counters");
  assert(described.indexes.size() == 1);
  assert(described.indexes[0].entries == 1);

  const auto latest = engine.Query("u1", "counters", "ts", Predicate{CompareOp::kEq, {ParseJson(std::to_string(kMaxTs))}});
  assert(latest.plan.indexed);
  assert(latest.documents.size() == 1);
  assert(engine.Query("u1", "counters", "ts", Predicate{CompareOp::kLt, {ParseJson(std::to_string(kMaxTs))}}).documents.empty());
}

void TestConcurrentTablesAreIndependent() {
  auto repo  = std::make_shared<edgestore::db::memory::MemoryRepository>();
  auto locks = std::make_shared<edgestore::userdb::TableLockRegistry>();
  {
    auto       tx     = repo->Begin();
    const auto marked = repo->MarkInitialized(*tx, 1);
    assert(marked);
    tx->Commit();
  }

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      auto        local = MakeEngine(repo, locks);
      const auto  user  = "user" + std::to_string(t);
      local.CreateTable(TableSpec{user, "notes", "", "$.id", "$.ts"});
      for (int i = 0; i < kPerThread; ++i) {
        local.Upsert(user, "notes", ParseJson("{\"id\":\"n" + std::to_string(i) + "\",\"ts\":1}"));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  auto engine = MakeEngine(repo, locks);
  for (int t = 0; t < kThreads; ++t) {
    edgestore::userdb::ListOptions all;
    all.limit = 100;
    assert(engine.List("user" + std::to_string(t), "notes", all).size() == static_cast<std::size_t>(kPerThread));
  }
}

} // namespace

int main() {
  TestConcurrentUpsertsConverge();
  TestConcurrentTablesAreIndependent();

  std::cout << "edgestore_unit_userdb_concurrency: pass\n";
  return 0;
}
