#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/guard/read_only_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/readiness.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if EDGESTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if EDGESTORE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace edgestore::factory {

namespace {

#if EDGESTORE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS global_mirror_versions (id INTEGER PRIMARY KEY AUTOINCREMENT, dataset_id TEXT NOT NULL, version TEXT NOT NULL, checksum TEXT NOT NULL, ts INTEGER NOT NULL, UNIQUE(dataset_id, version));",
      "CREATE TABLE IF NOT EXISTS global_rows (id INTEGER PRIMARY KEY AUTOINCREMENT, dataset_id TEXT NOT NULL, version TEXT NOT NULL, item TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS global_rows_by_version ON global_rows(dataset_id, version, id);",
      "CREATE TABLE IF NOT EXISTS user_contexts (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT NOT NULL, dataset_id TEXT NOT NULL, ctx TEXT NOT NULL, ts INTEGER NOT NULL, UNIQUE(user_id, dataset_id));",
      "CREATE TABLE IF NOT EXISTS user_views (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT NOT NULL, dataset_id TEXT NOT NULL, version TEXT NOT NULL, item TEXT NOT NULL, ts INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS user_views_by_user ON user_views(user_id, dataset_id, id);",
      "CREATE TABLE IF NOT EXISTS userdb_tables (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT NOT NULL, table_name TEXT NOT NULL, phy_table TEXT NOT NULL UNIQUE, pk_path TEXT NOT NULL, ts_path TEXT NOT NULL, created_at INTEGER NOT NULL, UNIQUE(user_id, table_name));",
      "CREATE TABLE IF NOT EXISTS userdb_table_indexes (id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT NOT NULL, table_name TEXT NOT NULL, col_name TEXT NOT NULL, json_path TEXT NOT NULL, col_type TEXT NOT NULL, state TEXT NOT NULL, UNIQUE(user_id, table_name, col_name), FOREIGN KEY(user_id, table_name) REFERENCES userdb_tables(user_id, table_name) ON DELETE CASCADE);",
      "CREATE TABLE IF NOT EXISTS init_complete (id INTEGER PRIMARY KEY CHECK(id = 1), completed_at INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,dataset_id,version,checksum,ts FROM global_mirror_versions LIMIT 1;");
  sqlite_db->Exec("SELECT id,user_id,table_name,phy_table,pk_path,ts_path,created_at FROM userdb_tables LIMIT 1;");
  sqlite_db->Exec("SELECT id,user_id,table_name,col_name,json_path,col_type,state FROM userdb_table_indexes LIMIT 1;");
}
#endif

#if EDGESTORE_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS global_mirror_versions (id BIGSERIAL PRIMARY KEY, dataset_id TEXT NOT NULL, version TEXT NOT NULL, checksum TEXT NOT NULL, ts BIGINT NOT NULL, UNIQUE(dataset_id, version));");
  tx.exec("CREATE TABLE IF NOT EXISTS global_rows (id BIGSERIAL PRIMARY KEY, dataset_id TEXT NOT NULL, version TEXT NOT NULL, item JSONB NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS global_rows_by_version ON global_rows(dataset_id, version, id);");
  tx.exec("CREATE TABLE IF NOT EXISTS user_contexts (id BIGSERIAL PRIMARY KEY, user_id TEXT NOT NULL, dataset_id TEXT NOT NULL, ctx JSONB NOT NULL, ts BIGINT NOT NULL, UNIQUE(user_id, dataset_id));");
  tx.exec("CREATE TABLE IF NOT EXISTS user_views (id BIGSERIAL PRIMARY KEY, user_id TEXT NOT NULL, dataset_id TEXT NOT NULL, version TEXT NOT NULL, item JSONB NOT NULL, ts BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS user_views_by_user ON user_views(user_id, dataset_id, id);");
  tx.exec("CREATE TABLE IF NOT EXISTS userdb_tables (id BIGSERIAL PRIMARY KEY, user_id TEXT NOT NULL, table_name TEXT NOT NULL, phy_table TEXT NOT NULL UNIQUE, pk_path TEXT NOT NULL, ts_path TEXT NOT NULL, created_at BIGINT NOT NULL, UNIQUE(user_id, table_name));");
  tx.exec("CREATE TABLE IF NOT EXISTS userdb_table_indexes (id BIGSERIAL PRIMARY KEY, user_id TEXT NOT NULL, table_name TEXT NOT NULL, col_name TEXT NOT NULL, json_path TEXT NOT NULL, col_type TEXT NOT NULL, state TEXT NOT NULL, UNIQUE(user_id, table_name, col_name), FOREIGN KEY(user_id, table_name) REFERENCES userdb_tables(user_id, table_name) ON DELETE CASCADE);");
  tx.exec("CREATE TABLE IF NOT EXISTS init_complete (id INTEGER PRIMARY KEY CHECK(id = 1), completed_at BIGINT NOT NULL);");

  tx.exec("SELECT id,dataset_id,version,checksum,ts FROM global_mirror_versions LIMIT 1;");
  tx.exec("SELECT id,user_id,table_name,phy_table,pk_path,ts_path,created_at FROM userdb_tables LIMIT 1;");
  tx.commit();
}
#endif

void MarkInitialized(db::Repository& repository) {
  auto tx     = repository.Begin();
  auto result = repository.MarkInitialized(*tx, util::NowMillis());
  if (!result) {
    throw std::runtime_error("schema provisioning: cannot write readiness marker (" + std::string(db::ErrorCodeName(result.code)) + ")");
  }
  tx->Commit();
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  std::shared_ptr<db::Repository> repository;

  const auto& database = config.database();
  if (database.has_sqlite()) {
#if EDGESTORE_DB_SQLITE
    const auto& sqlite_config = database.sqlite();
    auto        sqlite_db     = std::make_shared<db::sqlite::SqliteDB>(sqlite_config.path(), sqlite_config.wal_mode(),
                                                                  static_cast<int>(sqlite_config.busy_timeout_ms()));
    BootstrapSqliteSchema(sqlite_db);
    repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  } else if (database.has_postgres()) {
#if EDGESTORE_DB_POSTGRES
    const auto& pg_config = database.postgres();
    auto        pool      = std::make_shared<db::postgres::PgPool>(pg_config.connection_uri(), pg_config.max_connections());
    BootstrapPostgresSchema(pool);
    repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  } else {
    repository = std::make_shared<db::memory::MemoryRepository>();
  }

  MarkInitialized(*repository);
  EDGESTORE_LOG_INFO("repository ready", {observability::StringField("backend", database.has_sqlite()     ? "sqlite"
                                                                               : database.has_postgres() ? "postgres"
                                                                                                         : "memory")});
  return repository;
}

ServiceSet BuildServices(std::shared_ptr<db::Repository> repository, const runtime::config::RuntimeConfig& config, auth::Capability capability,
                         std::shared_ptr<view::TransformRegistry> transforms, std::shared_ptr<userdb::TableLockRegistry> locks,
                         std::shared_ptr<service::ChangeFeed> changes) {
  service::ServiceContext ctx;
  ctx.repository = repository;
  ctx.readiness  = std::make_shared<service::ReadinessGate>(repository);
  ctx.capability = capability;
  ctx.config     = config;
  ctx.changes    = std::move(changes);
  edgestore::config::ConfigLoader::ApplyDefaults(ctx.config);

  ServiceSet services;
  services.mirror   = std::make_shared<mirror::DatasetMirror>(ctx);
  services.contexts = std::make_shared<context::UserContextStore>(ctx);
  services.views    = std::make_shared<view::ViewMaterializer>(ctx, std::move(transforms));
  services.tables   = std::make_shared<userdb::UserTableEngine>(ctx, std::move(locks));
  return services;
}

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);

  app.transforms = std::make_shared<view::TransformRegistry>();
  app.transforms->Configure(config.views());
  app.locks   = std::make_shared<userdb::TableLockRegistry>();
  app.changes = std::make_shared<service::ChangeFeed>();

  app.writer = BuildServices(app.repository, config, auth::Capability::kWriter, app.transforms, app.locks, app.changes);
  app.reader = BuildServices(std::make_shared<db::guard::ReadOnlyRepository>(app.repository), config, auth::Capability::kReader, app.transforms,
                             app.locks);
  return app;
}

} // namespace edgestore::factory
