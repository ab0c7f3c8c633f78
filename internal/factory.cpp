#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/memory_due_cache.hpp"
#include "internal/core/actionable_step_processor.hpp"
#include "internal/core/scheduler.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/care_task_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/care_task_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if CARETASK_DB_SQLITE
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CARETASK_DB_POSTGRES
#include "internal/db/sql/schema.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace caretask::factory {

using caretask::observability::StringField;

namespace {

#if CARETASK_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }
}
#endif

#if CARETASK_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const char* sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const caretask::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CARETASK_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    CARETASK_LOG_INFO("schedule store ready", {StringField("backend", "sqlite"), StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CARETASK_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    CARETASK_LOG_INFO("schedule store ready", {StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CARETASK_LOG_WARN("schedule store is in-memory; state is lost on restart", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<cache::DueCache> BuildDueCache(const caretask::runtime::config::RuntimeConfig&, std::shared_ptr<const util::TimeSource> clock) {
  // memory is the only cache backend; ConfigLoader::Normalize selects it when unset
  return std::make_shared<cache::MemoryDueCache>(std::move(clock));
}

/*
    Build full application dependency graph
*/
Application Build(const caretask::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::TimeSource> clock) {
  Application app;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.cache      = BuildDueCache(config, clock);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.scheduler = std::make_shared<core::Scheduler>(app.repository, app.cache, clock);
  app.processor = std::make_shared<core::ActionableStepProcessor>(app.repository, app.scheduler, clock);

  if (config.scheduler().hydrate_on_start()) {
    app.scheduler->HydrateDueCache();
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.scheduler  = app.scheduler;
  ctx.processor  = app.processor;

  app.service = std::make_shared<service::CareTaskService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::CareTaskServer>(app.service));

  return app;
}

} // namespace caretask::factory
