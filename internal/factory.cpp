#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/cache/cache_invalidator.hpp"
#include "internal/core/checkout_orchestrator.hpp"
#include "internal/core/settlement.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/grpc/checkout_server.hpp"
#include "internal/grpc/payment_server.hpp"
#include "internal/ledger/stock_ledger.hpp"
#include "internal/lock/memory_lock_service.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduler/cancellation_scheduler.hpp"
#include "internal/scheduler/delayed_job_worker.hpp"
#include "internal/service/checkout_service.hpp"
#include "internal/service/payment_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"
#if CHECKOUT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CHECKOUT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif
#if CHECKOUT_LOCK_REDIS
#include "internal/cache/redis_cache_invalidator.hpp"
#include "internal/lock/redis_lock_service.hpp"
#endif

namespace checkout::factory {

using checkout::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

#if CHECKOUT_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
  sqlite_db->Exec("INSERT OR IGNORE INTO schema_migrations (version, applied_at_ms) VALUES (" + std::to_string(db::sql::kSchemaVersion) +
                  ", " + std::to_string(util::ToUnixMillis(util::Now())) + ");");
}
#endif

#if CHECKOUT_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.exec_params("INSERT INTO schema_migrations (version) VALUES ($1) ON CONFLICT DO NOTHING", db::sql::kSchemaVersion);
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CHECKOUT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    CHECKOUT_LOG_INFO("using sqlite repository", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CHECKOUT_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16u;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    CHECKOUT_LOG_INFO("using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  CHECKOUT_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

#if CHECKOUT_LOCK_REDIS
std::shared_ptr<sw::redis::Redis> ConnectRedis(const std::string& uri) {
  if (uri.empty()) {
    throw std::runtime_error("redis store requested without a uri");
  }
  return std::make_shared<sw::redis::Redis>(uri);
}
#endif

std::shared_ptr<lock::LockService> BuildLockService(const RuntimeConfig& config) {
  if (config.locks().has_redis()) {
#if CHECKOUT_LOCK_REDIS
    return std::make_shared<lock::RedisLockService>(ConnectRedis(config.locks().redis().uri()));
#else
    throw std::runtime_error("redis lock store requested but not enabled at build time");
#endif
  }
  return std::make_shared<lock::MemoryLockService>();
}

std::shared_ptr<cache::CacheInvalidator> BuildCacheInvalidator(const RuntimeConfig& config) {
  if (config.cache().has_redis()) {
#if CHECKOUT_LOCK_REDIS
    return std::make_shared<cache::RedisCacheInvalidator>(ConnectRedis(config.cache().redis().uri()));
#else
    throw std::runtime_error("redis cache store requested but not enabled at build time");
#endif
  }
  return std::make_shared<cache::MemoryCacheInvalidator>();
}

scheduler::DelayedJobWorkerOptions WorkerOptions(const checkout::runtime::config::SchedulerConfig& cfg) {
  scheduler::DelayedJobWorkerOptions options;
  if (cfg.poll_interval_ms() > 0) options.poll_interval = std::chrono::milliseconds(cfg.poll_interval_ms());
  if (cfg.batch_size() > 0) options.batch_size = cfg.batch_size();
  if (cfg.max_attempts() > 0) options.max_attempts = cfg.max_attempts();
  if (cfg.retry_backoff_ms() > 0) options.retry_backoff = std::chrono::milliseconds(cfg.retry_backoff_ms());
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Backends
  // ------------------------------------------------------------------
  auto repository        = BuildRepository(config);
  auto lock_service      = BuildLockService(config);
  auto cache_invalidator = BuildCacheInvalidator(config);
  auto notifier          = std::make_shared<notify::LogNotifier>();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto stock_ledger  = std::make_shared<ledger::StockLedger>(repository);
  auto cancellations = std::make_shared<scheduler::CancellationScheduler>(
      repository, std::chrono::milliseconds(config.checkout().cancel_after_ms()));

  auto orchestrator = std::make_shared<core::CheckoutOrchestrator>(repository, lock_service, stock_ledger, cancellations,
                                                                   cache_invalidator, std::chrono::milliseconds(config.locks().ttl_ms()));
  auto settlement   = std::make_shared<core::SettlementService>(repository, stock_ledger, cancellations, cache_invalidator,
                                                              config.payment().reference_prefix());

  // ------------------------------------------------------------------
  // Delayed job worker
  // ------------------------------------------------------------------
  auto worker = std::make_shared<scheduler::DelayedJobWorker>(repository, WorkerOptions(config.scheduler()));
  worker->RegisterHandler(scheduler::CancellationScheduler::kJobType, [settlement](const db::model::DelayedJobRecord& job) {
    settlement->Expire(scheduler::CancellationScheduler::DecodePaymentId(job.payload));
  });
  worker->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.orchestrator = orchestrator;
  ctx.settlement   = settlement;
  ctx.notifier     = notifier;
  ctx.repository   = repository;

  auto checkout_service = std::make_shared<service::CheckoutService>(ctx);
  auto payment_service  = std::make_shared<service::PaymentService>(ctx);

  if (config.payment().api_key().empty()) {
    CHECKOUT_LOG_WARN("payment api key not configured; every webhook will be rejected");
  }

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::CheckoutServer>(checkout_service));
  app.grpc_services.push_back(std::make_unique<grpc::PaymentServer>(payment_service, config.payment().api_key()));

  app.repository = repository;
  app.worker     = worker;
  app.notifier   = notifier;
  return app;
}

} // namespace checkout::factory
