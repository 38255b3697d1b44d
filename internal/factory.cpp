#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/job_store.hpp"
#include "internal/task/task_registry.hpp"
#if BATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace batch::factory {

std::shared_ptr<db::Repository> BuildRepository(const batch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if BATCH_DB_SQLITE
    std::filesystem::path path = database.sqlite().path();
    if (path.empty()) {
      path = std::filesystem::path(config.engine().data_dir()) / "jobs.db";
    }
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }

    BATCH_LOG_INFO("Opening sqlite job store", {batch::observability::StringField("path", path.string())});
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path.string());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  BATCH_LOG_INFO("Using in-memory job store");
  return std::make_shared<db::memory::MemoryRepository>();
}

engine::EngineOptions BuildEngineOptions(const batch::runtime::config::RuntimeConfig& config) {
  const auto& in = config.engine();

  engine::EngineOptions options;
  options.max_workers      = in.max_workers();
  options.max_queue_size   = in.max_queue_size();
  options.poll_interval    = std::chrono::milliseconds(in.poll_interval_ms());
  options.default_timeout  = std::chrono::milliseconds(in.default_timeout_ms());
  options.recover_on_start = !in.has_recover_on_start() || in.recover_on_start();

  const auto& retry                  = in.default_retry();
  options.default_retry.max_attempts = retry.max_attempts();
  options.default_retry.base_delay   = std::chrono::milliseconds(retry.base_delay_ms());
  options.default_retry.multiplier   = retry.multiplier();
  options.default_retry.max_delay    = std::chrono::milliseconds(retry.max_delay_ms());
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const batch::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto store      = std::make_shared<store::JobStore>(repository);

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  auto registry = std::make_shared<task::TaskRegistry>();
  task::RegisterBuiltinTasks(*registry);

  app.engine = std::make_shared<engine::JobEngine>(BuildEngineOptions(config), registry, store);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine = app.engine;

  auto job_service = std::make_shared<service::JobService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::JobServer>(job_service));

  return app;
}

} // namespace batch::factory
