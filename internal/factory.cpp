#include "factory.hpp"

#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/grpc/arena_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace arena::factory {

std::shared_ptr<db::Repository> BuildRepository(const arena::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->Bootstrap();
    ARENA_LOG_INFO("Using sqlite run repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  ARENA_LOG_INFO("Using in-memory run repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

Application Build(const arena::runtime::config::RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);

  service::ServiceContext ctx;
  ctx.repository   = app.repository;
  ctx.run_defaults    = config::ConfigLoader::WithDefaults(config.run());
  ctx.impressions_dir = config.server().impressions_dir();

  app.arena_service = std::make_shared<service::ArenaService>(std::move(ctx));

  app.grpc_services.push_back(std::make_unique<grpc::ArenaServer>(app.arena_service));

  return app;
}

} // namespace arena::factory
