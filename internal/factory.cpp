#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/events/event_outbox.hpp"
#include "internal/geo/geo_service.hpp"
#include "internal/grpc/driver_server.hpp"
#include "internal/grpc/realtime_server.hpp"
#include "internal/grpc/ride_server.hpp"
#include "internal/matching/acceptance_arbitrator.hpp"
#include "internal/matching/batch_scheduler.hpp"
#include "internal/matching/candidate_selector.hpp"
#include "internal/matching/offer_broadcaster.hpp"
#include "internal/matching/ride_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pricing/fare_estimator.hpp"
#include "internal/realtime/connection_registry.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/realtime_service.hpp"
#include "internal/service/ride_service.hpp"
#if DISPATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if DISPATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace dispatch::factory {

void Application::Stop() {
  if (context.scheduler) context.scheduler->Stop();
  if (context.outbox) context.outbox->Stop();
}

std::shared_ptr<db::Repository> BuildRepository(const dispatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DISPATCH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    DISPATCH_LOG_INFO("Using sqlite backend", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DISPATCH_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    db::postgres::PgMigrationExecutor executor(pool);
    db::sql::RunMigrations(executor, db::sql::PostgresSchema());
    DISPATCH_LOG_INFO("Using postgres backend", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DISPATCH_LOG_WARN("No database configured, using in-memory backend");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildContext(const dispatch::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  service::ServiceContext ctx;
  ctx.config     = config;
  ctx.repository = std::move(repository);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  ctx.registry       = std::make_shared<realtime::ConnectionRegistry>();
  ctx.outbox         = std::make_shared<events::EventOutbox>(ctx.registry);
  ctx.geo            = std::make_shared<geo::HaversineGeoService>(config.matching().average_speed_kmh());
  ctx.fare_estimator = std::make_shared<pricing::DistanceFareEstimator>(config.pricing(), ctx.geo);

  // ------------------------------------------------------------------
  // Dispatch core
  // ------------------------------------------------------------------
  ctx.state_machine = std::make_shared<matching::RideStateMachine>(ctx.repository);
  ctx.selector      = std::make_shared<matching::CandidateSelector>(ctx.repository, ctx.geo, config.matching());
  ctx.broadcaster   = std::make_shared<matching::OfferBroadcaster>(ctx.repository, ctx.registry, ctx.outbox, config.dispatch());
  ctx.scheduler =
      std::make_shared<matching::BatchScheduler>(ctx.repository, ctx.selector, ctx.broadcaster, ctx.state_machine, ctx.outbox, config.dispatch());
  ctx.arbitrator = std::make_shared<matching::AcceptanceArbitrator>(ctx.repository, ctx.state_machine, ctx.outbox, ctx.scheduler);

  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const dispatch::runtime::config::RuntimeConfig& config) {
  Application app;
  app.context = BuildContext(config, BuildRepository(config));
  auto& ctx   = app.context;

  // ------------------------------------------------------------------
  // Background machinery
  // ------------------------------------------------------------------
  ctx.outbox->Start();
  ctx.scheduler->Start();
  ctx.scheduler->Recover();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto ride_service     = std::make_shared<service::RideService>(ctx);
  auto driver_service   = std::make_shared<service::DriverService>(ctx);
  auto realtime_service = std::make_shared<service::RealtimeService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RideServer>(ride_service));
  app.grpc_services.push_back(std::make_unique<grpc::DriverServer>(driver_service));
  app.grpc_services.push_back(std::make_unique<grpc::RealtimeServer>(realtime_service));

  return app;
}

} // namespace dispatch::factory
