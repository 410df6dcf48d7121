#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/graph/memory/memory_graph_store.hpp"
#include "internal/graph/neo4j/neo4j_http_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/worker/ingest_scheduler.hpp"

namespace graphingest::factory {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const graphingest::runtime::config::DatabaseConfig& config) {
  if (config.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path());
    sqlite_db->Bootstrap();
    GRAPHINGEST_LOG_INFO("task store: sqlite", {StringField("path", config.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  GRAPHINGEST_LOG_INFO("task store: memory");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<graph::GraphStore> BuildGraphStore(const graphingest::runtime::config::GraphConfig& config) {
  if (config.has_neo4j()) {
    GRAPHINGEST_LOG_INFO("graph store: neo4j", {StringField("uri", config.neo4j().uri()), StringField("database", config.neo4j().database())});
    return std::make_shared<graph::Neo4jHttpStore>(config.neo4j());
  }

  GRAPHINGEST_LOG_INFO("graph store: memory");
  return std::make_shared<graph::MemoryGraphStore>();
}

/*
    Build full application dependency graph
*/
Application Build(const graphingest::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Stores
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config.database());
  app.graph      = BuildGraphStore(config.graph());
  app.hub        = std::make_shared<notify::ProgressHub>();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = app.repository;
  ctx.graph      = app.graph;
  ctx.notifier   = app.hub;
  ctx.ingest     = config.ingest();

  app.ingestion = std::make_shared<service::IngestionService>(ctx);

  // ------------------------------------------------------------------
  // Workers
  // ------------------------------------------------------------------
  auto scheduler = std::make_shared<worker::IngestScheduler>();
  app.workers    = std::make_shared<worker::IngestWorkerPool>(scheduler, app.ingestion, config.ingest().workers());

  return app;
}

} // namespace graphingest::factory
