#include "factory.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/pipeline_config.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/stage/centroid_fallback_stage.hpp"
#include "internal/util/errors.hpp"
#if GEOCACHE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if GEOCACHE_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace geocache::factory {

namespace {

#if GEOCACHE_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const char* sql : db::sql::SCHEMA_SQLITE) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT record_id,ticket_key,version,is_current FROM geocode_cache LIMIT 1;");
  sqlite_db->Exec("SELECT run_id,status FROM pipeline_history LIMIT 1;");
}
#endif

#if GEOCACHE_DB_POSTGRES
// Runs on a dedicated connection: pooled connections prepare statements against these tables.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);
  for (const char* sql : db::sql::SCHEMA_POSTGRES) {
    tx.exec(sql);
  }

  tx.exec("SELECT record_id,ticket_key,version,is_current FROM geocode_cache LIMIT 1;");
  tx.exec("SELECT run_id,status FROM pipeline_history LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const geocache::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if GEOCACHE_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw util::ConfigurationError("database.sqlite.path: required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), !sqlite.has_wal_mode() || sqlite.wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    GEOCACHE_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", sqlite.path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if GEOCACHE_DB_POSTGRES
    const auto& postgres = database.postgres();
    if (postgres.connection_uri().empty()) {
      throw util::ConfigurationError("database.postgres.connection_uri: required");
    }
    BootstrapPostgresSchema(postgres.connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(),
                                                       postgres.max_connections() == 0 ? 16 : postgres.max_connections());
    GEOCACHE_LOG_INFO("repository ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("postgres backend requested but not enabled at build time");
#endif
  }

  GEOCACHE_LOG_INFO("repository ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

void RegisterBuiltinStages(stage::StageFactory& factory, std::shared_ptr<const validation::CentroidRegistry> centroids) {
  if (!factory.Has(stage::CentroidFallbackStage::kTechnique)) {
    factory.Register(stage::CentroidFallbackStage::kTechnique, [centroids](const stage::StageConfig& config) {
      return std::make_unique<stage::CentroidFallbackStage>(config, centroids);
    });
  }
}

/*
    Build full dependency graph
*/
Runtime BuildRuntime(const geocache::runtime::config::RuntimeConfig& config, stage::StageFactory stages) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Settings (validated before anything is opened)
  // ------------------------------------------------------------------
  auto pipeline_settings   = geocache::config::BuildPipelineConfig(config);
  auto validation_settings = geocache::config::BuildValidationSettings(config.validation());
  auto centroids           = std::make_shared<const validation::CentroidRegistry>(geocache::config::BuildCentroids(config.validation()));

  // ------------------------------------------------------------------
  // Stages (built before any database is opened)
  // ------------------------------------------------------------------
  RegisterBuiltinStages(stages, centroids);

  std::vector<std::unique_ptr<stage::Stage>> built;
  built.reserve(pipeline_settings.stages.size());
  for (const auto& stage_config : pipeline_settings.stages) {
    built.push_back(stages.Create(stage_config));
  }

  // ------------------------------------------------------------------
  // Assessment
  // ------------------------------------------------------------------
  runtime.centroids = centroids;
  runtime.validator =
      std::make_shared<const validation::ValidationEngine>(validation::ValidationEngine::WithDefaultRules(validation_settings, centroids));
  runtime.assessor = std::make_shared<const quality::QualityAssessor>(geocache::config::BuildQualityPolicy(config.validation()));

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);
  runtime.store      = std::make_shared<cache::RecordStore>(runtime.repository);

  runtime.pipeline = std::make_shared<pipeline::Pipeline>(std::move(pipeline_settings.options), runtime.store, runtime.validator,
                                                          runtime.assessor, std::move(built));
  return runtime;
}

void InitializeObservability(const geocache::runtime::config::RuntimeConfig& config) {
  observability::InitializeLogging(config);
  if (observability::InitializeTracing(config)) {
    GEOCACHE_LOG_INFO("tracing enabled");
  }
  if (observability::InitializeMetrics(config)) {
    GEOCACHE_LOG_INFO("metrics enabled");
  }
}

} // namespace geocache::factory
