#pragma once

namespace geocache::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Postgres uses the same statements with $n placeholders; see
  PgPool::PrepareStatements.

  Column order of RECORD_COLUMNS is relied upon by every row reader.
*/

#define GEOCACHE_RECORD_COLUMNS                                                                                         \
  "record_id,ticket_key,record_key,street,intersection,city,county,ticket_type,duration,work_type,excavator,"          \
  "latitude,longitude,confidence,technique,approach,rationale,error_message,quality_tier,review_priority,"             \
  "validation_flags,version,supersedes_record_id,is_current,created_at_ms,created_by_stage,locked,lock_reason,"        \
  "locked_at_ms,locked_by,metadata_json,processing_time_ms"

static constexpr int RECORD_COLUMN_COUNT = 32;

static constexpr const char* INSERT_RECORD =
    "INSERT INTO geocode_cache(" GEOCACHE_RECORD_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CURRENT =
    "SELECT " GEOCACHE_RECORD_COLUMNS " FROM geocode_cache WHERE ticket_key=? AND is_current=1;";

static constexpr const char* SELECT_CURRENT_BY_RECORD_KEY =
    "SELECT " GEOCACHE_RECORD_COLUMNS " FROM geocode_cache WHERE record_key=? AND is_current=1"
    " ORDER BY created_at_ms DESC, record_id DESC LIMIT 1;";

static constexpr const char* SELECT_HISTORY =
    "SELECT " GEOCACHE_RECORD_COLUMNS " FROM geocode_cache WHERE ticket_key=? ORDER BY version DESC;";

static constexpr const char* SELECT_ALL_CURRENT =
    "SELECT " GEOCACHE_RECORD_COLUMNS " FROM geocode_cache WHERE is_current=1 ORDER BY ticket_key;";

static constexpr const char* SELECT_ALL =
    "SELECT " GEOCACHE_RECORD_COLUMNS " FROM geocode_cache ORDER BY ticket_key, version;";

static constexpr const char* RETIRE_RECORD =
    "UPDATE geocode_cache SET is_current=0 WHERE record_id=?;";

static constexpr const char* UPDATE_LOCK =
    "UPDATE geocode_cache SET locked=?,lock_reason=?,locked_at_ms=?,locked_by=? WHERE record_id=?;";

static constexpr const char* COUNT_RECORDS =
    "SELECT COUNT(*) FROM geocode_cache;";

static constexpr const char* DELETE_RECORDS =
    "DELETE FROM geocode_cache;";

// run history

static constexpr const char* INSERT_RUN =
    "INSERT INTO pipeline_history(run_id,pipeline_name,status,started_at_ms,finished_at_ms,ticket_count,config_json,results_json)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_RUN =
    "UPDATE pipeline_history SET pipeline_name=?,status=?,started_at_ms=?,finished_at_ms=?,ticket_count=?,config_json=?,results_json=?"
    " WHERE run_id=?;";

static constexpr const char* SELECT_RUNS =
    "SELECT run_id,pipeline_name,status,started_at_ms,finished_at_ms,ticket_count,config_json,results_json"
    " FROM pipeline_history ORDER BY seq DESC LIMIT ?;";

static constexpr const char* DELETE_RUNS =
    "DELETE FROM pipeline_history;";

// schema

static constexpr const char* SCHEMA_SQLITE[] = {
    "CREATE TABLE IF NOT EXISTS geocode_cache ("
    " record_id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " ticket_key TEXT NOT NULL,"
    " record_key TEXT NOT NULL,"
    " street TEXT NOT NULL DEFAULT '',"
    " intersection TEXT NOT NULL DEFAULT '',"
    " city TEXT NOT NULL DEFAULT '',"
    " county TEXT NOT NULL DEFAULT '',"
    " ticket_type TEXT NOT NULL DEFAULT '',"
    " duration TEXT NOT NULL DEFAULT '',"
    " work_type TEXT NOT NULL DEFAULT '',"
    " excavator TEXT NOT NULL DEFAULT '',"
    " latitude REAL CHECK (latitude IS NULL OR (latitude >= -90 AND latitude <= 90)),"
    " longitude REAL CHECK (longitude IS NULL OR (longitude >= -180 AND longitude <= 180)),"
    " confidence REAL CHECK (confidence IS NULL OR (confidence >= 0 AND confidence <= 1)),"
    " technique TEXT NOT NULL DEFAULT '',"
    " approach TEXT NOT NULL DEFAULT '',"
    " rationale TEXT NOT NULL DEFAULT '',"
    " error_message TEXT NOT NULL DEFAULT '',"
    " quality_tier TEXT NOT NULL CHECK (quality_tier IN ('EXCELLENT','GOOD','ACCEPTABLE','REVIEW_NEEDED','FAILED')),"
    " review_priority TEXT NOT NULL CHECK (review_priority IN ('CRITICAL','HIGH','MEDIUM','LOW','NONE')),"
    " validation_flags TEXT NOT NULL DEFAULT '[]',"
    " version INTEGER NOT NULL CHECK (version >= 1),"
    " supersedes_record_id INTEGER,"
    " is_current INTEGER NOT NULL DEFAULT 1 CHECK (is_current IN (0, 1)),"
    " created_at_ms INTEGER NOT NULL,"
    " created_by_stage TEXT NOT NULL DEFAULT '',"
    " locked INTEGER NOT NULL DEFAULT 0 CHECK (locked IN (0, 1)),"
    " lock_reason TEXT NOT NULL DEFAULT '',"
    " locked_at_ms INTEGER,"
    " locked_by TEXT NOT NULL DEFAULT '',"
    " metadata_json TEXT NOT NULL DEFAULT '{}',"
    " processing_time_ms REAL,"
    " UNIQUE(ticket_key, version));",
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_geocode_cache_current ON geocode_cache(ticket_key) WHERE is_current = 1;",
    "CREATE INDEX IF NOT EXISTS idx_geocode_cache_record_key ON geocode_cache(record_key);",
    "CREATE INDEX IF NOT EXISTS idx_geocode_cache_quality ON geocode_cache(quality_tier) WHERE is_current = 1;",
    "CREATE INDEX IF NOT EXISTS idx_geocode_cache_priority ON geocode_cache(review_priority) WHERE is_current = 1;",
    "CREATE TABLE IF NOT EXISTS pipeline_history ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT,"
    " run_id TEXT NOT NULL UNIQUE,"
    " pipeline_name TEXT NOT NULL,"
    " status TEXT NOT NULL CHECK (status IN ('running','completed','aborted')),"
    " started_at_ms INTEGER NOT NULL,"
    " finished_at_ms INTEGER,"
    " ticket_count INTEGER NOT NULL DEFAULT 0,"
    " config_json TEXT NOT NULL DEFAULT '{}',"
    " results_json TEXT NOT NULL DEFAULT '{}');",
    "CREATE TABLE IF NOT EXISTS geocode_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
    "INSERT OR IGNORE INTO geocode_schema_migrations(version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

static constexpr const char* SCHEMA_POSTGRES[] = {
    "CREATE TABLE IF NOT EXISTS geocode_cache ("
    " record_id BIGSERIAL PRIMARY KEY,"
    " ticket_key TEXT NOT NULL,"
    " record_key TEXT NOT NULL,"
    " street TEXT NOT NULL DEFAULT '',"
    " intersection TEXT NOT NULL DEFAULT '',"
    " city TEXT NOT NULL DEFAULT '',"
    " county TEXT NOT NULL DEFAULT '',"
    " ticket_type TEXT NOT NULL DEFAULT '',"
    " duration TEXT NOT NULL DEFAULT '',"
    " work_type TEXT NOT NULL DEFAULT '',"
    " excavator TEXT NOT NULL DEFAULT '',"
    " latitude DOUBLE PRECISION CHECK (latitude IS NULL OR (latitude >= -90 AND latitude <= 90)),"
    " longitude DOUBLE PRECISION CHECK (longitude IS NULL OR (longitude >= -180 AND longitude <= 180)),"
    " confidence DOUBLE PRECISION CHECK (confidence IS NULL OR (confidence >= 0 AND confidence <= 1)),"
    " technique TEXT NOT NULL DEFAULT '',"
    " approach TEXT NOT NULL DEFAULT '',"
    " rationale TEXT NOT NULL DEFAULT '',"
    " error_message TEXT NOT NULL DEFAULT '',"
    " quality_tier TEXT NOT NULL CHECK (quality_tier IN ('EXCELLENT','GOOD','ACCEPTABLE','REVIEW_NEEDED','FAILED')),"
    " review_priority TEXT NOT NULL CHECK (review_priority IN ('CRITICAL','HIGH','MEDIUM','LOW','NONE')),"
    " validation_flags JSONB NOT NULL DEFAULT '[]',"
    " version BIGINT NOT NULL CHECK (version >= 1),"
    " supersedes_record_id BIGINT,"
    " is_current BOOLEAN NOT NULL DEFAULT TRUE,"
    " created_at_ms BIGINT NOT NULL,"
    " created_by_stage TEXT NOT NULL DEFAULT '',"
    " locked BOOLEAN NOT NULL DEFAULT FALSE,"
    " lock_reason TEXT NOT NULL DEFAULT '',"
    " locked_at_ms BIGINT,"
    " locked_by TEXT NOT NULL DEFAULT '',"
    " metadata_json JSONB NOT NULL DEFAULT '{}',"
    " processing_time_ms DOUBLE PRECISION,"
    " UNIQUE(ticket_key, version));",
    "CREATE UNIQUE INDEX IF NOT EXISTS idx_geocode_cache_current ON geocode_cache(ticket_key) WHERE is_current;",
    "CREATE INDEX IF NOT EXISTS idx_geocode_cache_record_key ON geocode_cache(record_key);",
    "CREATE TABLE IF NOT EXISTS pipeline_history ("
    " seq BIGSERIAL PRIMARY KEY,"
    " run_id TEXT NOT NULL UNIQUE,"
    " pipeline_name TEXT NOT NULL,"
    " status TEXT NOT NULL CHECK (status IN ('running','completed','aborted')),"
    " started_at_ms BIGINT NOT NULL,"
    " finished_at_ms BIGINT,"
    " ticket_count BIGINT NOT NULL DEFAULT 0,"
    " config_json JSONB NOT NULL DEFAULT '{}',"
    " results_json JSONB NOT NULL DEFAULT '{}');",
    "CREATE TABLE IF NOT EXISTS geocode_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
    "INSERT INTO geocode_schema_migrations(version) VALUES (1) ON CONFLICT DO NOTHING;"};

} // namespace geocache::db::sql
