#include "pg_pool.hpp"

#define GEOCACHE_PG_RECORD_COLUMNS                                                                                       \
  "record_id,ticket_key,record_key,street,intersection,city,county,ticket_type,duration,work_type,excavator,"          \
  "latitude,longitude,confidence,technique,approach,rationale,error_message,quality_tier,review_priority,"             \
  "validation_flags::text,version,supersedes_record_id,is_current,created_at_ms,created_by_stage,locked,lock_reason,"  \
  "locked_at_ms,locked_by,metadata_json::text,processing_time_ms"

#define GEOCACHE_PG_INSERT_COLUMNS                                                                                       \
  "ticket_key,record_key,street,intersection,city,county,ticket_type,duration,work_type,excavator,"                    \
  "latitude,longitude,confidence,technique,approach,rationale,error_message,quality_tier,review_priority,"             \
  "validation_flags,version,supersedes_record_id,is_current,created_at_ms,created_by_stage,locked,lock_reason,"        \
  "locked_at_ms,locked_by,metadata_json,processing_time_ms"

#define GEOCACHE_PG_INSERT_VALUES                                                                                        \
  "$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21::jsonb,$22,$23,$24,$25,$26,$27,$28,$29,"    \
  "$30,$31::jsonb,$32"

namespace geocache::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // $1 is the explicit record id; NULL lets the sequence assign one
  conn.prepare("insert_record",
               "INSERT INTO geocode_cache(record_id," GEOCACHE_PG_INSERT_COLUMNS ") "
               "VALUES(COALESCE($1, nextval(pg_get_serial_sequence('geocode_cache','record_id')))," GEOCACHE_PG_INSERT_VALUES ") "
               "RETURNING record_id");

  conn.prepare("sync_record_sequence",
               "SELECT setval(pg_get_serial_sequence('geocode_cache','record_id'), "
               "GREATEST((SELECT COALESCE(MAX(record_id), 0) FROM geocode_cache), 1))");

  conn.prepare("get_current", "SELECT " GEOCACHE_PG_RECORD_COLUMNS " FROM geocode_cache WHERE ticket_key=$1 AND is_current");

  conn.prepare("get_current_by_record_key",
               "SELECT " GEOCACHE_PG_RECORD_COLUMNS " FROM geocode_cache WHERE record_key=$1 AND is_current "
               "ORDER BY created_at_ms DESC, record_id DESC LIMIT 1");

  conn.prepare("get_history", "SELECT " GEOCACHE_PG_RECORD_COLUMNS " FROM geocode_cache WHERE ticket_key=$1 ORDER BY version DESC");

  conn.prepare("list_current", "SELECT " GEOCACHE_PG_RECORD_COLUMNS " FROM geocode_cache WHERE is_current ORDER BY ticket_key");

  conn.prepare("list_all", "SELECT " GEOCACHE_PG_RECORD_COLUMNS " FROM geocode_cache ORDER BY ticket_key, version");

  conn.prepare("retire_record", "UPDATE geocode_cache SET is_current=FALSE WHERE record_id=$1");

  conn.prepare("update_lock", "UPDATE geocode_cache SET locked=$2,lock_reason=$3,locked_at_ms=$4,locked_by=$5 WHERE record_id=$1");

  conn.prepare("insert_run",
               "INSERT INTO pipeline_history(run_id,pipeline_name,status,started_at_ms,finished_at_ms,ticket_count,config_json,results_json) "
               "VALUES($1,$2,$3,$4,$5,$6,$7::jsonb,$8::jsonb)");

  conn.prepare("update_run",
               "UPDATE pipeline_history SET pipeline_name=$2,status=$3,started_at_ms=$4,finished_at_ms=$5,ticket_count=$6,"
               "config_json=$7::jsonb,results_json=$8::jsonb WHERE run_id=$1");

  conn.prepare("list_runs",
               "SELECT run_id,pipeline_name,status,started_at_ms,finished_at_ms,ticket_count,config_json::text,results_json::text "
               "FROM pipeline_history ORDER BY seq DESC LIMIT $1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace geocache::db::postgres
