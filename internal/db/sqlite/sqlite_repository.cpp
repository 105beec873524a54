#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/model/json_fields.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace geocache::db::sqlite {

using geocache::db::ErrorCode;
using geocache::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

void BindRecord(sqlite3_stmt* st, const model::GeocodeRecord& r) {
  if (r.record_id == 0) {
    sqlite3_bind_null(st, 1);
  } else {
    BindU64(st, 1, r.record_id);
  }
  BindText(st, 2, r.ticket_key);
  BindText(st, 3, r.record_key);
  BindText(st, 4, r.street);
  BindText(st, 5, r.intersection);
  BindText(st, 6, r.city);
  BindText(st, 7, r.county);
  BindText(st, 8, r.ticket_type);
  BindText(st, 9, r.duration);
  BindText(st, 10, r.work_type);
  BindText(st, 11, r.excavator);
  BindOptDouble(st, 12, r.coordinates ? std::optional<double>(r.coordinates->latitude) : std::nullopt);
  BindOptDouble(st, 13, r.coordinates ? std::optional<double>(r.coordinates->longitude) : std::nullopt);
  BindOptDouble(st, 14, r.confidence);
  BindText(st, 15, r.technique);
  BindText(st, 16, r.approach);
  BindText(st, 17, r.rationale);
  BindText(st, 18, r.error_message);
  BindText(st, 19, std::string(geocache::model::ToString(r.quality_tier)));
  BindText(st, 20, std::string(geocache::model::ToString(r.review_priority)));
  BindText(st, 21, model::EncodeFlags(r.validation_flags));
  BindU64(st, 22, r.version);
  BindOptU64(st, 23, r.supersedes_record_id);
  sqlite3_bind_int(st, 24, r.is_current ? 1 : 0);
  BindU64(st, 25, r.created_at_ms);
  BindText(st, 26, r.created_by_stage);
  sqlite3_bind_int(st, 27, r.locked ? 1 : 0);
  BindText(st, 28, r.lock_reason);
  BindOptU64(st, 29, r.locked_at_ms);
  BindText(st, 30, r.locked_by);
  BindText(st, 31, model::EncodeMetadata(r.metadata));
  BindOptDouble(st, 32, r.processing_time_ms);
}

model::GeocodeRecord ReadRecord(sqlite3_stmt* st) {
  model::GeocodeRecord r;
  r.record_id    = ColU64(st, 0);
  r.ticket_key   = ColText(st, 1);
  r.record_key   = ColText(st, 2);
  r.street       = ColText(st, 3);
  r.intersection = ColText(st, 4);
  r.city         = ColText(st, 5);
  r.county       = ColText(st, 6);
  r.ticket_type  = ColText(st, 7);
  r.duration     = ColText(st, 8);
  r.work_type    = ColText(st, 9);
  r.excavator    = ColText(st, 10);

  const auto lat = ColOptDouble(st, 11);
  const auto lon = ColOptDouble(st, 12);
  if (lat && lon) {
    r.coordinates = geocache::model::Coordinates{*lat, *lon};
  }
  r.confidence    = ColOptDouble(st, 13);
  r.technique     = ColText(st, 14);
  r.approach      = ColText(st, 15);
  r.rationale     = ColText(st, 16);
  r.error_message = ColText(st, 17);

  r.quality_tier     = geocache::model::ParseQualityTier(ColText(st, 18)).value_or(geocache::model::QualityTier::kFailed);
  r.review_priority  = geocache::model::ParseReviewPriority(ColText(st, 19)).value_or(geocache::model::ReviewPriority::kNone);
  r.validation_flags = model::DecodeFlags(ColText(st, 20));

  r.version              = ColU64(st, 21);
  r.supersedes_record_id = ColOptU64(st, 22);
  r.is_current           = sqlite3_column_int(st, 23) != 0;
  r.created_at_ms        = ColU64(st, 24);
  r.created_by_stage     = ColText(st, 25);

  r.locked       = sqlite3_column_int(st, 26) != 0;
  r.lock_reason  = ColText(st, 27);
  r.locked_at_ms = ColOptU64(st, 28);
  r.locked_by    = ColText(st, 29);

  r.metadata           = model::DecodeMetadata(ColText(st, 30));
  r.processing_time_ms = ColOptDouble(st, 31);
  return r;
}

std::vector<model::GeocodeRecord> ReadRecords(sqlite3_stmt* st) {
  std::vector<model::GeocodeRecord> out;
  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadRecord(st));
  }
  return out;
}

void BindRun(sqlite3_stmt* st, int first, const model::RunRecord& r) {
  BindText(st, first, r.pipeline_name);
  BindText(st, first + 1, r.status);
  BindU64(st, first + 2, r.started_at_ms);
  BindOptU64(st, first + 3, r.finished_at_ms);
  BindU64(st, first + 4, r.ticket_count);
  BindText(st, first + 5, r.config_json.empty() ? "{}" : r.config_json);
  BindText(st, first + 6, r.results_json.empty() ? "{}" : r.results_json);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Geocode records
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecord(Transaction& t, model::GeocodeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_RECORD);
  BindRecord(st.get(), r);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (r.record_id == 0) {
    r.record_id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return Result::Ok();
}

std::optional<model::GeocodeRecord> SqliteRepository::GetCurrent(Transaction& t, const std::string& ticket_key) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_CURRENT);
  BindText(st.get(), 1, ticket_key);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRecord(st.get());
}

std::optional<model::GeocodeRecord> SqliteRepository::GetCurrentByRecordKey(Transaction& t, const std::string& record_key) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_CURRENT_BY_RECORD_KEY);
  BindText(st.get(), 1, record_key);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRecord(st.get());
}

std::vector<model::GeocodeRecord> SqliteRepository::GetHistory(Transaction& t, const std::string& ticket_key) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_HISTORY);
  BindText(st.get(), 1, ticket_key);
  return ReadRecords(st.get());
}

Result SqliteRepository::RetireRecord(Transaction& t, uint64_t record_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::RETIRE_RECORD);
  BindU64(st.get(), 1, record_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::UpdateLock(Transaction& t, const model::GeocodeRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_LOCK);
  sqlite3_bind_int(st.get(), 1, r.locked ? 1 : 0);
  BindText(st.get(), 2, r.lock_reason);
  BindOptU64(st.get(), 3, r.locked_at_ms);
  BindText(st.get(), 4, r.locked_by);
  BindU64(st.get(), 5, r.record_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::GeocodeRecord> SqliteRepository::ListCurrent(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_ALL_CURRENT);
  return ReadRecords(st.get());
}

std::vector<model::GeocodeRecord> SqliteRepository::ListAll(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_ALL);
  return ReadRecords(st.get());
}

uint64_t SqliteRepository::CountVersions(Transaction& t) {
  auto st = Prepare(TX(t).Handle(), sql::COUNT_RECORDS);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

Result SqliteRepository::DeleteAllRecords(Transaction& t) {
  auto*     db = TX(t).Handle();
  auto      st = Prepare(db, sql::DELETE_RECORDS);
  const int rc = sqlite3_step(st.get());
  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Run history
// ------------------------------------------------------------------

Result SqliteRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_RUN);
  BindText(st.get(), 1, r.run_id);
  BindRun(st.get(), 2, r);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_RUN);
  BindRun(st.get(), 1, r);
  BindText(st.get(), 8, r.run_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::RunRecord> SqliteRepository::ListRuns(Transaction& t, std::size_t limit) {
  auto st = Prepare(TX(t).Handle(), sql::SELECT_RUNS);
  BindU64(st.get(), 1, limit);

  std::vector<model::RunRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::RunRecord r;
    r.run_id         = ColText(st.get(), 0);
    r.pipeline_name  = ColText(st.get(), 1);
    r.status         = ColText(st.get(), 2);
    r.started_at_ms  = ColU64(st.get(), 3);
    r.finished_at_ms = ColOptU64(st.get(), 4);
    r.ticket_count   = ColU64(st.get(), 5);
    r.config_json    = ColText(st.get(), 6);
    r.results_json   = ColText(st.get(), 7);
    out.push_back(std::move(r));
  }
  return out;
}

Result SqliteRepository::DeleteAllRuns(Transaction& t) {
  auto*     db = TX(t).Handle();
  auto      st = Prepare(db, sql::DELETE_RUNS);
  const int rc = sqlite3_step(st.get());
  return Translate(db, rc);
}

} // namespace geocache::db::sqlite
