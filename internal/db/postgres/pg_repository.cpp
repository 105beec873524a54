#include "pg_repository.hpp"

#include "internal/db/model/json_fields.hpp"

namespace geocache::db::postgres {

namespace {

std::optional<double> OptDouble(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<double>();
}

std::optional<uint64_t> OptU64(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<uint64_t>();
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::GeocodeRecord ReadRecord(const pqxx::row& row) {
  model::GeocodeRecord r;
  r.record_id    = row[0].as<uint64_t>();
  r.ticket_key   = Text(row[1]);
  r.record_key   = Text(row[2]);
  r.street       = Text(row[3]);
  r.intersection = Text(row[4]);
  r.city         = Text(row[5]);
  r.county       = Text(row[6]);
  r.ticket_type  = Text(row[7]);
  r.duration     = Text(row[8]);
  r.work_type    = Text(row[9]);
  r.excavator    = Text(row[10]);

  const auto lat = OptDouble(row[11]);
  const auto lon = OptDouble(row[12]);
  if (lat && lon) {
    r.coordinates = geocache::model::Coordinates{*lat, *lon};
  }
  r.confidence    = OptDouble(row[13]);
  r.technique     = Text(row[14]);
  r.approach      = Text(row[15]);
  r.rationale     = Text(row[16]);
  r.error_message = Text(row[17]);

  r.quality_tier     = geocache::model::ParseQualityTier(Text(row[18])).value_or(geocache::model::QualityTier::kFailed);
  r.review_priority  = geocache::model::ParseReviewPriority(Text(row[19])).value_or(geocache::model::ReviewPriority::kNone);
  r.validation_flags = model::DecodeFlags(Text(row[20]));

  r.version              = row[21].as<uint64_t>();
  r.supersedes_record_id = OptU64(row[22]);
  r.is_current           = row[23].as<bool>();
  r.created_at_ms        = row[24].as<uint64_t>();
  r.created_by_stage     = Text(row[25]);

  r.locked       = row[26].as<bool>();
  r.lock_reason  = Text(row[27]);
  r.locked_at_ms = OptU64(row[28]);
  r.locked_by    = Text(row[29]);

  r.metadata           = model::DecodeMetadata(Text(row[30]));
  r.processing_time_ms = OptDouble(row[31]);
  return r;
}

std::vector<model::GeocodeRecord> ReadRecords(const pqxx::result& res) {
  std::vector<model::GeocodeRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRecord(row));
  }
  return out;
}

std::string JsonOrEmpty(const std::string& json) {
  return json.empty() ? "{}" : json;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Geocode records
// ------------------------------------------------------------------

Result PgRepository::InsertRecord(Transaction& t, model::GeocodeRecord& r) {
  try {
    auto&                         work = TX(t).Work();
    const std::optional<uint64_t> explicit_id =
        r.record_id == 0 ? std::nullopt : std::optional<uint64_t>(r.record_id);
    const std::optional<double> lat = r.coordinates ? std::optional<double>(r.coordinates->latitude) : std::nullopt;
    const std::optional<double> lon = r.coordinates ? std::optional<double>(r.coordinates->longitude) : std::nullopt;

    auto res = work.exec_prepared("insert_record", explicit_id, r.ticket_key, r.record_key, r.street, r.intersection, r.city, r.county,
                                  r.ticket_type, r.duration, r.work_type, r.excavator, lat, lon, r.confidence, r.technique, r.approach,
                                  r.rationale, r.error_message, std::string(geocache::model::ToString(r.quality_tier)),
                                  std::string(geocache::model::ToString(r.review_priority)), model::EncodeFlags(r.validation_flags),
                                  r.version, r.supersedes_record_id, r.is_current, r.created_at_ms, r.created_by_stage, r.locked,
                                  r.lock_reason, r.locked_at_ms, r.locked_by, model::EncodeMetadata(r.metadata), r.processing_time_ms);

    if (explicit_id) {
      work.exec_prepared("sync_record_sequence");
    } else {
      r.record_id = res[0][0].as<uint64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::GeocodeRecord> PgRepository::GetCurrent(Transaction& t, const std::string& ticket_key) {
  auto res = TX(t).Work().exec_prepared("get_current", ticket_key);
  if (res.empty()) return std::nullopt;
  return ReadRecord(res[0]);
}

std::optional<model::GeocodeRecord> PgRepository::GetCurrentByRecordKey(Transaction& t, const std::string& record_key) {
  auto res = TX(t).Work().exec_prepared("get_current_by_record_key", record_key);
  if (res.empty()) return std::nullopt;
  return ReadRecord(res[0]);
}

std::vector<model::GeocodeRecord> PgRepository::GetHistory(Transaction& t, const std::string& ticket_key) {
  return ReadRecords(TX(t).Work().exec_prepared("get_history", ticket_key));
}

Result PgRepository::RetireRecord(Transaction& t, uint64_t record_id) {
  try {
    auto res = TX(t).Work().exec_prepared("retire_record", record_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateLock(Transaction& t, const model::GeocodeRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_lock", r.record_id, r.locked, r.lock_reason, r.locked_at_ms, r.locked_by);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::GeocodeRecord> PgRepository::ListCurrent(Transaction& t) {
  return ReadRecords(TX(t).Work().exec_prepared("list_current"));
}

std::vector<model::GeocodeRecord> PgRepository::ListAll(Transaction& t) {
  return ReadRecords(TX(t).Work().exec_prepared("list_all"));
}

uint64_t PgRepository::CountVersions(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COUNT(*) FROM geocode_cache;");
  return res[0][0].as<uint64_t>();
}

Result PgRepository::DeleteAllRecords(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM geocode_cache;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Run history
// ------------------------------------------------------------------

Result PgRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_run", r.run_id, r.pipeline_name, r.status, r.started_at_ms, r.finished_at_ms, r.ticket_count,
                               JsonOrEmpty(r.config_json), JsonOrEmpty(r.results_json));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_run", r.run_id, r.pipeline_name, r.status, r.started_at_ms, r.finished_at_ms,
                                          r.ticket_count, JsonOrEmpty(r.config_json), JsonOrEmpty(r.results_json));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RunRecord> PgRepository::ListRuns(Transaction& t, std::size_t limit) {
  auto res = TX(t).Work().exec_prepared("list_runs", static_cast<uint64_t>(limit));

  std::vector<model::RunRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RunRecord r;
    r.run_id         = Text(row[0]);
    r.pipeline_name  = Text(row[1]);
    r.status         = Text(row[2]);
    r.started_at_ms  = row[3].as<uint64_t>();
    r.finished_at_ms = OptU64(row[4]);
    r.ticket_count   = row[5].as<uint64_t>();
    r.config_json    = Text(row[6]);
    r.results_json   = Text(row[7]);
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteAllRuns(Transaction& t) {
  try {
    TX(t).Work().exec("DELETE FROM pipeline_history;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace geocache::db::postgres
