#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace geocache::db::memory {

namespace {

bool ByTicketThenVersion(const model::GeocodeRecord& a, const model::GeocodeRecord& b) {
  if (a.ticket_key != b.ticket_key) return a.ticket_key < b.ticket_key;
  return a.version < b.version;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Merged view
// ------------------------------------------------------------------

std::optional<model::GeocodeRecord> MemoryRepository::Lookup(const MemoryTransaction& tx, uint64_t record_id) const {
  if (const auto it = tx.written_.find(record_id); it != tx.written_.end()) return it->second;
  if (tx.records_cleared_) return std::nullopt;
  if (const auto it = committed_.records.find(record_id); it != committed_.records.end()) return it->second;
  return std::nullopt;
}

std::optional<uint64_t> MemoryRepository::CurrentId(const MemoryTransaction& tx, const std::string& ticket_key) const {
  if (const auto mine = tx.written_by_ticket_.find(ticket_key); mine != tx.written_by_ticket_.end()) {
    for (uint64_t id : mine->second) {
      if (tx.written_.at(id).is_current) return id;
    }
  }
  if (tx.records_cleared_) return std::nullopt;

  const auto it = committed_.current_by_ticket.find(ticket_key);
  if (it == committed_.current_by_ticket.end()) return std::nullopt;
  // retired inside this transaction
  if (tx.written_.contains(it->second)) return std::nullopt;
  return it->second;
}

std::map<uint64_t, uint64_t> MemoryRepository::Versions(const MemoryTransaction& tx, const std::string& ticket_key) const {
  std::map<uint64_t, uint64_t> versions;
  if (!tx.records_cleared_) {
    if (const auto it = committed_.versions_by_ticket.find(ticket_key); it != committed_.versions_by_ticket.end()) {
      versions = it->second;
    }
  }
  if (const auto mine = tx.written_by_ticket_.find(ticket_key); mine != tx.written_by_ticket_.end()) {
    for (uint64_t id : mine->second) {
      versions[tx.written_.at(id).version] = id;
    }
  }
  return versions;
}

std::vector<model::GeocodeRecord> MemoryRepository::Merged(const MemoryTransaction& tx, bool current_only) const {
  std::vector<model::GeocodeRecord> out;
  if (!tx.records_cleared_) {
    if (current_only) {
      for (const auto& [_, record_id] : committed_.current_by_ticket) {
        if (!tx.written_.contains(record_id)) out.push_back(committed_.records.at(record_id));
      }
    } else {
      for (const auto& [record_id, record] : committed_.records) {
        if (!tx.written_.contains(record_id)) out.push_back(record);
      }
    }
  }
  for (const auto& [_, record] : tx.written_) {
    if (!current_only || record.is_current) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), ByTicketThenVersion);
  return out;
}

std::optional<model::RunRecord> MemoryRepository::LookupRun(const MemoryTransaction& tx, const std::string& run_id) const {
  if (const auto it = tx.runs_written_.find(run_id); it != tx.runs_written_.end()) return it->second;
  if (tx.runs_cleared_) return std::nullopt;
  if (const auto it = committed_.runs.find(run_id); it != committed_.runs.end()) return it->second;
  return std::nullopt;
}

// ------------------------------------------------------------------
// Geocode records
// ------------------------------------------------------------------

Result MemoryRepository::InsertRecord(Transaction& t, model::GeocodeRecord& r) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);
  tx.Observe(r.ticket_key);

  if (Versions(tx, r.ticket_key).contains(r.version)) {
    return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: geocode_cache.ticket_key, geocode_cache.version");
  }
  if (r.is_current && CurrentId(tx, r.ticket_key)) {
    return Result::Err(ErrorCode::ConstraintViolation, "UNIQUE constraint failed: geocode_cache.ticket_key (current)");
  }

  if (r.record_id == 0) {
    r.record_id = next_record_id_++;
  } else if (Lookup(tx, r.record_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "record id " + std::to_string(r.record_id) + " already exists");
  } else {
    next_record_id_ = std::max(next_record_id_, r.record_id + 1);
  }

  tx.inserted_ids_.insert(r.record_id);
  tx.Write(r);
  return Result::Ok();
}

std::optional<model::GeocodeRecord> MemoryRepository::GetCurrent(Transaction& t, const std::string& ticket_key) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);
  tx.Observe(ticket_key);

  const auto id = CurrentId(tx, ticket_key);
  if (!id) return std::nullopt;
  return Lookup(tx, *id);
}

std::optional<model::GeocodeRecord> MemoryRepository::GetCurrentByRecordKey(Transaction& t, const std::string& record_key) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  std::optional<model::GeocodeRecord> best;
  for (auto& record : Merged(tx, true)) {
    if (record.record_key != record_key) continue;
    if (!best || record.created_at_ms > best->created_at_ms ||
        (record.created_at_ms == best->created_at_ms && record.record_id > best->record_id)) {
      best = std::move(record);
    }
  }
  return best;
}

std::vector<model::GeocodeRecord> MemoryRepository::GetHistory(Transaction& t, const std::string& ticket_key) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);
  tx.Observe(ticket_key);

  const auto                        versions = Versions(tx, ticket_key);
  std::vector<model::GeocodeRecord> out;
  out.reserve(versions.size());
  for (auto v = versions.rbegin(); v != versions.rend(); ++v) {
    if (auto record = Lookup(tx, v->second)) out.push_back(std::move(*record));
  }
  return out;
}

Result MemoryRepository::RetireRecord(Transaction& t, uint64_t record_id) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  auto record = Lookup(tx, record_id);
  if (!record) return Result::Err(ErrorCode::NotFound);

  tx.Observe(record->ticket_key);
  record->is_current = false;
  tx.Write(*record);
  return Result::Ok();
}

Result MemoryRepository::UpdateLock(Transaction& t, const model::GeocodeRecord& r) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  auto record = Lookup(tx, r.record_id);
  if (!record) return Result::Err(ErrorCode::NotFound);

  tx.Observe(record->ticket_key);
  record->locked       = r.locked;
  record->lock_reason  = r.lock_reason;
  record->locked_at_ms = r.locked_at_ms;
  record->locked_by    = r.locked_by;
  tx.Write(*record);
  return Result::Ok();
}

std::vector<model::GeocodeRecord> MemoryRepository::ListCurrent(Transaction& t) {
  std::scoped_lock lock(mutex_);
  return Merged(TX(t), true);
}

std::vector<model::GeocodeRecord> MemoryRepository::ListAll(Transaction& t) {
  std::scoped_lock lock(mutex_);
  return Merged(TX(t), false);
}

uint64_t MemoryRepository::CountVersions(Transaction& t) {
  const auto&      tx = TX(t);
  std::scoped_lock lock(mutex_);
  if (tx.records_cleared_) return tx.written_.size();

  uint64_t count = committed_.records.size();
  for (const auto& [record_id, _] : tx.written_) {
    if (!committed_.records.contains(record_id)) count++;
  }
  return count;
}

Result MemoryRepository::DeleteAllRecords(Transaction& t) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);
  tx.records_cleared_ = true;
  tx.written_.clear();
  tx.written_by_ticket_.clear();
  tx.inserted_ids_.clear();
  tx.dirty_ = true;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Run history
// ------------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, const model::RunRecord& r) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);
  if (LookupRun(tx, r.run_id)) return Result::Err(ErrorCode::AlreadyExists);

  tx.runs_written_[r.run_id] = r;
  tx.runs_inserted_.push_back(r.run_id);
  tx.dirty_ = true;
  return Result::Ok();
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);
  if (!LookupRun(tx, r.run_id)) return Result::Err(ErrorCode::NotFound);

  tx.runs_written_[r.run_id] = r;
  tx.dirty_                  = true;
  return Result::Ok();
}

std::vector<model::RunRecord> MemoryRepository::ListRuns(Transaction& t, std::size_t limit) {
  const auto&      tx = TX(t);
  std::scoped_lock lock(mutex_);

  std::vector<std::string> order;
  if (!tx.runs_cleared_) order = committed_.run_order;
  order.insert(order.end(), tx.runs_inserted_.begin(), tx.runs_inserted_.end());

  std::vector<model::RunRecord> out;
  for (auto it = order.rbegin(); it != order.rend() && out.size() < limit; ++it) {
    if (auto run = LookupRun(tx, *it)) out.push_back(std::move(*run));
  }
  return out;
}

Result MemoryRepository::DeleteAllRuns(Transaction& t) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);
  tx.runs_cleared_ = true;
  tx.runs_written_.clear();
  tx.runs_inserted_.clear();
  tx.dirty_ = true;
  return Result::Ok();
}

} // namespace geocache::db::memory
