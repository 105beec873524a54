#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace geocache::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  records_epoch_ = repo_.records_epoch_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Observe(const std::string& ticket_key) {
  if (observed_.contains(ticket_key)) return;
  const auto it          = repo_.ticket_commits_.find(ticket_key);
  observed_[ticket_key] = it == repo_.ticket_commits_.end() ? 0 : it->second;
}

void MemoryTransaction::Write(const model::GeocodeRecord& record) {
  written_[record.record_id] = record;
  written_by_ticket_[record.ticket_key].insert(record.record_id);
  dirty_ = true;
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  if (!dirty_) {
    committed_ = true;
    return;
  }

  auto& state = repo_.committed_;
  if (records_epoch_ != repo_.records_epoch_) {
    throw util::TransactionConflict("transaction conflict: records were cleared by a concurrent transaction");
  }
  for (const auto& [ticket_key, seen] : observed_) {
    const auto it = repo_.ticket_commits_.find(ticket_key);
    if ((it == repo_.ticket_commits_.end() ? 0 : it->second) != seen) {
      throw util::TransactionConflict("transaction conflict: ticket " + ticket_key + " was modified by a concurrent transaction");
    }
  }
  if (!records_cleared_) {
    for (uint64_t id : inserted_ids_) {
      if (state.records.contains(id)) {
        throw util::TransactionConflict("transaction conflict: record id " + std::to_string(id) + " was taken concurrently");
      }
    }
  }
  if (!runs_cleared_) {
    for (const auto& run_id : runs_inserted_) {
      if (state.runs.contains(run_id)) {
        throw util::TransactionConflict("transaction conflict: run " + run_id + " was recorded concurrently");
      }
    }
  }

  // ---- apply ----
  if (records_cleared_) {
    state.records.clear();
    state.current_by_ticket.clear();
    state.versions_by_ticket.clear();
    repo_.records_epoch_++;
  }
  // retirements first so a new current row is never erased by its predecessor
  for (const auto& [record_id, row] : written_) {
    const auto current = state.current_by_ticket.find(row.ticket_key);
    if (!row.is_current && current != state.current_by_ticket.end() && current->second == record_id) {
      state.current_by_ticket.erase(current);
    }
    state.versions_by_ticket[row.ticket_key][row.version] = record_id;
    state.records[record_id]                               = row;
  }
  for (const auto& [record_id, row] : written_) {
    if (row.is_current) state.current_by_ticket[row.ticket_key] = record_id;
  }
  for (const auto& [ticket_key, _] : written_by_ticket_) {
    repo_.ticket_commits_[ticket_key]++;
  }

  if (runs_cleared_) {
    state.runs.clear();
    state.run_order.clear();
  }
  for (const auto& run_id : runs_inserted_) {
    state.run_order.push_back(run_id);
  }
  for (const auto& [run_id, run] : runs_written_) {
    state.runs[run_id] = run;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace geocache::db::memory
