#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace geocache::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRecord(Transaction&, model::GeocodeRecord&) override;
  std::optional<model::GeocodeRecord> GetCurrent(Transaction&, const std::string&) override;
  std::optional<model::GeocodeRecord> GetCurrentByRecordKey(Transaction&, const std::string&) override;
  std::vector<model::GeocodeRecord> GetHistory(Transaction&, const std::string&) override;
  Result RetireRecord(Transaction&, uint64_t) override;
  Result UpdateLock(Transaction&, const model::GeocodeRecord&) override;
  std::vector<model::GeocodeRecord> ListCurrent(Transaction&) override;
  std::vector<model::GeocodeRecord> ListAll(Transaction&) override;
  uint64_t CountVersions(Transaction&) override;
  Result DeleteAllRecords(Transaction&) override;

  Result InsertRun(Transaction&, const model::RunRecord&) override;
  Result UpdateRun(Transaction&, const model::RunRecord&) override;
  std::vector<model::RunRecord> ListRuns(Transaction&, std::size_t) override;
  Result DeleteAllRuns(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<uint64_t, model::GeocodeRecord> records; // by record_id
    std::unordered_map<std::string, uint64_t> current_by_ticket;
    std::unordered_map<std::string, std::map<uint64_t, uint64_t>> versions_by_ticket; // version -> record_id

    std::unordered_map<std::string, model::RunRecord> runs;
    std::vector<std::string> run_order; // insertion order
  };

  // Merged view of the committed state and one transaction's writes.
  // Callers hold mutex_.
  std::optional<model::GeocodeRecord> Lookup(const MemoryTransaction& tx, uint64_t record_id) const;
  std::optional<uint64_t> CurrentId(const MemoryTransaction& tx, const std::string& ticket_key) const;
  std::map<uint64_t, uint64_t> Versions(const MemoryTransaction& tx, const std::string& ticket_key) const;
  std::vector<model::GeocodeRecord> Merged(const MemoryTransaction& tx, bool current_only) const;
  std::optional<model::RunRecord> LookupRun(const MemoryTransaction& tx, const std::string& run_id) const;

  mutable std::mutex mutex_;
  State              committed_;
  std::unordered_map<std::string, uint64_t> ticket_commits_; // bumped per committed write to a ticket
  uint64_t           records_epoch_  = 0;                    // bumped by a committed clear
  uint64_t           next_record_id_ = 1;
};

} // namespace geocache::db::memory
