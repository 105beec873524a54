#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace geocache::db::memory {

/*
  Transaction = write overlay over the committed state

  Reads merge the overlay with whatever is committed at the time of the
  read. Every ticket the transaction reads or writes is pinned to the
  per-ticket commit counter seen at first touch. Commit fails with
  util::TransactionConflict when one of those tickets was committed by
  someone else in the meantime, or when the records were cleared. Writers
  on different tickets never conflict. Read-only transactions always
  commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  friend class MemoryRepository;

  // Callers hold repo_.mutex_.
  void Observe(const std::string& ticket_key);
  void Write(const model::GeocodeRecord& record);

  MemoryRepository& repo_;
  uint64_t          records_epoch_ = 0;

  std::map<uint64_t, model::GeocodeRecord>                   written_; // by record_id
  std::unordered_map<std::string, std::set<uint64_t>>        written_by_ticket_;
  std::set<uint64_t>                                         inserted_ids_;
  std::unordered_map<std::string, uint64_t>                  observed_; // ticket -> commit counter
  bool                                                       records_cleared_ = false;

  std::map<std::string, model::RunRecord> runs_written_;
  std::vector<std::string>                runs_inserted_;
  bool                                    runs_cleared_ = false;

  bool dirty_       = false;
  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace geocache::db::memory
