#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"

namespace geocache::testing {

/*
  Memory repository whose InsertRecord reports an I/O error while armed.
  Every other call, RetireRecord included, goes through, so an Append
  fails after the previous version was retired inside its transaction.
*/
class FailingInsertRepository final : public db::Repository {
 public:
  void Arm(bool armed) {
    armed_ = armed;
  }

  int FailedInserts() const {
    return failed_inserts_.load();
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_.Begin();
  }

  db::Result InsertRecord(db::Transaction& tx, db::model::GeocodeRecord& record) override {
    if (armed_) {
      failed_inserts_++;
      return db::Result::Err(db::ErrorCode::IOError, "disk full");
    }
    return inner_.InsertRecord(tx, record);
  }

  std::optional<db::model::GeocodeRecord> GetCurrent(db::Transaction& tx, const std::string& key) override {
    return inner_.GetCurrent(tx, key);
  }
  std::optional<db::model::GeocodeRecord> GetCurrentByRecordKey(db::Transaction& tx, const std::string& key) override {
    return inner_.GetCurrentByRecordKey(tx, key);
  }
  std::vector<db::model::GeocodeRecord> GetHistory(db::Transaction& tx, const std::string& key) override {
    return inner_.GetHistory(tx, key);
  }
  db::Result RetireRecord(db::Transaction& tx, uint64_t record_id) override {
    return inner_.RetireRecord(tx, record_id);
  }
  db::Result UpdateLock(db::Transaction& tx, const db::model::GeocodeRecord& record) override {
    return inner_.UpdateLock(tx, record);
  }
  std::vector<db::model::GeocodeRecord> ListCurrent(db::Transaction& tx) override {
    return inner_.ListCurrent(tx);
  }
  std::vector<db::model::GeocodeRecord> ListAll(db::Transaction& tx) override {
    return inner_.ListAll(tx);
  }
  uint64_t CountVersions(db::Transaction& tx) override {
    return inner_.CountVersions(tx);
  }
  db::Result DeleteAllRecords(db::Transaction& tx) override {
    return inner_.DeleteAllRecords(tx);
  }

  db::Result InsertRun(db::Transaction& tx, const db::model::RunRecord& run) override {
    return inner_.InsertRun(tx, run);
  }
  db::Result UpdateRun(db::Transaction& tx, const db::model::RunRecord& run) override {
    return inner_.UpdateRun(tx, run);
  }
  std::vector<db::model::RunRecord> ListRuns(db::Transaction& tx, std::size_t limit) override {
    return inner_.ListRuns(tx, limit);
  }
  db::Result DeleteAllRuns(db::Transaction& tx) override {
    return inner_.DeleteAllRuns(tx);
  }

 private:
  db::memory::MemoryRepository inner_;
  std::atomic<bool>            armed_{false};
  std::atomic<int>             failed_inserts_{0};
};

} // namespace geocache::testing
