#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/geocode_record.hpp"
#include "internal/db/model/run_record.hpp"

namespace geocache::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - (ticket_key, version) is unique
  - At most one row per ticket_key has is_current = true

  Version-chain logic (retire + insert) lives in the record store; the
  repository only persists rows and enforces the two constraints above.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Geocode records
  // ---------------------------------------------------------------------

  // Assigns record.record_id when it is 0; otherwise inserts with the given id.
  virtual Result InsertRecord(Transaction&, model::GeocodeRecord& record) = 0;

  virtual std::optional<model::GeocodeRecord> GetCurrent(Transaction&, const std::string& ticket_key) = 0;

  // Most recently created current record with this content key.
  virtual std::optional<model::GeocodeRecord> GetCurrentByRecordKey(Transaction&, const std::string& record_key) = 0;

  // Newest version first.
  virtual std::vector<model::GeocodeRecord> GetHistory(Transaction&, const std::string& ticket_key) = 0;

  virtual Result RetireRecord(Transaction&, uint64_t record_id) = 0;

  virtual Result UpdateLock(Transaction&, const model::GeocodeRecord& record) = 0;

  // Ordered by ticket_key.
  virtual std::vector<model::GeocodeRecord> ListCurrent(Transaction&) = 0;

  // Ordered by ticket_key then version.
  virtual std::vector<model::GeocodeRecord> ListAll(Transaction&) = 0;

  virtual uint64_t CountVersions(Transaction&) = 0;

  virtual Result DeleteAllRecords(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Pipeline run history
  // ---------------------------------------------------------------------

  virtual Result InsertRun(Transaction&, const model::RunRecord&) = 0;

  virtual Result UpdateRun(Transaction&, const model::RunRecord&) = 0;

  // Newest first.
  virtual std::vector<model::RunRecord> ListRuns(Transaction&, std::size_t limit) = 0;

  virtual Result DeleteAllRuns(Transaction&) = 0;
};

} // namespace geocache::db
