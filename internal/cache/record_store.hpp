#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/geocode_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/model/quality.hpp"

namespace geocache::cache {

struct RecordFilter {
  std::set<model::QualityTier>    tiers;      // empty = any
  std::set<model::ReviewPriority> priorities; // empty = any
  std::optional<double>           min_confidence;
  std::optional<double>           max_confidence;
  std::optional<bool>             locked;
  std::optional<std::size_t>      limit;
};

struct CacheStatistics {
  uint64_t total_current_records = 0;
  uint64_t total_versions        = 0;
  uint64_t locked_count          = 0;

  std::map<model::QualityTier, uint64_t> counts_by_tier;
  // Only records with a confidence contribute.
  std::map<model::QualityTier, double> average_confidence_by_tier;
};

/*
  Versioned geocode cache on top of a db::Repository.

  Every mutation runs in one backend transaction. Operations on the same
  ticket key are serialized by a per-key mutex; different keys proceed in
  parallel and rely on the backend for isolation. Commits that lose an
  optimistic race (util::TransactionConflict) are retried.

  Backend failures surface as util::StorageError.
*/
class RecordStore {
 public:
  explicit RecordStore(std::shared_ptr<db::Repository> repository);

  std::optional<db::model::GeocodeRecord> GetCurrent(const std::string& ticket_key);
  std::optional<db::model::GeocodeRecord> GetCurrentByRecordKey(const std::string& record_key);

  // Newest version first.
  std::vector<db::model::GeocodeRecord> GetHistory(const std::string& ticket_key);

  /*
    Stores `record` as the new current version of record.ticket_key.

    Retires the previous current record, assigns version and supersedes id,
    and stamps created_by_stage / created_at. Throws util::RecordLocked if
    the current version is locked. Returns the new record id.
  */
  uint64_t Append(db::model::GeocodeRecord record, const std::string& stage_id);

  void Lock(const std::string& ticket_key, const std::string& reason, const std::string& actor);
  void Unlock(const std::string& ticket_key);

  // Current records ordered by ticket key.
  std::vector<db::model::GeocodeRecord> Query(const RecordFilter& filter);

  CacheStatistics Statistics();

  // Most urgent first, ties by ticket key.
  std::vector<db::model::GeocodeRecord> ReviewQueue(const std::set<model::ReviewPriority>& priorities = DefaultReviewPriorities());

  static std::set<model::ReviewPriority> DefaultReviewPriorities();

  // All versions, ordered by ticket key then version.
  std::vector<db::model::GeocodeRecord> ListAll();

  /*
    Writes a complete version set (e.g. from a tabular import) as is.

    Record ids, versions and current flags are preserved. The batch must
    satisfy the version-chain invariants and may not touch tickets that
    already have records. Throws util::InvalidRecord otherwise.
  */
  void ImportRecords(const std::vector<db::model::GeocodeRecord>& records);

  // Number of per-ticket mutexes currently held by the store.
  std::size_t TrackedTickets() const;

  // Deletes every record and run. `confirmation` must be "yes".
  void Clear(const std::string& confirmation);

  // ------------------------------------------------------------------
  // Run history
  // ------------------------------------------------------------------

  void                               RecordRun(const db::model::RunRecord& run);
  void                               UpdateRun(const db::model::RunRecord& run);
  std::vector<db::model::RunRecord> ListRuns(std::size_t limit = 20);

 private:
  // Hold the returned pointer for as long as the mutex is locked; Clear
  // drops entries nobody else references.
  std::shared_ptr<std::shared_mutex> TicketMutex(const std::string& ticket_key);

  std::shared_ptr<db::Repository> repository_;

  mutable std::mutex                                                          ticket_mutexes_guard_;
  mutable std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> ticket_mutexes_;
};

} // namespace geocache::cache
