#include "record_store.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"

namespace geocache::cache {

using db::model::GeocodeRecord;
using db::model::RunRecord;

namespace {

constexpr int kMaxCommitAttempts = 32;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto detail  = result.message.empty() ? std::string(db::ToString(result.code)) : result.message;
  const auto message = context + ": " + detail;
  if (result.Retryable()) {
    throw util::TransactionConflict(message);
  }
  if (result.code == db::ErrorCode::NotFound) {
    throw util::NotFound(message);
  }
  throw util::StorageError(message);
}

/*
  Runs fn inside a fresh transaction and commits.

  Conflicts are retried with a new transaction; errors of our own
  vocabulary pass through; anything else a backend throws becomes a
  StorageError.
*/
template <typename Fn>
auto InTransaction(db::Repository& repository, const std::string& context, Fn&& fn) -> std::invoke_result_t<Fn&, db::Transaction&> {
  using R = std::invoke_result_t<Fn&, db::Transaction&>;

  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repository.Begin();
      if constexpr (std::is_void_v<R>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        R result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const util::TransactionConflict& e) {
      observability::Metrics::Instance().RecordStoreConflict();
      if (attempt >= kMaxCommitAttempts) {
        throw util::TransactionConflict(fmt::format("{}: gave up after {} attempts: {}", context, attempt, e.what()));
      }
      if (attempt < 4) {
        std::this_thread::yield();
      } else {
        std::this_thread::sleep_for(std::chrono::microseconds(50 * attempt));
      }
    } catch (const util::NotFound&) {
      throw;
    } catch (const util::RecordLocked&) {
      throw;
    } catch (const util::InvalidRecord&) {
      throw;
    } catch (const util::StorageError&) {
      throw;
    } catch (const std::exception& e) {
      throw util::StorageError(context + ": " + e.what());
    }
  }
}

bool MatchesFilter(const GeocodeRecord& r, const RecordFilter& filter) {
  if (!filter.tiers.empty() && !filter.tiers.contains(r.quality_tier)) return false;
  if (!filter.priorities.empty() && !filter.priorities.contains(r.review_priority)) return false;
  if (filter.min_confidence && (!r.confidence || *r.confidence < *filter.min_confidence)) return false;
  if (filter.max_confidence && (!r.confidence || *r.confidence > *filter.max_confidence)) return false;
  if (filter.locked && r.locked != *filter.locked) return false;
  return true;
}

// Checks one ticket's versions, sorted by version ascending.
void ValidateChain(const std::string& ticket_key, const std::vector<const GeocodeRecord*>& versions) {
  std::size_t current_count = 0;
  for (std::size_t i = 0; i < versions.size(); ++i) {
    const auto& r = *versions[i];
    if (r.version != i + 1) {
      throw util::InvalidRecord(fmt::format("ticket {}: versions must be contiguous from 1 (found {} at position {})", ticket_key,
                                            r.version, i + 1));
    }
    if (i == 0 && r.supersedes_record_id) {
      throw util::InvalidRecord(fmt::format("ticket {}: version 1 may not supersede another record", ticket_key));
    }
    if (i > 0 && r.supersedes_record_id != versions[i - 1]->record_id) {
      throw util::InvalidRecord(fmt::format("ticket {}: version {} must supersede record {}", ticket_key, r.version,
                                            versions[i - 1]->record_id));
    }
    if (r.is_current) {
      ++current_count;
    }
  }
  if (current_count != 1 || !versions.back()->is_current) {
    throw util::InvalidRecord(fmt::format("ticket {}: exactly the newest version must be current", ticket_key));
  }
}

} // namespace

RecordStore::RecordStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw util::ConfigurationError("record store requires a repository");
  }
}

std::shared_ptr<std::shared_mutex> RecordStore::TicketMutex(const std::string& ticket_key) {
  std::lock_guard<std::mutex> lock(ticket_mutexes_guard_);
  auto&                       ticket_mutex = ticket_mutexes_[ticket_key];
  if (!ticket_mutex) {
    ticket_mutex = std::make_shared<std::shared_mutex>();
  }
  return ticket_mutex;
}

std::size_t RecordStore::TrackedTickets() const {
  std::lock_guard<std::mutex> lock(ticket_mutexes_guard_);
  return ticket_mutexes_.size();
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<GeocodeRecord> RecordStore::GetCurrent(const std::string& ticket_key) {
  const auto ticket_mutex = TicketMutex(ticket_key);
  std::shared_lock<std::shared_mutex> ticket_lock(*ticket_mutex);
  return InTransaction(*repository_, "get current record",
                       [&](db::Transaction& tx) { return repository_->GetCurrent(tx, ticket_key); });
}

std::optional<GeocodeRecord> RecordStore::GetCurrentByRecordKey(const std::string& record_key) {
  return InTransaction(*repository_, "get current record by record key",
                       [&](db::Transaction& tx) { return repository_->GetCurrentByRecordKey(tx, record_key); });
}

std::vector<GeocodeRecord> RecordStore::GetHistory(const std::string& ticket_key) {
  const auto ticket_mutex = TicketMutex(ticket_key);
  std::shared_lock<std::shared_mutex> ticket_lock(*ticket_mutex);
  return InTransaction(*repository_, "get history", [&](db::Transaction& tx) { return repository_->GetHistory(tx, ticket_key); });
}

// ------------------------------------------------------------------
// Append
// ------------------------------------------------------------------

uint64_t RecordStore::Append(GeocodeRecord record, const std::string& stage_id) {
  if (record.ticket_key.empty()) {
    throw util::InvalidRecord("append record: ticket_key is required");
  }
  if (record.record_key.empty()) {
    record.record_key = util::RecordKey(record.street, record.intersection, record.city, record.county);
  }

  const auto ticket_mutex = TicketMutex(record.ticket_key);

  std::unique_lock<std::shared_mutex> ticket_lock(*ticket_mutex);

  return InTransaction(*repository_, "append record", [&](db::Transaction& tx) {
    GeocodeRecord row = record;

    const auto current = repository_->GetCurrent(tx, row.ticket_key);
    if (current && current->locked) {
      throw util::RecordLocked(fmt::format("ticket {} is locked ({})", row.ticket_key, current->lock_reason));
    }
    if (current) {
      ThrowIfDbError(repository_->RetireRecord(tx, current->record_id), "retire current record");
    }

    row.record_id            = 0;
    row.version              = current ? current->version + 1 : 1;
    row.supersedes_record_id = current ? std::optional<uint64_t>(current->record_id) : std::nullopt;
    row.is_current           = true;
    row.created_by_stage     = stage_id;
    row.created_at_ms        = util::NowMillis();
    row.locked               = false;
    row.lock_reason.clear();
    row.locked_at_ms.reset();
    row.locked_by.clear();

    ThrowIfDbError(repository_->InsertRecord(tx, row), "insert record");
    return row.record_id;
  });
}

// ------------------------------------------------------------------
// Locking
// ------------------------------------------------------------------

void RecordStore::Lock(const std::string& ticket_key, const std::string& reason, const std::string& actor) {
  const auto ticket_mutex = TicketMutex(ticket_key);
  std::unique_lock<std::shared_mutex> ticket_lock(*ticket_mutex);

  InTransaction(*repository_, "lock record", [&](db::Transaction& tx) {
    auto current = repository_->GetCurrent(tx, ticket_key);
    if (!current) {
      throw util::NotFound(fmt::format("lock record: no record for ticket {}", ticket_key));
    }
    current->locked       = true;
    current->lock_reason  = reason;
    current->locked_at_ms = util::NowMillis();
    current->locked_by    = actor;
    ThrowIfDbError(repository_->UpdateLock(tx, *current), "lock record");
  });

  GEOCACHE_LOG_INFO("record locked", {observability::StringField("ticket", ticket_key), observability::StringField("by", actor),
                                      observability::StringField("reason", reason)});
}

void RecordStore::Unlock(const std::string& ticket_key) {
  const auto ticket_mutex = TicketMutex(ticket_key);
  std::unique_lock<std::shared_mutex> ticket_lock(*ticket_mutex);

  InTransaction(*repository_, "unlock record", [&](db::Transaction& tx) {
    auto current = repository_->GetCurrent(tx, ticket_key);
    if (!current) {
      throw util::NotFound(fmt::format("unlock record: no record for ticket {}", ticket_key));
    }
    current->locked = false;
    current->lock_reason.clear();
    current->locked_at_ms.reset();
    current->locked_by.clear();
    ThrowIfDbError(repository_->UpdateLock(tx, *current), "unlock record");
  });

  GEOCACHE_LOG_INFO("record unlocked", {observability::StringField("ticket", ticket_key)});
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<GeocodeRecord> RecordStore::Query(const RecordFilter& filter) {
  auto current = InTransaction(*repository_, "query records", [&](db::Transaction& tx) { return repository_->ListCurrent(tx); });

  std::vector<GeocodeRecord> out;
  for (auto& r : current) {
    if (filter.limit && out.size() >= *filter.limit) break;
    if (MatchesFilter(r, filter)) {
      out.push_back(std::move(r));
    }
  }
  return out;
}

CacheStatistics RecordStore::Statistics() {
  std::vector<GeocodeRecord> current;
  uint64_t                   versions = 0;
  InTransaction(*repository_, "statistics", [&](db::Transaction& tx) {
    current  = repository_->ListCurrent(tx);
    versions = repository_->CountVersions(tx);
  });

  CacheStatistics                        stats;
  std::map<model::QualityTier, double>   confidence_sum;
  std::map<model::QualityTier, uint64_t> confidence_count;

  stats.total_current_records = current.size();
  stats.total_versions        = versions;
  for (const auto& r : current) {
    stats.counts_by_tier[r.quality_tier]++;
    if (r.locked) stats.locked_count++;
    if (r.confidence) {
      confidence_sum[r.quality_tier] += *r.confidence;
      confidence_count[r.quality_tier]++;
    }
  }
  for (const auto& [tier, count] : confidence_count) {
    stats.average_confidence_by_tier[tier] = confidence_sum[tier] / static_cast<double>(count);
  }
  return stats;
}

std::set<model::ReviewPriority> RecordStore::DefaultReviewPriorities() {
  return {model::ReviewPriority::kLow, model::ReviewPriority::kMedium, model::ReviewPriority::kHigh, model::ReviewPriority::kCritical};
}

std::vector<GeocodeRecord> RecordStore::ReviewQueue(const std::set<model::ReviewPriority>& priorities) {
  RecordFilter filter;
  filter.priorities = priorities;
  if (priorities.empty()) {
    return {};
  }

  auto queue = Query(filter);
  std::stable_sort(queue.begin(), queue.end(), [](const GeocodeRecord& a, const GeocodeRecord& b) {
    if (a.review_priority != b.review_priority) return a.review_priority > b.review_priority;
    return a.ticket_key < b.ticket_key;
  });
  return queue;
}

std::vector<GeocodeRecord> RecordStore::ListAll() {
  return InTransaction(*repository_, "list all records", [&](db::Transaction& tx) { return repository_->ListAll(tx); });
}

// ------------------------------------------------------------------
// Import / clear
// ------------------------------------------------------------------

void RecordStore::ImportRecords(const std::vector<GeocodeRecord>& records) {
  std::map<std::string, std::vector<const GeocodeRecord*>> by_ticket;
  std::set<uint64_t>                                       ids;
  for (const auto& r : records) {
    if (r.ticket_key.empty()) {
      throw util::InvalidRecord("import records: ticket_key is required");
    }
    if (r.record_id == 0 || !ids.insert(r.record_id).second) {
      throw util::InvalidRecord(fmt::format("import records: missing or duplicate record id {}", r.record_id));
    }
    by_ticket[r.ticket_key].push_back(&r);
  }
  for (auto& [ticket_key, versions] : by_ticket) {
    std::sort(versions.begin(), versions.end(), [](const GeocodeRecord* a, const GeocodeRecord* b) { return a->version < b->version; });
    ValidateChain(ticket_key, versions);
  }

  InTransaction(*repository_, "import records", [&](db::Transaction& tx) {
    for (const auto& [ticket_key, versions] : by_ticket) {
      if (repository_->GetCurrent(tx, ticket_key)) {
        throw util::InvalidRecord(fmt::format("import records: ticket {} already has records", ticket_key));
      }
      for (const auto* r : versions) {
        GeocodeRecord row = *r;
        ThrowIfDbError(repository_->InsertRecord(tx, row), "import record");
      }
    }
  });

  GEOCACHE_LOG_INFO("records imported", {observability::IntField("records", static_cast<int64_t>(records.size())),
                                         observability::IntField("tickets", static_cast<int64_t>(by_ticket.size()))});
}

void RecordStore::Clear(const std::string& confirmation) {
  if (confirmation != "yes") {
    throw util::InvalidState("clear cache: confirmation token 'yes' is required");
  }

  InTransaction(*repository_, "clear cache", [&](db::Transaction& tx) {
    ThrowIfDbError(repository_->DeleteAllRecords(tx), "delete records");
    ThrowIfDbError(repository_->DeleteAllRuns(tx), "delete runs");
  });

  // entries still referenced belong to callers in flight on that ticket
  {
    std::lock_guard<std::mutex> lock(ticket_mutexes_guard_);
    std::erase_if(ticket_mutexes_, [](const auto& entry) { return entry.second.use_count() == 1; });
  }

  GEOCACHE_LOG_WARN("cache cleared");
}

// ------------------------------------------------------------------
// Run history
// ------------------------------------------------------------------

void RecordStore::RecordRun(const RunRecord& run) {
  InTransaction(*repository_, "record run", [&](db::Transaction& tx) { ThrowIfDbError(repository_->InsertRun(tx, run), "insert run"); });
}

void RecordStore::UpdateRun(const RunRecord& run) {
  InTransaction(*repository_, "update run", [&](db::Transaction& tx) { ThrowIfDbError(repository_->UpdateRun(tx, run), "update run"); });
}

std::vector<RunRecord> RecordStore::ListRuns(std::size_t limit) {
  return InTransaction(*repository_, "list runs", [&](db::Transaction& tx) { return repository_->ListRuns(tx, limit); });
}

} // namespace geocache::cache
