#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/geocode_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using geocache::db::Repository;
using geocache::db::memory::MemoryRepository;
using geocache::db::model::GeocodeRecord;
using geocache::db::model::RunRecord;
using geocache::model::QualityTier;
using geocache::model::ReviewPriority;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

GeocodeRecord MakeRecord(const std::string& ticket_key, uint64_t version) {
  GeocodeRecord r;
  r.ticket_key       = ticket_key;
  r.record_key       = "key-" + ticket_key;
  r.street           = "Main St";
  r.intersection     = "Oak Ave";
  r.city             = "Kermit";
  r.county           = "Winkler";
  r.ticket_type      = "Emergency";
  r.duration         = "1 DAY";
  r.work_type        = "Pole replacement";
  r.excavator        = "Acme Utility";
  r.coordinates      = geocache::model::Coordinates{31.8576, -103.0930};
  r.confidence       = 0.7125;
  r.technique        = "ROAD_INTERSECTION";
  r.approach         = "intersection";
  r.rationale        = "matched \"Main St\" and Oak Ave";
  r.quality_tier     = QualityTier::kAcceptable;
  r.review_priority  = ReviewPriority::kHigh;
  r.validation_flags = {"emergency_low_confidence", "low_confidence"};
  r.version          = version;
  r.is_current       = true;
  r.created_at_ms    = NowMs();
  r.created_by_stage = "roads";
  r.metadata         = {{"nearest_road", "FM 874"}, {"note", "line1\nline2"}};
  r.processing_time_ms = 12.5;
  return r;
}

void AssertSameContent(const GeocodeRecord& a, const GeocodeRecord& b) {
  assert(a.record_id == b.record_id);
  assert(a.ticket_key == b.ticket_key);
  assert(a.record_key == b.record_key);
  assert(a.street == b.street && a.intersection == b.intersection && a.city == b.city && a.county == b.county);
  assert(a.ticket_type == b.ticket_type && a.duration == b.duration && a.work_type == b.work_type && a.excavator == b.excavator);
  assert(a.coordinates.has_value() == b.coordinates.has_value());
  if (a.coordinates) {
    assert(a.coordinates->latitude == b.coordinates->latitude);
    assert(a.coordinates->longitude == b.coordinates->longitude);
  }
  assert(a.confidence == b.confidence);
  assert(a.technique == b.technique && a.approach == b.approach && a.rationale == b.rationale);
  assert(a.error_message == b.error_message);
  assert(a.quality_tier == b.quality_tier && a.review_priority == b.review_priority);
  assert(a.validation_flags == b.validation_flags);
  assert(a.version == b.version && a.supersedes_record_id == b.supersedes_record_id && a.is_current == b.is_current);
  assert(a.created_at_ms == b.created_at_ms && a.created_by_stage == b.created_by_stage);
  assert(a.locked == b.locked && a.lock_reason == b.lock_reason && a.locked_at_ms == b.locked_at_ms && a.locked_by == b.locked_by);
  assert(a.metadata == b.metadata);
  assert(a.processing_time_ms == b.processing_time_ms);
}

void VerifyInsertAndRead(Repository& repo, const std::string& ticket) {
  auto tx = repo.Begin();

  auto record = MakeRecord(ticket, 1);
  assert(repo.InsertRecord(*tx, record));
  assert(record.record_id != 0);

  const auto current = repo.GetCurrent(*tx, ticket);
  assert(current.has_value());
  AssertSameContent(*current, record);

  const auto by_key = repo.GetCurrentByRecordKey(*tx, record.record_key);
  assert(by_key.has_value() && by_key->record_id == record.record_id);

  tx->Commit();
}

void VerifyVersionChain(Repository& repo, const std::string& ticket) {
  uint64_t first_id = 0;
  {
    auto tx    = repo.Begin();
    auto first = MakeRecord(ticket, 1);
    assert(repo.InsertRecord(*tx, first));
    first_id = first.record_id;
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.RetireRecord(*tx, first_id));

    auto second                 = MakeRecord(ticket, 2);
    second.supersedes_record_id = first_id;
    second.coordinates.reset();
    second.confidence.reset();
    second.quality_tier    = QualityTier::kFailed;
    second.review_priority = ReviewPriority::kCritical;
    second.error_message   = "no centroid registered";
    second.validation_flags.clear();
    second.metadata.clear();
    second.processing_time_ms.reset();
    assert(repo.InsertRecord(*tx, second));

    const auto current = repo.GetCurrent(*tx, ticket);
    AssertSameContent(*current, second);
    tx->Commit();
  }

  auto       tx      = repo.Begin();
  const auto history = repo.GetHistory(*tx, ticket);
  assert(history.size() == 2);
  assert(history[0].version == 2 && history[0].is_current);
  assert(history[1].version == 1 && !history[1].is_current);
  assert(history[1].record_id == first_id);
  tx->Commit();
}

void VerifyConstraints(Repository& repo, const std::string& ticket) {
  {
    auto tx    = repo.Begin();
    auto first = MakeRecord(ticket, 1);
    assert(repo.InsertRecord(*tx, first));
    tx->Commit();
  }

  // a second current row for the same ticket is refused
  {
    auto tx     = repo.Begin();
    auto second = MakeRecord(ticket, 2);
    assert(!repo.InsertRecord(*tx, second));
    tx->Rollback();
  }

  // so is a duplicate version
  {
    auto tx        = repo.Begin();
    auto duplicate = MakeRecord(ticket, 1);
    duplicate.is_current = false;
    assert(!repo.InsertRecord(*tx, duplicate));
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(repo.GetHistory(*tx, ticket).size() == 1);
  tx->Commit();
}

void VerifyLockUpdate(Repository& repo, const std::string& ticket) {
  auto tx     = repo.Begin();
  auto record = MakeRecord(ticket, 1);
  assert(repo.InsertRecord(*tx, record));

  record.locked       = true;
  record.lock_reason  = "verified";
  record.locked_at_ms = NowMs();
  record.locked_by    = "analyst";
  assert(repo.UpdateLock(*tx, record));

  const auto locked = repo.GetCurrent(*tx, ticket);
  assert(locked->locked && locked->lock_reason == "verified" && locked->locked_by == "analyst");
  assert(locked->locked_at_ms == record.locked_at_ms);

  GeocodeRecord missing;
  missing.record_id = record.record_id + 1000000;
  assert(!repo.UpdateLock(*tx, missing));
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& ticket) {
  {
    auto tx     = repo.Begin();
    auto record = MakeRecord(ticket, 1);
    assert(repo.InsertRecord(*tx, record));
    tx->Rollback();
  }

  // destructor without commit rolls back too
  {
    auto tx     = repo.Begin();
    auto record = MakeRecord(ticket, 1);
    assert(repo.InsertRecord(*tx, record));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetCurrent(*check_tx, ticket).has_value());
  check_tx->Commit();
}

void VerifyExplicitIds(Repository& repo, const std::string& ticket) {
  auto tx = repo.Begin();

  auto imported      = MakeRecord(ticket, 1);
  imported.record_id = 900000 + NowMs() % 100000;
  assert(repo.InsertRecord(*tx, imported));

  auto clash      = MakeRecord(ticket + "-clash", 1);
  clash.record_id = imported.record_id;
  assert(!repo.InsertRecord(*tx, clash));
  tx->Rollback();
}

void VerifyRunHistory(Repository& repo, const std::string& run_id) {
  RunRecord run;
  run.run_id        = run_id;
  run.pipeline_name = "parity";
  run.status        = "running";
  run.started_at_ms = NowMs();
  run.ticket_count  = 4;
  run.config_json   = R"({"name":"parity"})";

  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, run));
    tx->Commit();
  }

  run.status         = "completed";
  run.finished_at_ms = run.started_at_ms + 10;
  run.results_json   = R"({"total_tickets":4})";
  {
    auto tx = repo.Begin();
    assert(repo.UpdateRun(*tx, run));
    tx->Commit();
  }

  auto       tx   = repo.Begin();
  const auto runs = repo.ListRuns(*tx, 1);
  assert(runs.size() == 1);
  assert(runs[0].run_id == run_id);
  assert(runs[0].status == "completed");
  assert(runs[0].finished_at_ms == run.finished_at_ms);
  assert(runs[0].ticket_count == 4);
  tx->Commit();
}

void VerifyConcurrentWriters(Repository& repo, const std::string& prefix) {
  constexpr int kThreads = 4;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&repo, &prefix, t] {
      for (int attempt = 0;; ++attempt) {
        try {
          auto tx     = repo.Begin();
          auto record = MakeRecord(prefix + "-" + std::to_string(t), 1);
          assert(repo.InsertRecord(*tx, record));
          tx->Commit();
          return;
        } catch (const geocache::util::TransactionConflict&) {
          assert(attempt < 100);
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  auto tx = repo.Begin();
  for (int t = 0; t < kThreads; ++t) {
    assert(repo.GetCurrent(*tx, prefix + "-" + std::to_string(t)).has_value());
  }
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& ticket) {
  if (!backend.supports_restart()) {
    return;
  }

  auto          repo = backend.make_repository();
  GeocodeRecord written;
  {
    auto tx = repo->Begin();
    written = MakeRecord(ticket, 1);
    assert(repo->InsertRecord(*tx, written));
    tx->Commit();
  }

  backend.restart(repo);

  auto       tx      = repo->Begin();
  const auto current = repo->GetCurrent(*tx, ticket);
  assert(current.has_value());
  AssertSameContent(*current, written);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if GEOCACHE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("geocache_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    geocache::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return geocache::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart =
          [make_repo](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = make_repo();
          },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if GEOCACHE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("GEOCACHE_TEST_POSTGRES_URI");
  if (!uri || std::string(uri).empty()) {
    throw std::runtime_error("GEOCACHE_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    geocache::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(8);
    return geocache::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

// Memory transactions conflict only when they touch the same ticket.
void VerifyMemoryConflictsArePerTicket() {
  MemoryRepository repo;

  auto first  = repo.Begin();
  auto second = repo.Begin();
  auto a      = MakeRecord("overlap-a", 1);
  auto b      = MakeRecord("overlap-b", 1);
  assert(repo.InsertRecord(*first, a));
  assert(repo.InsertRecord(*second, b));
  assert(a.record_id != b.record_id);
  first->Commit();
  second->Commit();

  auto later = repo.Begin();
  auto other = repo.Begin();
  auto c     = MakeRecord("overlap-c", 1);
  auto dup   = MakeRecord("overlap-c", 1);
  assert(repo.InsertRecord(*later, c));
  assert(repo.InsertRecord(*other, dup));
  later->Commit();

  bool conflicted = false;
  try {
    other->Commit();
  } catch (const geocache::util::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted && "Concurrent writers on one ticket must conflict.");

  auto tx = repo.Begin();
  assert(repo.ListCurrent(*tx).size() == 3);
  assert(repo.GetHistory(*tx, "overlap-c").size() == 1);
  tx->Commit();
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a shared postgres database can be reused
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyInsertAndRead(*repo, prefix + "-read");
  VerifyVersionChain(*repo, prefix + "-chain");
  VerifyConstraints(*repo, prefix + "-constraints");
  VerifyLockUpdate(*repo, prefix + "-lock");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyExplicitIds(*repo, prefix + "-explicit");
  VerifyRunHistory(*repo, prefix + "-run");
  VerifyConcurrentWriters(*repo, prefix + "-concurrency");

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if GEOCACHE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if GEOCACHE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }
  VerifyMemoryConflictsArePerTicket();

  std::cout << "geocache_integration_repository_parity: pass\n";
  return 0;
}
