#include <cassert>
#include <atomic>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/cache/record_store.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "failing_insert_repository.hpp"

namespace {

using geocache::cache::RecordFilter;
using geocache::cache::RecordStore;
using geocache::db::model::GeocodeRecord;
using geocache::model::QualityTier;
using geocache::model::ReviewPriority;

struct StoreFixture {
  std::string                  name;
  std::shared_ptr<RecordStore> store;
  std::filesystem::path        path; // empty for memory
};

StoreFixture MakeMemoryStore() {
  geocache::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  return {"memory", std::make_shared<RecordStore>(geocache::factory::BuildRepository(config)), {}};
}

#if GEOCACHE_DB_SQLITE
StoreFixture MakeSqliteStore(const std::string& test_name) {
  const auto path = std::filesystem::temp_directory_path() / ("geocache_record_store_" + test_name + ".db");
  std::filesystem::remove(path);

  geocache::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(path.string());
  return {"sqlite", std::make_shared<RecordStore>(geocache::factory::BuildRepository(config)), path};
}
#endif

GeocodeRecord MakeResult(const std::string& ticket_key, double confidence, QualityTier tier,
                         ReviewPriority priority = ReviewPriority::kNone) {
  GeocodeRecord r;
  r.ticket_key      = ticket_key;
  r.street          = "Main St";
  r.intersection    = "Oak Ave";
  r.city            = "Kermit";
  r.county          = "Winkler";
  r.ticket_type     = "Normal";
  r.coordinates     = geocache::model::Coordinates{31.8576, -103.0930};
  r.confidence      = confidence;
  r.technique       = "ROAD_INTERSECTION";
  r.approach        = "intersection";
  r.quality_tier    = tier;
  r.review_priority = priority;
  return r;
}

void TestVersionChain(RecordStore& store) {
  assert(!store.GetCurrent("T-1").has_value());
  assert(store.GetHistory("T-1").empty());

  const auto first  = store.Append(MakeResult("T-1", 0.50, QualityTier::kReviewNeeded), "stage_a");
  const auto second = store.Append(MakeResult("T-1", 0.70, QualityTier::kAcceptable), "stage_b");
  const auto third  = store.Append(MakeResult("T-1", 0.95, QualityTier::kExcellent), "stage_c");
  assert(first != second && second != third);

  const auto current = store.GetCurrent("T-1");
  assert(current.has_value());
  assert(current->record_id == third);
  assert(current->version == 3);
  assert(current->is_current);
  assert(current->supersedes_record_id == second);
  assert(current->created_by_stage == "stage_c");
  assert(current->created_at_ms > 0);
  assert(current->record_key == geocache::util::RecordKey("Main St", "Oak Ave", "Kermit", "Winkler"));

  const auto history = store.GetHistory("T-1");
  assert(history.size() == 3);
  for (std::size_t i = 0; i < history.size(); ++i) {
    assert(history[i].version == 3 - i);
    assert(history[i].is_current == (i == 0));
  }
  assert(history[2].record_id == first);
  assert(!history[2].supersedes_record_id.has_value());
}

void TestRecordKeyLookup(RecordStore& store) {
  auto a = MakeResult("T-key-a", 0.80, QualityTier::kGood);
  a.street = "County Rd 110";
  store.Append(a, "stage_a");

  const auto found = store.GetCurrentByRecordKey(geocache::util::RecordKey("COUNTY RD 110", "oak ave", "kermit", "WINKLER"));
  assert(found.has_value());
  assert(found->ticket_key == "T-key-a");
  assert(!store.GetCurrentByRecordKey("no-such-key").has_value());
}

void TestLockBlocksAppend(RecordStore& store) {
  store.Append(MakeResult("T-lock", 0.92, QualityTier::kExcellent), "stage_a");
  store.Lock("T-lock", "verified in field", "analyst");

  auto locked = store.GetCurrent("T-lock");
  assert(locked->locked);
  assert(locked->lock_reason == "verified in field");
  assert(locked->locked_by == "analyst");
  assert(locked->locked_at_ms.has_value());

  bool threw = false;
  try {
    store.Append(MakeResult("T-lock", 0.99, QualityTier::kExcellent), "stage_b");
  } catch (const geocache::util::RecordLocked&) {
    threw = true;
  }
  assert(threw && "Append must refuse a locked ticket.");
  assert(store.GetHistory("T-lock").size() == 1);

  store.Unlock("T-lock");
  assert(!store.GetCurrent("T-lock")->locked);
  store.Append(MakeResult("T-lock", 0.99, QualityTier::kExcellent), "stage_b");
  assert(store.GetCurrent("T-lock")->version == 2);

  threw = false;
  try {
    store.Lock("T-missing", "reason", "analyst");
  } catch (const geocache::util::NotFound&) {
    threw = true;
  }
  assert(threw && "Locking an unknown ticket must throw NotFound.");
}

void TestQueryAndStatistics(RecordStore& store) {
  store.Clear("yes");

  store.Append(MakeResult("Q-1", 0.95, QualityTier::kExcellent), "s");
  store.Append(MakeResult("Q-2", 0.91, QualityTier::kExcellent), "s");
  store.Append(MakeResult("Q-3", 0.70, QualityTier::kAcceptable, ReviewPriority::kLow), "s");
  store.Append(MakeResult("Q-4", 0.45, QualityTier::kReviewNeeded, ReviewPriority::kHigh), "s");
  store.Append(MakeResult("Q-4", 0.55, QualityTier::kReviewNeeded, ReviewPriority::kMedium), "s2");

  auto failed = MakeResult("Q-5", 0.0, QualityTier::kFailed, ReviewPriority::kCritical);
  failed.confidence.reset();
  failed.coordinates.reset();
  failed.error_message = "no centroid registered";
  store.Append(failed, "s");
  store.Lock("Q-1", "ok", "analyst");

  RecordFilter by_tier;
  by_tier.tiers = {QualityTier::kExcellent};
  assert(store.Query(by_tier).size() == 2);

  RecordFilter by_range;
  by_range.min_confidence = 0.50;
  by_range.max_confidence = 0.92;
  const auto ranged = store.Query(by_range);
  assert(ranged.size() == 3);
  assert(ranged[0].ticket_key == "Q-2");

  RecordFilter locked;
  locked.locked = true;
  assert(store.Query(locked).size() == 1);

  RecordFilter limited;
  limited.limit = 2;
  assert(store.Query(limited).size() == 2);

  const auto stats = store.Statistics();
  assert(stats.total_current_records == 5);
  assert(stats.total_versions == 6);
  assert(stats.locked_count == 1);
  assert(stats.counts_by_tier.at(QualityTier::kExcellent) == 2);
  assert(stats.counts_by_tier.at(QualityTier::kFailed) == 1);
  assert(stats.average_confidence_by_tier.at(QualityTier::kExcellent) > 0.929 &&
         stats.average_confidence_by_tier.at(QualityTier::kExcellent) < 0.931);
  // failed record has no confidence
  assert(!stats.average_confidence_by_tier.contains(QualityTier::kFailed));

  const auto queue = store.ReviewQueue();
  assert(queue.size() == 3);
  assert(queue[0].ticket_key == "Q-5");
  assert(queue[1].ticket_key == "Q-4");
  assert(queue[2].ticket_key == "Q-3");

  assert(store.ReviewQueue({ReviewPriority::kCritical}).size() == 1);
  assert(store.ReviewQueue({}).empty());
}

void TestImportValidation(RecordStore& store) {
  store.Clear("yes");
  store.Append(MakeResult("I-1", 0.50, QualityTier::kReviewNeeded), "a");
  store.Append(MakeResult("I-1", 0.80, QualityTier::kGood), "b");
  store.Append(MakeResult("I-2", 0.90, QualityTier::kExcellent), "a");

  const auto exported = store.ListAll();
  assert(exported.size() == 3);
  assert(exported[0].ticket_key == "I-1" && exported[0].version == 1);

  // importing over existing tickets is refused
  bool threw = false;
  try {
    store.ImportRecords(exported);
  } catch (const geocache::util::InvalidRecord&) {
    threw = true;
  }
  assert(threw);

  // a chain whose newest version is not current is refused
  auto broken = exported;
  broken[0].is_current = true;
  broken[1].is_current = false;
  threw                = false;
  try {
    store.ImportRecords(broken);
  } catch (const geocache::util::InvalidRecord&) {
    threw = true;
  }
  assert(threw);

  store.Clear("yes");
  assert(store.Statistics().total_versions == 0);
  store.ImportRecords(exported);

  const auto current = store.GetCurrent("I-1");
  assert(current->version == 2);
  assert(current->record_id == exported[1].record_id);
  assert(current->supersedes_record_id == exported[0].record_id);

  // ids assigned after an import do not collide with imported ones
  const auto next = store.Append(MakeResult("I-2", 0.95, QualityTier::kExcellent), "c");
  for (const auto& r : exported) {
    assert(r.record_id != next);
  }
  assert(store.GetCurrent("I-2")->version == 2);
}

void TestClearRequiresConfirmation(RecordStore& store) {
  store.Append(MakeResult("C-1", 0.90, QualityTier::kExcellent), "a");

  bool threw = false;
  try {
    store.Clear("no");
  } catch (const geocache::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(store.GetCurrent("C-1").has_value());

  store.Clear("yes");
  assert(!store.GetCurrent("C-1").has_value());
  assert(store.ListRuns().empty());
}

void TestRunHistory(RecordStore& store) {
  geocache::db::model::RunRecord run;
  run.run_id        = "run-1";
  run.pipeline_name = "p";
  run.status        = "running";
  run.started_at_ms = 1000;
  run.ticket_count  = 3;
  run.config_json   = "{\"name\":\"p\"}";
  store.RecordRun(run);

  run.status         = "completed";
  run.finished_at_ms = 2000;
  run.results_json   = "{\"total_tickets\":3}";
  store.UpdateRun(run);

  geocache::db::model::RunRecord second = run;
  second.run_id = "run-2";
  second.status = "running";
  second.finished_at_ms.reset();
  second.results_json.clear();
  store.RecordRun(second);

  const auto runs = store.ListRuns();
  assert(runs.size() == 2);
  assert(runs[0].run_id == "run-2");
  assert(runs[1].status == "completed");
  assert(runs[1].finished_at_ms == 2000u);
  assert(store.ListRuns(1).size() == 1);
}

void TestConcurrentAppendsKeepChainIntact(RecordStore& store) {
  constexpr int kThreads   = 4;
  constexpr int kPerThread = 10;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, t] {
      for (int i = 0; i < kPerThread; ++i) {
        // half the threads share one ticket, the rest write their own
        const std::string key = (t % 2 == 0) ? "shared" : "own-" + std::to_string(t);
        store.Append(MakeResult(key, 0.80, QualityTier::kGood), "worker-" + std::to_string(t));
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  const auto shared = store.GetHistory("shared");
  assert(shared.size() == static_cast<std::size_t>(kThreads / 2 * kPerThread));
  int current_count = 0;
  for (std::size_t i = 0; i < shared.size(); ++i) {
    assert(shared[i].version == shared.size() - i);
    if (shared[i].is_current) ++current_count;
    if (i + 1 < shared.size()) {
      assert(shared[i].supersedes_record_id == shared[i + 1].record_id);
    }
  }
  assert(current_count == 1);
  assert(store.GetCurrent("own-1")->version == static_cast<uint64_t>(kPerThread));
}

void TestTicketMutexesArePruned(RecordStore& store) {
  for (int i = 0; i < 8; ++i) {
    store.Append(MakeResult("M-" + std::to_string(i), 0.80, QualityTier::kGood), "a");
  }
  assert(store.TrackedTickets() > 0);

  store.Clear("yes");
  assert(store.TrackedTickets() == 0);

  store.Append(MakeResult("M-0", 0.80, QualityTier::kGood), "a");
  assert(store.GetCurrent("M-0")->version == 1);
}

void RunStoreSuite(const std::function<StoreFixture(const std::string&)>& make) {
  struct Case {
    const char* name;
    void (*fn)(RecordStore&);
  };
  const Case cases[] = {
      {"version_chain", TestVersionChain},
      {"record_key", TestRecordKeyLookup},
      {"lock", TestLockBlocksAppend},
      {"query", TestQueryAndStatistics},
      {"import", TestImportValidation},
      {"clear", TestClearRequiresConfirmation},
      {"runs", TestRunHistory},
      {"concurrency", TestConcurrentAppendsKeepChainIntact},
      {"ticket_mutexes", TestTicketMutexesArePruned},
  };

  for (const auto& c : cases) {
    auto fixture = make(c.name);
    std::cout << "running " << fixture.name << " " << c.name << "\n";
    c.fn(*fixture.store);
    fixture.store.reset();
    if (!fixture.path.empty()) {
      std::filesystem::remove(fixture.path);
      std::filesystem::remove(fixture.path.string() + "-wal");
      std::filesystem::remove(fixture.path.string() + "-shm");
    }
  }
}

// Writers on distinct tickets never exhaust the conflict retries.
void TestManyWritersOnDistinctTickets() {
  constexpr int kThreads   = 16;
  constexpr int kPerThread = 200;

  auto store = MakeMemoryStore().store;

  std::atomic<int>         errors{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, &errors, t] {
      for (int i = 0; i < kPerThread; ++i) {
        try {
          store->Append(MakeResult("D-" + std::to_string(t) + "-" + std::to_string(i), 0.80, QualityTier::kGood),
                        "worker-" + std::to_string(t));
        } catch (const std::exception& e) {
          std::cerr << "append failed: " << e.what() << "\n";
          errors++;
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }

  assert(errors == 0);
  const auto stats = store->Statistics();
  assert(stats.total_current_records == static_cast<uint64_t>(kThreads * kPerThread));
  assert(stats.total_versions == static_cast<uint64_t>(kThreads * kPerThread));
}

void TestFailedInsertKeepsPriorVersion() {
  auto repository = std::make_shared<geocache::testing::FailingInsertRepository>();
  RecordStore store(repository);

  const auto first = store.Append(MakeResult("F-1", 0.80, QualityTier::kGood), "stage_a");

  repository->Arm(true);
  bool threw = false;
  try {
    store.Append(MakeResult("F-1", 0.95, QualityTier::kExcellent), "stage_b");
  } catch (const geocache::util::StorageError& e) {
    threw = std::string(e.what()) == "insert record: disk full";
  }
  assert(threw && "A failed insert must surface as StorageError.");
  assert(repository->FailedInserts() == 1);

  // the retirement made in the same transaction was rolled back
  const auto current = store.GetCurrent("F-1");
  assert(current.has_value());
  assert(current->record_id == first);
  assert(current->is_current);
  assert(current->created_by_stage == "stage_a");

  const auto history = store.GetHistory("F-1");
  assert(history.size() == 1);
  assert(history[0].is_current);

  repository->Arm(false);
  store.Append(MakeResult("F-1", 0.95, QualityTier::kExcellent), "stage_b");
  assert(store.GetCurrent("F-1")->version == 2);
  assert(store.GetCurrent("F-1")->supersedes_record_id == first);
}

} // namespace

int main() {
  RunStoreSuite([](const std::string&) { return MakeMemoryStore(); });
  TestManyWritersOnDistinctTickets();
  TestFailedInsertKeepsPriorVersion();
#if GEOCACHE_DB_SQLITE
  RunStoreSuite([](const std::string& name) { return MakeSqliteStore(name); });
#endif

  std::cout << "geocache_unit_record_store: pass\n";
  return 0;
}
