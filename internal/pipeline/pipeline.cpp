#include "pipeline.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <thread>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reprocess/reprocessing_decider.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace geocache::pipeline {

using db::model::GeocodeRecord;
using observability::DoubleField;
using observability::IntField;
using observability::StringField;

namespace {

using SteadyClock = std::chrono::steady_clock;

double ElapsedMs(SteadyClock::time_point start) {
  return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

std::string OutcomeName(bool skipped, bool succeeded) {
  if (skipped) return "skipped";
  return succeeded ? "succeeded" : "failed";
}

// Input snapshot shared by success and failure records.
GeocodeRecord SnapshotInput(const model::TicketInput& ticket) {
  GeocodeRecord r;
  r.ticket_key   = ticket.ticket_key;
  r.record_key   = util::RecordKey(ticket.street, ticket.intersection, ticket.city, ticket.county);
  r.street       = ticket.street;
  r.intersection = ticket.intersection;
  r.city         = ticket.city;
  r.county       = ticket.county;
  r.ticket_type  = ticket.ticket_type.value_or("");
  r.duration     = ticket.duration.value_or("");
  r.work_type    = ticket.work_type.value_or("");
  r.excavator    = ticket.excavator.value_or("");
  return r;
}

google::protobuf::Value Number(double v) {
  google::protobuf::Value value;
  value.set_number_value(v);
  return value;
}

} // namespace

Pipeline::Pipeline(PipelineOptions options, std::shared_ptr<cache::RecordStore> store,
                   std::shared_ptr<const validation::ValidationEngine> validator, std::shared_ptr<const quality::QualityAssessor> assessor,
                   std::vector<std::unique_ptr<stage::Stage>> stages)
    : options_(std::move(options)),
      store_(std::move(store)),
      validator_(std::move(validator)),
      assessor_(std::move(assessor)),
      stages_(std::move(stages)) {
  if (!store_ || !validator_ || !assessor_) {
    throw util::ConfigurationError("pipeline requires a record store, a validation engine and a quality assessor");
  }
  if (options_.workers == 0) {
    options_.workers = 1;
  }
}

PipelineState Pipeline::State() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

void Pipeline::Transition(PipelineState to) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!CanTransition(state_, to)) {
    throw util::InvalidState(fmt::format("pipeline {}: cannot go from {} to {}", options_.name, ToString(state_), ToString(to)));
  }
  state_ = to;
}

void Pipeline::RequestStop() {
  stop_requested_ = true;
  GEOCACHE_LOG_INFO("pipeline stop requested", {StringField("pipeline", options_.name)});
}

// ------------------------------------------------------------------
// Run
// ------------------------------------------------------------------

PipelineResult Pipeline::Run(const std::vector<model::TicketInput>& tickets) {
  Transition(PipelineState::kRunning);
  stop_requested_ = false;
  current_stage_  = 0;

  observability::SpanScope span("geocache.pipeline.run");
  span.SetAttribute("pipeline", options_.name);
  span.SetAttribute("tickets", static_cast<std::int64_t>(tickets.size()));

  const auto     start = SteadyClock::now();
  PipelineResult result;
  result.run_id        = util::GenerateRunId();
  result.pipeline_name = options_.name;
  result.started_at_ms = util::NowMillis();

  GEOCACHE_LOG_INFO("pipeline started", {StringField("pipeline", options_.name), StringField("run_id", result.run_id),
                                         IntField("tickets", static_cast<int64_t>(tickets.size())),
                                         IntField("stages", static_cast<int64_t>(stages_.size()))});
  RecordRunStart(result, tickets.size());

  try {
    for (std::size_t i = 0; i < stages_.size(); ++i) {
      if (stop_requested_) {
        result.abort_reason = "stop requested";
        break;
      }
      current_stage_ = i;

      auto& stage = *stages_[i];
      auto  stats = RunStage(stage, tickets);
      result.stages.push_back(stats);

      GEOCACHE_LOG_INFO("stage finished",
                        {StringField("stage", stats.stage_id), IntField("processed", static_cast<int64_t>(stats.processed)),
                         IntField("succeeded", static_cast<int64_t>(stats.succeeded)),
                         IntField("skipped", static_cast<int64_t>(stats.skipped)), IntField("failed", static_cast<int64_t>(stats.failed)),
                         IntField("improved", static_cast<int64_t>(stats.improved)), DoubleField("avg_ms", stats.AverageTimeMs())});

      if (options_.fail_fast && stats.failed > 0) {
        result.abort_reason = fmt::format("fail_fast: {} tickets failed in stage {}", stats.failed, stats.stage_id);
        GEOCACHE_LOG_WARN("pipeline stopping", {StringField("pipeline", options_.name), StringField("reason", result.abort_reason)});
        break;
      }
    }
    if (result.abort_reason.empty() && stop_requested_) {
      result.abort_reason = "stop requested";
    }

    Summarize(result, tickets);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    Transition(PipelineState::kAborted);
    result.state        = PipelineState::kAborted;
    result.abort_reason = e.what();
    RecordRunEnd(result, tickets.size());
    throw;
  }

  result.state          = result.abort_reason.empty() ? PipelineState::kCompleted : PipelineState::kAborted;
  result.finished_at_ms = util::NowMillis();
  result.total_time_ms  = ElapsedMs(start);
  Transition(result.state);
  RecordRunEnd(result, tickets.size());

  span.SetAttribute("state", std::string(ToString(result.state)));
  GEOCACHE_LOG_INFO("pipeline finished",
                    {StringField("pipeline", options_.name), StringField("run_id", result.run_id),
                     StringField("state", ToString(result.state)), IntField("tickets", static_cast<int64_t>(result.total_tickets)),
                     IntField("succeeded", static_cast<int64_t>(result.total_succeeded)),
                     IntField("failed", static_cast<int64_t>(result.total_failed)),
                     IntField("skipped", static_cast<int64_t>(result.total_skipped)), DoubleField("total_ms", result.total_time_ms)});
  return result;
}

void Pipeline::Summarize(PipelineResult& result, const std::vector<model::TicketInput>& tickets) {
  for (const auto& stats : result.stages) {
    result.total_skipped += stats.skipped;
  }

  std::set<std::string> distinct;
  for (const auto& t : tickets) {
    distinct.insert(t.ticket_key);
  }
  result.total_tickets = distinct.size();

  for (const auto& ticket_key : distinct) {
    const auto current = store_->GetCurrent(ticket_key);
    if (!current) continue;
    if (current->quality_tier == model::QualityTier::kFailed) {
      result.total_failed++;
    } else {
      result.total_succeeded++;
    }
  }
}

// ------------------------------------------------------------------
// Stage
// ------------------------------------------------------------------

StageStatistics Pipeline::RunStage(stage::Stage& stage, const std::vector<model::TicketInput>& tickets) {
  observability::SpanScope span("geocache.pipeline.stage");
  span.SetAttribute("stage", stage.Id());

  const auto      start = SteadyClock::now();
  StageStatistics stats;
  stats.stage_id      = stage.Id();
  stats.total_tickets = tickets.size();

  // a ticket key is handled once per stage whatever the worker count;
  // later copies in the batch count as skipped
  std::vector<std::size_t>        work;
  std::unordered_set<std::string> seen;
  work.reserve(tickets.size());
  for (std::size_t i = 0; i < tickets.size(); ++i) {
    if (seen.insert(tickets[i].ticket_key).second) work.push_back(i);
  }
  stats.skipped = tickets.size() - work.size();
  if (stats.skipped > 0) {
    GEOCACHE_LOG_DEBUG("duplicate tickets skipped", {StringField("stage", stage.Id()), IntField("count", static_cast<int64_t>(stats.skipped))});
  }

  std::mutex               stats_mutex;
  std::atomic<std::size_t> next{0};

  auto worker = [&] {
    while (!stop_requested_) {
      const std::size_t slot = next.fetch_add(1);
      if (slot >= work.size()) break;

      const auto outcome = ProcessTicket(stage, tickets[work[slot]]);

      std::lock_guard<std::mutex> lock(stats_mutex);
      switch (outcome.outcome) {
        case Outcome::kSkipped:
          stats.skipped++;
          break;
        case Outcome::kSucceeded:
          stats.processed++;
          stats.succeeded++;
          stats.total_time_ms += outcome.time_ms;
          break;
        case Outcome::kFailed:
          stats.processed++;
          stats.failed++;
          stats.total_time_ms += outcome.time_ms;
          break;
      }
      if (outcome.improved) stats.improved++;
    }
  };

  const std::size_t thread_count = std::min<std::size_t>(options_.workers, work.size());
  if (thread_count <= 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
      threads.emplace_back(worker);
    }
    for (auto& t : threads) {
      t.join();
    }
  }

  const double duration_ms = ElapsedMs(start);
  observability::Metrics::Instance().ObserveStageDurationMs(stage.Id(), duration_ms);
  span.SetAttribute("failed", static_cast<std::int64_t>(stats.failed));
  return stats;
}

// ------------------------------------------------------------------
// Ticket
// ------------------------------------------------------------------

Pipeline::TicketResult Pipeline::ProcessTicket(stage::Stage& stage, const model::TicketInput& ticket) {
  const auto   start = SteadyClock::now();
  auto&        metrics = observability::Metrics::Instance();
  TicketResult result;

  auto finish = [&](Outcome outcome) {
    result.outcome = outcome;
    result.time_ms = ElapsedMs(start);
    metrics.RecordTicketOutcome(stage.Id(), OutcomeName(outcome == Outcome::kSkipped, outcome == Outcome::kSucceeded));
    if (outcome != Outcome::kSkipped) {
      metrics.ObserveTicketLatencyMs(stage.Id(), result.time_ms);
    }
    return result;
  };

  std::string error;
  try {
    const auto current  = store_->GetCurrent(ticket.ticket_key);
    const auto decision = reprocess::ReprocessingDecider::ShouldSkip(current, stage.Id(), stage.Config().skip_rules);
    if (decision.skip) {
      GEOCACHE_LOG_DEBUG("ticket skipped", {StringField("stage", stage.Id()), StringField("ticket", ticket.ticket_key),
                                            StringField("reason", decision.reason)});
      return finish(Outcome::kSkipped);
    }

    auto attempt = stage.Process(ticket);
    if (!attempt.coordinates || !model::IsValid(*attempt.coordinates)) {
      throw util::StageFailure("stage returned missing or out-of-range coordinates");
    }
    if (attempt.confidence < 0.0 || attempt.confidence > 1.0) {
      throw util::StageFailure(fmt::format("stage returned confidence {} outside [0, 1]", attempt.confidence));
    }

    GeocodeRecord record = SnapshotInput(ticket);
    record.coordinates   = attempt.coordinates;
    record.confidence    = attempt.confidence;
    record.technique     = attempt.technique.empty() ? stage.Config().technique : attempt.technique;
    record.approach      = attempt.approach;
    record.rationale     = attempt.rationale;
    record.metadata      = attempt.metadata;

    validation::ValidationInput input;
    input.coordinates  = record.coordinates;
    input.confidence   = record.confidence;
    input.technique    = record.technique;
    input.approach     = record.approach;
    input.street       = record.street;
    input.intersection = record.intersection;
    input.city         = record.city;
    input.county       = record.county;
    input.ticket_type  = record.ticket_type;
    record.validation_flags = validation::ValidationEngine::Codes(validator_->Validate(input));

    record.quality_tier =
        assessor_->Tier(record.confidence, record.technique, record.approach, record.validation_flags, record.ticket_type);
    record.review_priority =
        assessor_->Priority(record.confidence, record.quality_tier, record.validation_flags, record.ticket_type, record.approach);

    // a FAILED record carries no position; keep what the stage proposed for review
    if (record.quality_tier == model::QualityTier::kFailed) {
      record.metadata["rejected_latitude"]  = fmt::format("{:.6f}", record.coordinates->latitude);
      record.metadata["rejected_longitude"] = fmt::format("{:.6f}", record.coordinates->longitude);
      record.coordinates.reset();
    }

    record.processing_time_ms = ElapsedMs(start);
    store_->Append(record, stage.Id());
    metrics.RecordStoredTier(stage.Id(), model::ToString(record.quality_tier));

    result.improved = !current ? record.quality_tier != model::QualityTier::kFailed : record.quality_tier > current->quality_tier;
    return finish(Outcome::kSucceeded);
  } catch (const util::RecordLocked& e) {
    // locked between the skip decision and the append
    GEOCACHE_LOG_DEBUG("ticket skipped", {StringField("stage", stage.Id()), StringField("ticket", ticket.ticket_key),
                                          StringField("reason", e.what())});
    return finish(Outcome::kSkipped);
  } catch (const std::exception& e) {
    error = e.what();
  }

  GEOCACHE_LOG_WARN("ticket failed", {StringField("stage", stage.Id()), StringField("ticket", ticket.ticket_key),
                                      StringField("error", error)});
  AppendFailure(stage, ticket, error, ElapsedMs(start));
  return finish(Outcome::kFailed);
}

void Pipeline::AppendFailure(stage::Stage& stage, const model::TicketInput& ticket, const std::string& error, double time_ms) {
  GeocodeRecord record      = SnapshotInput(ticket);
  record.technique          = stage.Id();
  record.error_message      = error;
  record.quality_tier       = model::QualityTier::kFailed;
  record.review_priority    = assessor_->Priority(std::nullopt, record.quality_tier, {}, record.ticket_type, record.approach);
  record.processing_time_ms = time_ms;

  try {
    store_->Append(record, stage.Id());
  } catch (const std::exception& e) {
    // the ticket is still counted as failed
    GEOCACHE_LOG_ERROR("failed to store failure record", {StringField("stage", stage.Id()), StringField("ticket", ticket.ticket_key),
                                                          StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Run history
// ------------------------------------------------------------------

void Pipeline::RecordRunStart(const PipelineResult& result, uint64_t ticket_count) {
  db::model::RunRecord run;
  run.run_id        = result.run_id;
  run.pipeline_name = result.pipeline_name;
  run.status        = std::string(ToString(PipelineState::kRunning));
  run.started_at_ms = result.started_at_ms;
  run.ticket_count  = ticket_count;
  run.config_json   = options_.config_json;
  try {
    store_->RecordRun(run);
  } catch (const std::exception& e) {
    GEOCACHE_LOG_WARN("could not record pipeline run", {StringField("run_id", run.run_id), StringField("error", e.what())});
  }
}

void Pipeline::RecordRunEnd(const PipelineResult& result, uint64_t ticket_count) {
  db::model::RunRecord run;
  run.run_id         = result.run_id;
  run.pipeline_name  = result.pipeline_name;
  run.status         = std::string(ToString(result.state));
  run.started_at_ms  = result.started_at_ms;
  run.finished_at_ms = result.finished_at_ms == 0 ? util::NowMillis() : result.finished_at_ms;
  run.ticket_count   = ticket_count;
  run.config_json    = options_.config_json;
  try {
    run.results_json = ResultToJson(result);
    store_->UpdateRun(run);
  } catch (const std::exception& e) {
    GEOCACHE_LOG_WARN("could not update pipeline run", {StringField("run_id", run.run_id), StringField("error", e.what())});
  }
}

std::string ResultToJson(const PipelineResult& result) {
  google::protobuf::Struct root;
  auto&                    fields = *root.mutable_fields();
  fields["run_id"].set_string_value(result.run_id);
  fields["pipeline"].set_string_value(result.pipeline_name);
  fields["state"].set_string_value(std::string(ToString(result.state)));
  if (!result.abort_reason.empty()) {
    fields["abort_reason"].set_string_value(result.abort_reason);
  }
  fields["total_tickets"]   = Number(static_cast<double>(result.total_tickets));
  fields["total_succeeded"] = Number(static_cast<double>(result.total_succeeded));
  fields["total_failed"]    = Number(static_cast<double>(result.total_failed));
  fields["total_skipped"]   = Number(static_cast<double>(result.total_skipped));
  fields["total_time_ms"]   = Number(result.total_time_ms);
  fields["start_time"].set_string_value(util::ToIso8601(result.started_at_ms));
  if (result.finished_at_ms != 0) {
    fields["end_time"].set_string_value(util::ToIso8601(result.finished_at_ms));
  }

  auto* stages = fields["stages"].mutable_list_value();
  for (const auto& s : result.stages) {
    auto& stage = *stages->add_values()->mutable_struct_value()->mutable_fields();
    stage["stage"].set_string_value(s.stage_id);
    stage["total_tickets"] = Number(static_cast<double>(s.total_tickets));
    stage["processed"]     = Number(static_cast<double>(s.processed));
    stage["skipped"]       = Number(static_cast<double>(s.skipped));
    stage["succeeded"]     = Number(static_cast<double>(s.succeeded));
    stage["failed"]        = Number(static_cast<double>(s.failed));
    stage["improved"]      = Number(static_cast<double>(s.improved));
    stage["total_time_ms"] = Number(s.total_time_ms);
    stage["avg_time_ms"]   = Number(s.AverageTimeMs());
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!status.ok()) {
    throw std::runtime_error("encode pipeline result: " + std::string(status.message()));
  }
  return json;
}

} // namespace geocache::pipeline
