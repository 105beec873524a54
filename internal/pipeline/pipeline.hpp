#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/record_store.hpp"
#include "internal/model/ticket.hpp"
#include "internal/pipeline/pipeline_state.hpp"
#include "internal/quality/quality_assessor.hpp"
#include "internal/stage/stage.hpp"
#include "internal/validation/validation_engine.hpp"

namespace geocache::pipeline {

struct StageStatistics {
  std::string stage_id;

  uint64_t total_tickets = 0;
  uint64_t processed     = 0; // succeeded + failed
  uint64_t skipped       = 0;
  uint64_t succeeded     = 0;
  uint64_t failed        = 0;
  uint64_t improved      = 0; // stored tier better than the prior current tier

  double total_time_ms = 0.0;

  double AverageTimeMs() const {
    return processed == 0 ? 0.0 : total_time_ms / static_cast<double>(processed);
  }
};

struct PipelineResult {
  std::string   run_id;
  std::string   pipeline_name;
  PipelineState state = PipelineState::kIdle;
  std::string   abort_reason;

  // Computed from the stored current records of the distinct input tickets.
  uint64_t total_tickets   = 0;
  uint64_t total_succeeded = 0;
  uint64_t total_failed    = 0;
  uint64_t total_skipped   = 0; // sum over stages

  uint64_t started_at_ms  = 0;
  uint64_t finished_at_ms = 0;
  double   total_time_ms  = 0.0;

  std::vector<StageStatistics> stages;
};

struct PipelineOptions {
  std::string name = "geocache";
  bool        fail_fast = false;
  uint32_t    workers   = 1;
  std::string config_json; // recorded in run history
};

/*
  Runs stages in order over a ticket batch.

  Per stage and ticket: skip decision against the current record, then
  Process -> Validate -> Assess -> Append. Failures are stored as FAILED
  versions and never stop the batch unless fail_fast is set, in which
  case the pipeline aborts after the first stage that had failures.

  Within a stage tickets are spread over `workers` threads.
*/
class Pipeline {
 public:
  Pipeline(PipelineOptions options, std::shared_ptr<cache::RecordStore> store,
           std::shared_ptr<const validation::ValidationEngine> validator, std::shared_ptr<const quality::QualityAssessor> assessor,
           std::vector<std::unique_ptr<stage::Stage>> stages);

  PipelineResult Run(const std::vector<model::TicketInput>& tickets);

  // Stops scheduling further tickets and stages; the run ends Aborted.
  void RequestStop();

  PipelineState State() const;

  // Index of the stage being run, meaningful while Running.
  std::size_t CurrentStage() const {
    return current_stage_.load();
  }

  std::size_t StageCount() const {
    return stages_.size();
  }

  const PipelineOptions& Options() const {
    return options_;
  }

 private:
  enum class Outcome { kSkipped, kSucceeded, kFailed };

  struct TicketResult {
    Outcome outcome  = Outcome::kFailed;
    bool    improved = false;
    double  time_ms  = 0.0;
  };

  void            Transition(PipelineState to);
  StageStatistics RunStage(stage::Stage& stage, const std::vector<model::TicketInput>& tickets);
  TicketResult    ProcessTicket(stage::Stage& stage, const model::TicketInput& ticket);
  void            AppendFailure(stage::Stage& stage, const model::TicketInput& ticket, const std::string& error, double time_ms);
  void            Summarize(PipelineResult& result, const std::vector<model::TicketInput>& tickets);
  void            RecordRunStart(const PipelineResult& result, uint64_t ticket_count);
  void            RecordRunEnd(const PipelineResult& result, uint64_t ticket_count);

  PipelineOptions                                     options_;
  std::shared_ptr<cache::RecordStore>                 store_;
  std::shared_ptr<const validation::ValidationEngine> validator_;
  std::shared_ptr<const quality::QualityAssessor>     assessor_;
  std::vector<std::unique_ptr<stage::Stage>>          stages_;

  mutable std::mutex       state_mutex_;
  PipelineState            state_ = PipelineState::kIdle;
  std::atomic<bool>        stop_requested_{false};
  std::atomic<std::size_t> current_stage_{0};
};

// JSON object with the run totals and per-stage statistics.
std::string ResultToJson(const PipelineResult& result);

} // namespace geocache::pipeline
