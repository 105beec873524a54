#pragma once

#include <string>

#include "internal/model/attempt.hpp"
#include "internal/model/ticket.hpp"
#include "internal/stage/stage_config.hpp"

namespace geocache::stage {

/*
  One geocoding technique.

  Process is a blocking call and must be safe to invoke from several
  worker threads at once. It returns an attempt or throws
  util::StageFailure. Whether a ticket is offered to the stage at all is
  decided by the pipeline, never by the stage.
*/
class Stage {
 public:
  virtual ~Stage() = default;

  const std::string& Id() const {
    return Config().id;
  }

  virtual const StageConfig& Config() const = 0;

  virtual model::StageAttempt Process(const model::TicketInput& ticket) = 0;
};

} // namespace geocache::stage
