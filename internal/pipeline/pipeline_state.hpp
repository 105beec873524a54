#pragma once

#include <cstdint>
#include <string_view>

namespace geocache::pipeline {

enum class PipelineState : std::uint8_t {
  kIdle      = 0,
  kRunning   = 1,
  kCompleted = 2,
  kAborted   = 3,
};

constexpr bool IsTerminal(PipelineState state) {
  return state == PipelineState::kCompleted || state == PipelineState::kAborted;
}

// A finished pipeline may be run again; a running one may not be re-entered.
constexpr bool CanTransition(PipelineState from, PipelineState to) {
  if (to == PipelineState::kRunning) {
    return from == PipelineState::kIdle || IsTerminal(from);
  }
  if (IsTerminal(to)) {
    return from == PipelineState::kRunning;
  }
  return false;
}

constexpr std::string_view ToString(PipelineState state) {
  switch (state) {
    case PipelineState::kRunning:
      return "running";
    case PipelineState::kCompleted:
      return "completed";
    case PipelineState::kAborted:
      return "aborted";
    case PipelineState::kIdle:
    default:
      return "idle";
  }
}

} // namespace geocache::pipeline
