#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace geocache::util {

/*
  Time utilities. All wall-clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

// UTC, millisecond precision: 2024-03-01T12:00:00.250Z
std::string ToIso8601(uint64_t unix_ms);

// Accepts the format written by ToIso8601. Throws std::invalid_argument.
uint64_t FromIso8601(const std::string& text);

} // namespace geocache::util
