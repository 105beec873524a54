#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace geocache::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

std::string ToIso8601(uint64_t unix_ms) {
  const std::time_t seconds = static_cast<std::time_t>(unix_ms / 1000);
  const unsigned    millis  = static_cast<unsigned>(unix_ms % 1000);

  std::tm utc{};
  gmtime_r(&seconds, &utc);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, millis);
  return buffer;
}

uint64_t FromIso8601(const std::string& text) {
  std::tm  utc{};
  unsigned millis = 0;
  const int matched =
      std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3uZ", &utc.tm_year, &utc.tm_mon, &utc.tm_mday, &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &millis);
  if (matched < 6) {
    throw std::invalid_argument("invalid ISO-8601 timestamp: " + text);
  }
  utc.tm_year -= 1900;
  utc.tm_mon -= 1;

  const std::time_t seconds = timegm(&utc);
  if (seconds == static_cast<std::time_t>(-1)) {
    throw std::invalid_argument("invalid ISO-8601 timestamp: " + text);
  }
  return static_cast<uint64_t>(seconds) * 1000 + millis;
}

} // namespace geocache::util
