#include "time_util.hpp"
#include <cstdio>
#include <ctime>

namespace common {

Timestamp nowMillis() {
  return std::chrono::floor<std::chrono::milliseconds>(Clock::now());
}

int64_t toUnixMillis(Timestamp ts) {
  return static_cast<int64_t>(ts.time_since_epoch().count());
}

Timestamp fromUnixMillis(int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

std::string toIso8601(Timestamp ts) {
  auto secs = std::chrono::floor<std::chrono::seconds>(ts);
  auto millis = (ts - secs).count();
  std::time_t t = Clock::to_time_t(secs);

  std::tm tm{};
  gmtime_r(&t, &tm);

  char date_buffer[32];
  std::strftime(date_buffer, sizeof(date_buffer), "%Y-%m-%dT%H:%M:%S", &tm);

  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%s.%03dZ", date_buffer, static_cast<int>(millis));
  return buffer;
}

} // namespace common
