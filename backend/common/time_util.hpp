#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace common {

using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock, std::chrono::milliseconds>;

// Current UTC time truncated to millisecond precision, which is what the store keeps.
Timestamp nowMillis();

int64_t toUnixMillis(Timestamp ts);
Timestamp fromUnixMillis(int64_t ms);

// 2024-01-01T12:00:00.000Z
std::string toIso8601(Timestamp ts);

} // namespace common
