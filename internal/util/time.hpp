#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace edgestore::util {

/*
  Time utilities. All clock reads go through here.

  Engine timestamps are signed epoch milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixMillis(TimePoint tp);
std::int64_t NowMillis();

// YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]; nullopt when malformed.
std::optional<std::int64_t> ParseIso8601Millis(std::string_view text);

// UTC rendering with millisecond precision, e.g. 2024-01-02T03:04:05.006Z
std::string FormatIso8601Millis(std::int64_t epoch_ms);

} // namespace edgestore::util
