#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace flowstore::util {

/*
  Time utilities. All store timestamps come from Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

/*
  Install Version directory names: yyyy-MM-dd-HH:mm.ss.SSS in UTC.
  Fixed width, so lexical order is chronological order.
*/
std::string FormatInstallVersion(TimePoint tp);

std::optional<TimePoint> ParseInstallVersion(const std::string& name);

} // namespace flowstore::util
