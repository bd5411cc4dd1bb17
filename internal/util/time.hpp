#pragma once

#include <chrono>
#include <cstdint>

namespace torrentfs::util {

/*
  Time utilities — single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixSeconds(TimePoint tp);

} // namespace torrentfs::util
