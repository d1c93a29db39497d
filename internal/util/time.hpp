#pragma once

#include <chrono>
#include <cstdint>

namespace dispatch::util {

/*
  Time utilities, single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock = std::chrono::steady_clock;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace dispatch::util
