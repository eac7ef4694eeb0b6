#pragma once

#include <chrono>
#include <cstdint>

namespace cloudsim::util {

// Wall clock used for record timestamps (created_at_ms, launched_at_ms).

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowUnixMillis();

} // namespace cloudsim::util
