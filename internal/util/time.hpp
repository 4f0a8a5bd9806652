#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace arena::util {

/*
  Wall-clock helpers for run bookkeeping (created/finished timestamps) and
  steady-clock helpers for latency metrics. Nothing here feeds a Run Result.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock = std::chrono::steady_clock;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

double ElapsedMs(SteadyClock::time_point since);

} // namespace arena::util
