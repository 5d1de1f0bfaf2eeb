#pragma once

#include <chrono>

namespace switchyard {

// Connection bookkeeping (idle sweeps, write deadlines) only needs a monotonic clock.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;
using SteadyDuration = SteadyClock::duration;

}  // namespace switchyard
