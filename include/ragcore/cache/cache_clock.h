#pragma once

#include <chrono>
#include <functional>

namespace ragcore::cache {

using SteadyTime = std::chrono::steady_clock::time_point;
using WallTime = std::chrono::system_clock::time_point;

// Injectable time sources; tests substitute manual clocks
using SteadyClockFn = std::function<SteadyTime()>;
using WallClockFn = std::function<WallTime()>;

inline SteadyClockFn steadyNow() {
    return [] { return std::chrono::steady_clock::now(); };
}

inline WallClockFn wallNow() {
    return [] { return std::chrono::system_clock::now(); };
}

} // namespace ragcore::cache
