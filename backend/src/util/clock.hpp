#pragma once
#include <chrono>

// Wall-clock seconds with sub-millisecond resolution. All runners stamp
// arrivals with this one clock so cross-endpoint comparisons are meaningful.
inline double now_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}
