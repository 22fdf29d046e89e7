#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace oss {

struct CycleStatistics {
    std::uint64_t cyclesTotal = 0;
    std::uint64_t cyclesFailed = 0;
    bool lastCycleSucceeded = false;
    std::chrono::microseconds lastCycleRuntime = std::chrono::microseconds(0);
    // Wall-clock time of the last published snapshot, for staleness display.
    std::optional<std::chrono::system_clock::time_point> lastSuccessTime;
};

} // namespace oss
