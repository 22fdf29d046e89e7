/**
 * @file cycle_controller.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "openswitchsync/core/sync_error.hpp"

namespace oss {

class SyncCoordinator;

struct PollControllerOptions {
    std::chrono::milliseconds period = std::chrono::milliseconds(30000);
    // Run a cycle as soon as the worker starts instead of waiting one period.
    bool pollImmediately = true;
};

enum class CycleTrigger : std::uint8_t {
    Schedule,
    Refresh,
};

/**
 * @brief Runtime report for one cycle.
 */
struct CycleReport {
    std::uint64_t cycleIndex = 0;
    CycleTrigger trigger = CycleTrigger::Schedule;
    bool success = false;
    SyncErrorCode error = SyncErrorCode::None;
    std::chrono::microseconds runtime = std::chrono::microseconds(0);
};

/**
 * @brief Dedicated polling thread for SyncCoordinator::runCycle().
 *
 * Cycles never overlap. requestRefresh() wakes the worker early; requests
 * that arrive while a cycle runs are coalesced into one follow-up cycle, so a
 * refresh requested after a write always observes that write.
 *
 * stop() cancels a cycle in flight, so it returns after at most one
 * outstanding transport request instead of a full cycle timeout.
 */
class PollController {
public:
    using CycleReportCallback = std::function<void(const CycleReport& report)>;

    PollController() = default;
    ~PollController();

    bool start(SyncCoordinator& coordinator,
               PollControllerOptions options,
               CycleReportCallback callback = {});
    void stop();
    void requestRefresh();

    bool isRunning() const noexcept;

private:
    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wake_;
    bool refreshPending_ = false;
    bool cycleInFlight_ = false;
    SyncCoordinator* coordinator_ = nullptr;
    std::thread worker_;
};

} // namespace oss
