#include "openswitchsync/master/cycle_controller.hpp"

#include "openswitchsync/master/sync_coordinator.hpp"

namespace oss {

PollController::~PollController() { stop(); }

bool PollController::start(SyncCoordinator& coordinator,
                           PollControllerOptions options,
                           CycleReportCallback callback) {
    if (running_.exchange(true)) {
        return false;
    }
    if (options.period.count() <= 0) {
        running_.store(false);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        coordinator_ = &coordinator;
        cycleInFlight_ = false;
    }

    worker_ = std::thread([this, &coordinator, options, callback = std::move(callback)]() mutable {
        std::uint64_t cycleIndex = 0;
        auto nextWake = std::chrono::steady_clock::now();
        if (!options.pollImmediately) {
            nextWake += options.period;
        }

        while (running_.load()) {
            CycleTrigger trigger = CycleTrigger::Schedule;
            {
                std::unique_lock<std::mutex> lock(wakeMutex_);
                wake_.wait_until(lock, nextWake, [this]() { return !running_.load() || refreshPending_; });
                if (!running_.load()) {
                    break;
                }
                trigger = refreshPending_ ? CycleTrigger::Refresh : CycleTrigger::Schedule;
                refreshPending_ = false;
                cycleInFlight_ = true;
            }

            // A refresh that lands on a due slot also consumes that slot.
            const auto now = std::chrono::steady_clock::now();
            if (now >= nextWake) {
                nextWake += options.period;
                if (nextWake <= now) {
                    nextWake = now + options.period;
                }
            }

            const auto start = std::chrono::steady_clock::now();
            const bool ok = coordinator.runCycle();
            const auto end = std::chrono::steady_clock::now();
            {
                std::lock_guard<std::mutex> lock(wakeMutex_);
                cycleInFlight_ = false;
            }

            CycleReport report;
            report.cycleIndex = cycleIndex++;
            report.trigger = trigger;
            report.success = ok;
            report.error = ok ? SyncErrorCode::None : coordinator.lastError().code;
            report.runtime = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
            if (callback) {
                callback(report);
            }
        }
    });

    return true;
}

void PollController::stop() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        running_.store(false);
        refreshPending_ = false;
        if (cycleInFlight_ && coordinator_ != nullptr) {
            coordinator_->cancel();
        }
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void PollController::requestRefresh() {
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
        refreshPending_ = true;
    }
    wake_.notify_all();
}

bool PollController::isRunning() const noexcept { return running_.load(); }

} // namespace oss
