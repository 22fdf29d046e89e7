/**
 * @file sync_coordinator.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "openswitchsync/config/session_config.hpp"
#include "openswitchsync/core/port_state.hpp"
#include "openswitchsync/core/sync_error.hpp"
#include "openswitchsync/master/cycle_statistics.hpp"
#include "openswitchsync/transport/i_transport.hpp"

namespace oss {

enum class SyncState : std::uint8_t {
    Uninitialized,
    Discovering,
    Polling,
    Failed,
};

const char* toString(SyncState state);

/**
 * @brief Keeps one switch's port, PoE and device state in sync with the device.
 *
 * The first cycle discovers the port layout and device identity; every cycle
 * then walks the status tables, reads per-port PoE scalars and publishes a
 * complete snapshot in one step. A failed cycle leaves the last published
 * snapshot in place and is retried by the next cycle.
 *
 * At most one cycle runs at a time. Control operations and readers may be
 * called from other threads while a cycle is in flight.
 */
class SyncCoordinator {
public:
    explicit SyncCoordinator(ITransport& transport, PollOptions options = {});

    /**
     * @brief Run one synchronization cycle, discovering first if needed.
     * @return false on discovery/status-walk failure or cancellation; see lastError().
     */
    bool runCycle();
    /**
     * @brief Discover topology and identity unless already cached.
     */
    bool discover();
    /**
     * @brief Drop cached topology, identity and snapshot; next cycle re-discovers.
     */
    void reset();
    /**
     * @brief Abort the in-flight cycle at its next transport request.
     *
     * With no cycle running, the request applies to the next cycle to start,
     * including one already waiting for the cycle lock. The request is consumed
     * when that cycle ends.
     */
    void cancel();

    /**
     * @brief Write ifAdminStatus for a discovered port.
     *
     * The snapshot is not updated; request a refresh after a successful write.
     */
    SyncError setPortAdmin(std::uint32_t ifIndex, bool enable);
    /**
     * @brief Write pethPsePortAdminEnable for a discovered PoE-capable port.
     *
     * Any index outside the cached PoE mapping, discovered or not, is
     * UnsupportedOperation.
     */
    SyncError setPortPoeAdmin(std::uint32_t ifIndex, bool enable);

    /**
     * @brief Read sysName to check that the device answers.
     */
    SyncError testConnection(std::string& outSystemName);

    SyncState state() const;
    PortSnapshot snapshot() const;
    DeviceMeta deviceMeta() const;
    TopologyCache topology() const;
    CycleStatistics statistics() const;
    SyncError lastError() const;

    void setPollOptions(PollOptions options);
    PollOptions pollOptions() const;

private:
    class CycleGuard;

    SyncErrorCode discoverLocked(CycleGuard& guard, std::string& outError);
    bool failCycle(SyncErrorCode code, std::string message, std::chrono::steady_clock::time_point begin);
    PoeStatus readPoeStatus(ITransport& transport, std::uint32_t ifIndex, const PoeGroupPort& groupPort);
    void setError(SyncErrorCode code, std::string message);
    SyncError writeInteger(const std::string& oid, std::int64_t value);

    ITransport& transport_;
    std::atomic<bool> cancelRequested_{false};
    bool trace_ = false;

    // Serializes cycles and discovery.
    std::mutex cycleMutex_;

    // Guards every member below.
    mutable std::mutex stateMutex_;
    PollOptions options_{};
    SyncState state_ = SyncState::Uninitialized;
    TopologyCache topology_{};
    DeviceMeta meta_{};
    PortSnapshot snapshot_{};
    CycleStatistics statistics_{};
    SyncError error_{};
};

} // namespace oss
