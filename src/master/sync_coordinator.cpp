/**
 * @file sync_coordinator.cpp
 * @brief openSwitchSync source file.
 */

#include "openswitchsync/master/sync_coordinator.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <optional>

#include "openswitchsync/core/identifier_normalizer.hpp"
#include "openswitchsync/core/switch_oids.hpp"
#include "openswitchsync/master/device_metadata_fetcher.hpp"
#include "openswitchsync/master/topology_discoverer.hpp"

namespace oss {
namespace {

bool parseBoolEnv(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    const std::string text(value);
    if (text == "1" || text == "true" || text == "TRUE" || text == "on" || text == "ON") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "off" || text == "OFF") {
        return false;
    }
    return defaultValue;
}

// Walk an ifTable status column into ifIndex -> raw code, skipping malformed rows.
std::map<std::uint32_t, std::int64_t> statusColumn(const std::vector<VarBind>& rows, bool trace) {
    std::map<std::uint32_t, std::int64_t> column;
    for (const auto& row : rows) {
        try {
            const auto index = parsePortIndex(row.oid);
            if (const auto code = row.value.asInteger()) {
                column[index] = *code;
            }
        } catch (const MalformedKeyError& ex) {
            if (trace) {
                std::cerr << "[oss-sync] skipped row: " << toString(ex.code()) << ": " << ex.what() << '\n';
            }
            continue;
        }
    }
    return column;
}

// Consumes a pending cancel request once the cycle that saw it ends.
class CancelReset {
public:
    explicit CancelReset(std::atomic<bool>& flag) : flag_(flag) {}
    ~CancelReset() { flag_.store(false); }

    CancelReset(const CancelReset&) = delete;
    CancelReset& operator=(const CancelReset&) = delete;

private:
    std::atomic<bool>& flag_;
};

std::string describe(const TransportError& error) {
    if (error.kind == TransportErrorKind::ErrorStatus) {
        return error.message + " (error-status " + std::to_string(error.errorStatus) + ")";
    }
    return error.message;
}

} // namespace

/**
 * @brief Per-cycle transport view that stops issuing requests once the cycle is cancelled.
 *
 * After the cancel flag is raised or the deadline passes, every request fails
 * locally and tripped() reports true, so the cycle can drop its partial work.
 */
class SyncCoordinator::CycleGuard final : public ITransport {
public:
    CycleGuard(ITransport& inner, const std::atomic<bool>& cancelRequested, std::chrono::milliseconds timeout)
        : inner_(inner), cancelRequested_(cancelRequested) {
        if (timeout.count() > 0) {
            deadline_ = std::chrono::steady_clock::now() + timeout;
        }
    }

    bool open() override { return inner_.open(); }
    void close() override { inner_.close(); }

    TransportResult<SnmpValue> get(const std::string& oid) override {
        if (stopped()) {
            return TransportResult<SnmpValue>::failure(TransportErrorKind::Transport, reason_);
        }
        return inner_.get(oid);
    }

    TransportResult<std::vector<VarBind>> walk(const std::string& oidPrefix) override {
        if (stopped()) {
            return TransportResult<std::vector<VarBind>>::failure(TransportErrorKind::Transport, reason_);
        }
        return inner_.walk(oidPrefix);
    }

    TransportStatus set(const std::string& oid, const SnmpValue& value) override {
        if (stopped()) {
            return TransportStatus::failure(TransportErrorKind::Transport, reason_);
        }
        return inner_.set(oid, value);
    }

    std::string lastError() const override { return tripped_ ? reason_ : inner_.lastError(); }

    bool tripped() { return stopped(); }
    const std::string& reason() const noexcept { return reason_; }

private:
    bool stopped() {
        if (tripped_) {
            return true;
        }
        if (cancelRequested_.load()) {
            tripped_ = true;
            reason_ = "cycle cancelled";
        } else if (deadline_ && std::chrono::steady_clock::now() > *deadline_) {
            tripped_ = true;
            reason_ = "cycle deadline exceeded";
        }
        return tripped_;
    }

    ITransport& inner_;
    const std::atomic<bool>& cancelRequested_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool tripped_ = false;
    std::string reason_;
};

SyncCoordinator::SyncCoordinator(ITransport& transport, PollOptions options)
    : transport_(transport), trace_(parseBoolEnv("OSS_TRACE_SYNC", false)), options_(options) {}

bool SyncCoordinator::runCycle() {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);
    const auto begin = std::chrono::steady_clock::now();
    CancelReset cancelReset(cancelRequested_);

    PollOptions options;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        options = options_;
    }
    CycleGuard guard(transport_, cancelRequested_, options.cycleTimeout);

    try {
        std::string error;
        const auto discovered = discoverLocked(guard, error);
        if (discovered != SyncErrorCode::None) {
            return failCycle(discovered, error, begin);
        }

        TopologyCache topology;
        DeviceMeta meta;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            topology = topology_;
            meta = meta_;
        }

        DeviceMetadataFetcher fetcher(guard);
        meta = fetcher.fetchMetrics(meta);
        if (guard.tripped()) {
            return failCycle(SyncErrorCode::Cancelled, guard.reason(), begin);
        }

        const auto operRows = guard.walk(oids::kIfOperStatus);
        if (!operRows) {
            if (guard.tripped()) {
                return failCycle(SyncErrorCode::Cancelled, guard.reason(), begin);
            }
            return failCycle(SyncErrorCode::UpdateFailed,
                             "ifOperStatus walk failed: " + describe(operRows.error()), begin);
        }
        const auto adminRows = guard.walk(oids::kIfAdminStatus);
        if (!adminRows) {
            if (guard.tripped()) {
                return failCycle(SyncErrorCode::Cancelled, guard.reason(), begin);
            }
            return failCycle(SyncErrorCode::UpdateFailed,
                             "ifAdminStatus walk failed: " + describe(adminRows.error()), begin);
        }
        const auto oper = statusColumn(operRows.value(), trace_);
        const auto admin = statusColumn(adminRows.value(), trace_);

        // Build from the cached topology so the key set never depends on this cycle's walks.
        std::map<std::uint32_t, PortRecord> ports;
        for (const auto& kv : topology.ports) {
            PortRecord record;
            record.ifIndex = kv.first;
            record.rawName = kv.second;
            record.displayName = normalizeDisplayName(kv.second);

            const auto operIt = oper.find(kv.first);
            record.status = (operIt != oper.end() && operIt->second == oids::kIfStatusUp)
                                ? PortOperStatus::Up
                                : PortOperStatus::Down;
            const auto adminIt = admin.find(kv.first);
            record.adminOn = (adminIt != admin.end() && adminIt->second == oids::kIfStatusUp);

            const auto poeIt = topology.poePorts.find(kv.first);
            if (poeIt != topology.poePorts.end()) {
                record.poe = readPoeStatus(guard, kv.first, poeIt->second);
            }
            ports.emplace(kv.first, std::move(record));
        }

        if (guard.tripped()) {
            return failCycle(SyncErrorCode::Cancelled, guard.reason(), begin);
        }

        const auto end = std::chrono::steady_clock::now();
        std::size_t portCount = 0;
        std::uint64_t cycleIndex = 0;
        bool recovered = false;
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            recovered = statistics_.cyclesTotal > 0U && !statistics_.lastCycleSucceeded;
            snapshot_.ports = std::move(ports);
            snapshot_.generation += 1U;
            meta_.temperatureCelsius = meta.temperatureCelsius;
            meta_.uptimeSeconds = meta.uptimeSeconds;
            meta_.poeBudgetWatts = meta.poeBudgetWatts;
            state_ = SyncState::Polling;
            error_ = SyncError{};
            ++statistics_.cyclesTotal;
            statistics_.lastCycleSucceeded = true;
            statistics_.lastCycleRuntime = std::chrono::duration_cast<std::chrono::microseconds>(end - begin);
            statistics_.lastSuccessTime = std::chrono::system_clock::now();
            portCount = snapshot_.ports.size();
            cycleIndex = statistics_.cyclesTotal;
        }

        if (recovered) {
            std::cerr << "[oss-sync] cycle recovered, ports=" << portCount << '\n';
        }
        if (trace_) {
            std::cerr << "[oss-sync] cycle=" << cycleIndex
                      << " ok=1 ports=" << portCount
                      << " runtime_us=" << std::chrono::duration_cast<std::chrono::microseconds>(end - begin).count()
                      << '\n';
        }
        return true;
    } catch (const std::exception& ex) {
        return failCycle(SyncErrorCode::UpdateFailed, std::string("Cycle failed: ") + ex.what(), begin);
    }
}

bool SyncCoordinator::discover() {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);
    CancelReset cancelReset(cancelRequested_);
    PollOptions options;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        options = options_;
    }
    CycleGuard guard(transport_, cancelRequested_, options.cycleTimeout);

    std::string error;
    SyncErrorCode code = SyncErrorCode::None;
    try {
        code = discoverLocked(guard, error);
    } catch (const std::exception& ex) {
        code = SyncErrorCode::DiscoveryFailed;
        error = std::string("Discovery failed: ") + ex.what();
    }
    if (code != SyncErrorCode::None) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = SyncState::Failed;
        setError(code, error);
        return false;
    }
    return true;
}

void SyncCoordinator::reset() {
    std::lock_guard<std::mutex> cycleLock(cycleMutex_);
    std::lock_guard<std::mutex> lock(stateMutex_);
    state_ = SyncState::Uninitialized;
    topology_ = TopologyCache{};
    meta_ = DeviceMeta{};
    snapshot_.ports.clear();
    error_ = SyncError{};
}

void SyncCoordinator::cancel() { cancelRequested_.store(true); }

SyncError SyncCoordinator::setPortAdmin(std::uint32_t ifIndex, bool enable) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (topology_.ports.find(ifIndex) == topology_.ports.end()) {
            return {SyncErrorCode::PortNotFound, "ifIndex " + std::to_string(ifIndex) + " is not a discovered port"};
        }
    }
    return writeInteger(joinOid(oids::kIfAdminStatus, ifIndex), enable ? oids::kIfStatusUp : oids::kIfStatusDown);
}

SyncError SyncCoordinator::setPortPoeAdmin(std::uint32_t ifIndex, bool enable) {
    PoeGroupPort groupPort;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        const auto it = topology_.poePorts.find(ifIndex);
        if (it == topology_.poePorts.end()) {
            return {SyncErrorCode::UnsupportedOperation, "PoE not supported on ifIndex " + std::to_string(ifIndex)};
        }
        groupPort = it->second;
    }
    return writeInteger(joinOid(oids::kPethPsePortAdminEnable, groupPort),
                        enable ? oids::kTruthTrue : oids::kTruthFalse);
}

SyncError SyncCoordinator::testConnection(std::string& outSystemName) {
    const auto result = transport_.get(oids::kSysName);
    if (!result) {
        return {SyncErrorCode::UpdateFailed, "sysName read failed: " + describe(result.error())};
    }
    if (result.value().isException()) {
        return {SyncErrorCode::UpdateFailed, "sysName not returned by device"};
    }
    outSystemName = result.value().asText();
    return {};
}

SyncState SyncCoordinator::state() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

PortSnapshot SyncCoordinator::snapshot() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return snapshot_;
}

DeviceMeta SyncCoordinator::deviceMeta() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return meta_;
}

TopologyCache SyncCoordinator::topology() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return topology_;
}

CycleStatistics SyncCoordinator::statistics() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return statistics_;
}

SyncError SyncCoordinator::lastError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return error_;
}

void SyncCoordinator::setPollOptions(PollOptions options) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    options_ = options;
}

PollOptions SyncCoordinator::pollOptions() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return options_;
}

SyncErrorCode SyncCoordinator::discoverLocked(CycleGuard& guard, std::string& outError) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!topology_.empty()) {
            return SyncErrorCode::None;
        }
        state_ = SyncState::Discovering;
    }

    TopologyCache topology;
    TopologyDiscoverer discoverer(guard);
    const bool found = discoverer.discover(topology, outError);
    if (guard.tripped()) {
        outError = guard.reason();
        return SyncErrorCode::Cancelled;
    }
    if (!found) {
        return SyncErrorCode::DiscoveryFailed;
    }

    DeviceMetadataFetcher fetcher(guard);
    const auto identity = fetcher.fetchIdentity();
    if (guard.tripped()) {
        outError = guard.reason();
        return SyncErrorCode::Cancelled;
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    topology_ = std::move(topology);
    meta_.systemName = identity.systemName;
    meta_.macAddress = identity.macAddress;
    meta_.hardwareModel = identity.hardwareModel;
    meta_.firmwareVersion = identity.firmwareVersion;
    state_ = SyncState::Polling;
    if (trace_) {
        std::cerr << "[oss-sync] discovered ports=" << topology_.ports.size()
                  << " poe_ports=" << topology_.poePorts.size()
                  << " sys_name=" << meta_.systemName.value_or("?") << '\n';
    }
    return SyncErrorCode::None;
}

bool SyncCoordinator::failCycle(SyncErrorCode code, std::string message,
                                std::chrono::steady_clock::time_point begin) {
    const auto end = std::chrono::steady_clock::now();
    bool firstFailure = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        firstFailure = statistics_.cyclesTotal == 0U || statistics_.lastCycleSucceeded;
        state_ = SyncState::Failed;
        ++statistics_.cyclesTotal;
        ++statistics_.cyclesFailed;
        statistics_.lastCycleSucceeded = false;
        statistics_.lastCycleRuntime = std::chrono::duration_cast<std::chrono::microseconds>(end - begin);
        setError(code, message);
    }
    // Repeated identical failures are only traced, so an unreachable device does not flood the log.
    if (firstFailure || trace_) {
        std::cerr << "[oss-sync] cycle failed: " << toString(code) << ": " << message << '\n';
    }
    return false;
}

PoeStatus SyncCoordinator::readPoeStatus(ITransport& transport, std::uint32_t ifIndex,
                                         const PoeGroupPort& groupPort) {
    PoeStatus poe;

    const auto enabled = transport.get(joinOid(oids::kPethPsePortAdminEnable, groupPort));
    if (enabled) {
        if (const auto code = enabled.value().asInteger()) {
            poe.enabled = (*code == oids::kTruthTrue);
        }
    }

    const auto detection = transport.get(joinOid(oids::kPethPsePortDetectionStatus, groupPort));
    if (detection) {
        if (const auto code = detection.value().asInteger()) {
            poe.detection = decodePoeDetection(*code);
        }
    }

    // Delivered power lives in a vendor table indexed by ifIndex, not group.port.
    const auto power = transport.get(joinOid(oids::kVendorPortPowerWatts, ifIndex));
    if (power) {
        if (const auto watts = power.value().asInteger()) {
            poe.powerWatts = *watts;
        }
    }
    return poe;
}

void SyncCoordinator::setError(SyncErrorCode code, std::string message) {
    error_ = SyncError{code, std::move(message)};
}

SyncError SyncCoordinator::writeInteger(const std::string& oid, std::int64_t value) {
    const auto result = transport_.set(oid, SnmpValue::integer(value));
    if (!result) {
        std::cerr << "[oss-sync] set " << oid << "=" << value << " rejected: " << describe(result.error()) << '\n';
        return {SyncErrorCode::ControlRejected, "set " + oid + " failed: " + describe(result.error())};
    }
    if (trace_) {
        std::cerr << "[oss-sync] set " << oid << "=" << value << " ok\n";
    }
    return {};
}

const char* toString(SyncState state) {
    switch (state) {
    case SyncState::Uninitialized:
        return "Uninitialized";
    case SyncState::Discovering:
        return "Discovering";
    case SyncState::Polling:
        return "Polling";
    case SyncState::Failed:
        return "Failed";
    }
    return "Unknown";
}

} // namespace oss
