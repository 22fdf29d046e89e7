/**
 * @file device_metadata_fetcher.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <optional>
#include <string>

#include "openswitchsync/core/port_state.hpp"
#include "openswitchsync/transport/i_transport.hpp"

namespace oss {

/**
 * @brief Reads device identity once and scalar health metrics every cycle.
 *
 * Metric refresh distinguishes two failure shapes:
 * - the device answered with something that is not a number: the cached
 *   value is cleared, because it is no longer meaningful;
 * - the request itself failed: the cached value is kept until the next try.
 */
class DeviceMetadataFetcher {
public:
    explicit DeviceMetadataFetcher(ITransport& transport);

    /**
     * @brief Fetch sysName, bridge MAC, hardware type and firmware.
     *
     * Never fails as a whole; unreadable fields stay empty.
     */
    DeviceMeta fetchIdentity();

    /**
     * @brief Return `meta` with temperature, uptime and PoE budget refreshed.
     */
    DeviceMeta fetchMetrics(const DeviceMeta& meta);

    /**
     * @brief Cut firmware text at the "RAM:" marker and trim whitespace.
     */
    static std::string cleanFirmwareVersion(const std::string& raw);
    /**
     * @brief Render six raw bytes as aa:bb:cc:dd:ee:ff; other lengths as text.
     */
    static std::string formatBridgeAddress(const SnmpValue& value);

private:
    enum class MetricOutcome {
        Value,
        Invalid,
        Unavailable,
    };

    std::optional<std::string> readText(const std::string& oid);
    std::optional<std::string> readTextWithInstanceFallback(const std::string& baseOid);
    MetricOutcome readTemperature(std::int64_t& outCelsius);
    MetricOutcome readUptime(double& outSeconds);
    MetricOutcome readPoeBudget(std::int64_t& outWatts);

    ITransport& transport_;
};

} // namespace oss
