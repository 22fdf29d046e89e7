/**
 * @file port_state.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace oss {

enum class PortOperStatus : std::uint8_t {
    Up,
    Down,
};

/**
 * @brief pethPsePortDetectionStatus values; Unknown keeps the raw code.
 */
enum class PoeDetectionStatus : std::uint8_t {
    Disabled = 1,
    Searching = 2,
    Delivering = 3,
    Fault = 4,
    Test = 5,
    Other = 6,
    Unknown = 0xFF,
};

struct PoeDetection {
    PoeDetectionStatus status = PoeDetectionStatus::Unknown;
    std::int64_t rawCode = 0;
};

struct PoeStatus {
    std::optional<bool> enabled;
    std::optional<PoeDetection> detection;
    std::optional<std::int64_t> powerWatts;
};

struct PortRecord {
    std::uint32_t ifIndex = 0;
    std::string rawName;
    std::string displayName;
    PortOperStatus status = PortOperStatus::Down;
    bool adminOn = false;
    std::optional<PoeStatus> poe;
};

struct PoeGroupPort {
    std::uint32_t group = 0;
    std::uint32_t port = 0;
};

/**
 * @brief Port layout cached for a session; poePorts keys are a subset of ports keys.
 */
struct TopologyCache {
    std::map<std::uint32_t, std::string> ports;
    std::map<std::uint32_t, PoeGroupPort> poePorts;

    bool empty() const noexcept { return ports.empty(); }
    bool isPoeCapable(std::uint32_t ifIndex) const { return poePorts.find(ifIndex) != poePorts.end(); }
};

struct DeviceMeta {
    std::optional<std::string> systemName;
    std::optional<std::string> macAddress;
    std::optional<std::string> hardwareModel;
    std::optional<std::string> firmwareVersion;
    std::optional<std::int64_t> temperatureCelsius;
    std::optional<double> uptimeSeconds;
    std::optional<std::int64_t> poeBudgetWatts;
};

struct PortSnapshot {
    std::uint64_t generation = 0;
    std::map<std::uint32_t, PortRecord> ports;
};

PoeDetection decodePoeDetection(std::int64_t code);
std::string toString(const PoeDetection& detection);
const char* toString(PortOperStatus status);

} // namespace oss
