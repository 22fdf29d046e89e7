/**
 * @file device_metadata_fetcher.cpp
 * @brief openSwitchSync source file.
 */

#include "openswitchsync/master/device_metadata_fetcher.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "openswitchsync/core/identifier_normalizer.hpp"
#include "openswitchsync/core/switch_oids.hpp"

namespace oss {
namespace {

constexpr const char* kFirmwareMarker = "RAM:";

std::string trimCopy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    return value;
}

// Integer view of a value, accepting decimal text such as "41.5" truncated toward zero.
std::optional<std::int64_t> truncatedInteger(const SnmpValue& value) {
    if (const auto direct = value.asInteger()) {
        return direct;
    }
    if (value.type != SnmpValueType::OctetString) {
        return std::nullopt;
    }
    const auto text = trimCopy(value.asText());
    if (text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(parsed)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(std::trunc(parsed));
}

} // namespace

DeviceMetadataFetcher::DeviceMetadataFetcher(ITransport& transport) : transport_(transport) {}

DeviceMeta DeviceMetadataFetcher::fetchIdentity() {
    DeviceMeta meta;
    meta.systemName = readText(oids::kSysName);

    const auto bridge = transport_.get(oids::kBridgeAddress);
    if (bridge && !bridge.value().isException()) {
        const auto mac = formatBridgeAddress(bridge.value());
        if (!mac.empty()) {
            meta.macAddress = mac;
        }
    }

    meta.hardwareModel = readTextWithInstanceFallback(oids::kHardwareTypeBase);
    if (const auto firmware = readTextWithInstanceFallback(oids::kFirmwareVersionBase)) {
        meta.firmwareVersion = cleanFirmwareVersion(*firmware);
    }
    return meta;
}

DeviceMeta DeviceMetadataFetcher::fetchMetrics(const DeviceMeta& meta) {
    auto updated = meta;

    std::int64_t celsius = 0;
    switch (readTemperature(celsius)) {
    case MetricOutcome::Value:
        updated.temperatureCelsius = celsius;
        break;
    case MetricOutcome::Invalid:
        updated.temperatureCelsius.reset();
        break;
    case MetricOutcome::Unavailable:
        break;
    }

    double seconds = 0.0;
    switch (readUptime(seconds)) {
    case MetricOutcome::Value:
        updated.uptimeSeconds = seconds;
        break;
    case MetricOutcome::Invalid:
        updated.uptimeSeconds.reset();
        break;
    case MetricOutcome::Unavailable:
        break;
    }

    std::int64_t watts = 0;
    switch (readPoeBudget(watts)) {
    case MetricOutcome::Value:
        updated.poeBudgetWatts = watts;
        break;
    case MetricOutcome::Invalid:
        updated.poeBudgetWatts.reset();
        break;
    case MetricOutcome::Unavailable:
        break;
    }
    return updated;
}

std::string DeviceMetadataFetcher::cleanFirmwareVersion(const std::string& raw) {
    const auto marker = raw.find(kFirmwareMarker);
    return trimCopy(marker == std::string::npos ? raw : raw.substr(0, marker));
}

std::string DeviceMetadataFetcher::formatBridgeAddress(const SnmpValue& value) {
    if (value.type == SnmpValueType::OctetString && value.octets.size() == 6U) {
        char buffer[18];
        std::snprintf(buffer, sizeof(buffer), "%02x:%02x:%02x:%02x:%02x:%02x",
                      value.octets[0], value.octets[1], value.octets[2],
                      value.octets[3], value.octets[4], value.octets[5]);
        return buffer;
    }
    return value.asText();
}

std::optional<std::string> DeviceMetadataFetcher::readText(const std::string& oid) {
    const auto result = transport_.get(oid);
    if (!result || result.value().isException()) {
        return std::nullopt;
    }
    return result.value().asText();
}

std::optional<std::string> DeviceMetadataFetcher::readTextWithInstanceFallback(const std::string& baseOid) {
    for (const auto& candidate : {baseOid, joinOid(baseOid, "0")}) {
        auto text = readText(candidate);
        if (text && !text->empty()) {
            return text;
        }
    }
    return std::nullopt;
}

DeviceMetadataFetcher::MetricOutcome DeviceMetadataFetcher::readTemperature(std::int64_t& outCelsius) {
    bool answeredWithGarbage = false;
    const std::string base = oids::kDeviceTemperature;
    for (const auto& candidate : {base, joinOid(base, "0")}) {
        const auto result = transport_.get(candidate);
        if (!result) {
            continue;
        }
        if (const auto value = truncatedInteger(result.value())) {
            outCelsius = *value;
            return MetricOutcome::Value;
        }
        answeredWithGarbage = true;
    }
    return answeredWithGarbage ? MetricOutcome::Invalid : MetricOutcome::Unavailable;
}

DeviceMetadataFetcher::MetricOutcome DeviceMetadataFetcher::readUptime(double& outSeconds) {
    const auto result = transport_.get(oids::kSysUpTime);
    if (!result) {
        return MetricOutcome::Unavailable;
    }
    const auto ticks = truncatedInteger(result.value());
    if (!ticks) {
        return MetricOutcome::Invalid;
    }
    // TimeTicks are hundredths of a second; keep two decimals.
    outSeconds = std::round(static_cast<double>(*ticks)) / 100.0;
    return MetricOutcome::Value;
}

DeviceMetadataFetcher::MetricOutcome DeviceMetadataFetcher::readPoeBudget(std::int64_t& outWatts) {
    const auto result = transport_.get(oids::kPethMainPsePower);
    if (!result) {
        return MetricOutcome::Unavailable;
    }
    const auto watts = result.value().asInteger();
    if (!watts) {
        return MetricOutcome::Invalid;
    }
    outWatts = *watts;
    return MetricOutcome::Value;
}

} // namespace oss
