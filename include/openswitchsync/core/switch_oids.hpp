/**
 * @file switch_oids.hpp
 * @brief Object identifiers polled and written by openSwitchSync.
 */

#pragma once

#include <cstdint>

namespace oss::oids {

// SNMPv2-MIB system group.
inline constexpr const char* kSysName = "1.3.6.1.2.1.1.5.0";
inline constexpr const char* kSysUpTime = "1.3.6.1.2.1.1.3.0";

// IF-MIB ifTable / ifXTable columns, row suffix is ifIndex.
inline constexpr const char* kIfType = "1.3.6.1.2.1.2.2.1.3";
inline constexpr const char* kIfAdminStatus = "1.3.6.1.2.1.2.2.1.7";
inline constexpr const char* kIfOperStatus = "1.3.6.1.2.1.2.2.1.8";
inline constexpr const char* kIfName = "1.3.6.1.2.1.31.1.1.1.1";

// BRIDGE-MIB dot1dBaseBridgeAddress.
inline constexpr const char* kBridgeAddress = "1.3.6.1.2.1.17.1.1.0";

// Vendor scalars; some firmware registers them with an extra ".0" instance.
inline constexpr const char* kHardwareTypeBase = "1.3.6.1.4.1.248.14.1.1.9.1.3.1";
inline constexpr const char* kFirmwareVersionBase = "1.3.6.1.4.1.248.14.1.1.9.1.5.1";
inline constexpr const char* kDeviceTemperature = "1.3.6.1.4.1.248.14.2.5.1";

// POWER-ETHERNET-MIB pethPsePortTable, row suffix is <group>.<port>.
inline constexpr const char* kPethPsePortTable = "1.3.6.1.2.1.105.1.1.1";
inline constexpr const char* kPethPsePortAdminEnable = "1.3.6.1.2.1.105.1.1.1.3";
inline constexpr const char* kPethPsePortDetectionStatus = "1.3.6.1.2.1.105.1.1.1.6";
// pethMainPsePower for PSE group 1.
inline constexpr const char* kPethMainPsePower = "1.3.6.1.2.1.105.1.3.1.1.2.1";
// Vendor delivered-power column, row suffix is ifIndex.
inline constexpr const char* kVendorPortPowerWatts = "1.3.6.1.4.1.248.14.2.14.2.1.2";

// IANAifType ethernetCsmacd.
inline constexpr std::int64_t kIfTypeEthernetCsmacd = 6;
// ifAdminStatus/ifOperStatus up(1), down(2).
inline constexpr std::int64_t kIfStatusUp = 1;
inline constexpr std::int64_t kIfStatusDown = 2;
// TruthValue true(1), false(2).
inline constexpr std::int64_t kTruthTrue = 1;
inline constexpr std::int64_t kTruthFalse = 2;

} // namespace oss::oids
