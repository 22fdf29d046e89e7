#pragma once

#include <cstdint>
#include <string>

#include "openswitchsync/core/identifier_normalizer.hpp"
#include "openswitchsync/core/switch_oids.hpp"
#include "openswitchsync/transport/mock_transport.hpp"

namespace oss_test {

// Four Ethernet ports (1-4), a loopback (5) and PoE on ports 1 and 2 (group 1).
inline void seedFourPortSwitch(oss::MockTransport& transport) {
    using oss::SnmpValue;
    using oss::joinOid;
    namespace oids = oss::oids;

    transport.setValue(oids::kSysName, SnmpValue::text("sw-test"));
    transport.setValue(oids::kSysUpTime, SnmpValue::timeTicks(123456));
    transport.setValue(oids::kBridgeAddress, SnmpValue::bytes({0x00, 0x80, 0x63, 0x1a, 0x2b, 0x3c}));
    transport.setValue(oids::kDeviceTemperature, SnmpValue::integer(42));
    transport.setValue(oids::kPethMainPsePower, SnmpValue::gauge(240));

    for (std::uint32_t index = 1; index <= 4; ++index) {
        transport.setValue(joinOid(oids::kIfType, index), SnmpValue::integer(oids::kIfTypeEthernetCsmacd));
        transport.setValue(joinOid(oids::kIfName, index), SnmpValue::text("1/" + std::to_string(index)));
        transport.setValue(joinOid(oids::kIfAdminStatus, index), SnmpValue::integer(oids::kIfStatusUp));
        transport.setValue(joinOid(oids::kIfOperStatus, index),
                           SnmpValue::integer(index % 2U == 1U ? oids::kIfStatusUp : oids::kIfStatusDown));
    }
    transport.setValue(joinOid(oids::kIfType, 5U), SnmpValue::integer(24));
    transport.setValue(joinOid(oids::kIfName, 5U), SnmpValue::text("lo0"));
    transport.setValue(joinOid(oids::kIfAdminStatus, 5U), SnmpValue::integer(oids::kIfStatusUp));
    transport.setValue(joinOid(oids::kIfOperStatus, 5U), SnmpValue::integer(oids::kIfStatusUp));

    for (std::uint32_t port = 1; port <= 2; ++port) {
        const oss::PoeGroupPort groupPort{1, port};
        transport.setValue(joinOid(oids::kPethPsePortAdminEnable, groupPort), SnmpValue::integer(oids::kTruthTrue));
        transport.setValue(joinOid(oids::kPethPsePortDetectionStatus, groupPort),
                           SnmpValue::integer(port == 1U ? 3 : 2));
    }
    transport.setValue(joinOid(oids::kVendorPortPowerWatts, 1U), SnmpValue::integer(7));
}

} // namespace oss_test
