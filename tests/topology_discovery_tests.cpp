#include <cassert>
#include <iostream>
#include <string>

#include "openswitchsync/core/identifier_normalizer.hpp"
#include "openswitchsync/core/switch_oids.hpp"
#include "openswitchsync/master/sync_coordinator.hpp"
#include "openswitchsync/master/topology_discoverer.hpp"
#include "openswitchsync/transport/mock_transport.hpp"
#include "switch_fixture.hpp"

namespace oids = oss::oids;
using oss::SnmpValue;

namespace {

void testOnlyEthernetInterfacesAreDiscovered() {
    oss::MockTransport transport;
    transport.open();
    transport.setValue(oss::joinOid(oids::kIfType, 1U), SnmpValue::integer(6));
    transport.setValue(oss::joinOid(oids::kIfType, 2U), SnmpValue::integer(23));
    transport.setValue(oss::joinOid(oids::kIfName, 1U), SnmpValue::text("1/1"));
    transport.setValue(oss::joinOid(oids::kIfName, 2U), SnmpValue::text("ppp0"));

    oss::TopologyDiscoverer discoverer(transport);
    oss::TopologyCache topology;
    std::string error;
    assert(discoverer.discover(topology, error));
    assert(error.empty());
    assert(topology.ports.size() == 1U);
    assert(topology.ports.at(1) == "1/1");
    assert(topology.ports.count(2) == 0U);
}

void testDiscoveryIsRepeatable() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::TopologyDiscoverer discoverer(transport);
    oss::TopologyCache first;
    oss::TopologyCache second;
    std::string error;
    assert(discoverer.discover(first, error));
    assert(discoverer.discover(second, error));
    assert(first.ports == second.ports);
    assert(first.poePorts.size() == second.poePorts.size());
    assert(first.ports.size() == 4U);
    assert(first.poePorts.size() == 2U);
    assert(first.poePorts.at(2).group == 1U);
    assert(first.poePorts.at(2).port == 2U);
    assert(first.isPoeCapable(1));
    assert(!first.isPoeCapable(3));
}

void testMissingPoeTableIsNotFatal() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.failWalk(oids::kPethPsePortTable);

    oss::TopologyDiscoverer discoverer(transport);
    oss::TopologyCache topology;
    std::string error;
    assert(discoverer.discover(topology, error));
    assert(topology.ports.size() == 4U);
    assert(topology.poePorts.empty());
}

void testPoeKeysAreSubsetOfPorts() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    // PSE row for an interface that is not a physical Ethernet port.
    transport.setValue(oss::joinOid(oids::kPethPsePortAdminEnable, oss::PoeGroupPort{1, 5}), SnmpValue::integer(1));
    transport.setValue(oss::joinOid(oids::kPethPsePortAdminEnable, oss::PoeGroupPort{1, 99}), SnmpValue::integer(1));

    oss::TopologyDiscoverer discoverer(transport);
    oss::TopologyCache topology;
    std::string error;
    assert(discoverer.discover(topology, error));
    for (const auto& kv : topology.poePorts) {
        assert(topology.ports.count(kv.first) == 1U);
    }
    assert(topology.poePorts.count(5) == 0U);
    assert(topology.poePorts.count(99) == 0U);
}

void testMalformedRowsAreSkipped() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.setValue(std::string(oids::kIfType) + ".x7", SnmpValue::integer(6));
    transport.setValue(std::string(oids::kIfName) + ".x7", SnmpValue::text("bogus"));

    oss::TopologyDiscoverer discoverer(transport);
    oss::TopologyCache topology;
    std::string error;
    assert(discoverer.discover(topology, error));
    assert(topology.ports.size() == 4U);
}

void testRequiredWalkFailures() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.failWalk(oids::kIfName);

    oss::TopologyDiscoverer discoverer(transport);
    oss::TopologyCache topology;
    std::string error;
    assert(!discoverer.discover(topology, error));
    assert(error.find("ifName") != std::string::npos);
    assert(topology.empty());

    // A device with no Ethernet interfaces has nothing to synchronize.
    oss::MockTransport bare;
    bare.open();
    bare.setValue(oss::joinOid(oids::kIfType, 1U), SnmpValue::integer(24));
    bare.setValue(oss::joinOid(oids::kIfName, 1U), SnmpValue::text("lo0"));
    oss::TopologyDiscoverer bareDiscoverer(bare);
    assert(!bareDiscoverer.discover(topology, error));
    assert(!error.empty());
}

void testCoordinatorDiscoversOnce() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.discover());
    const auto walksAfterDiscovery = transport.walkCount();
    assert(coordinator.discover());
    assert(transport.walkCount() == walksAfterDiscovery);

    assert(coordinator.runCycle());
    assert(coordinator.runCycle());
    // Two status walks per cycle; ifType/ifName/PoE table are not walked again.
    assert(transport.walkCount() == walksAfterDiscovery + 4U);
    assert(coordinator.topology().ports.size() == 4U);
}

void testDiscoveryFailureIsRetried() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.failWalk(oids::kIfType);

    oss::SyncCoordinator coordinator(transport);
    assert(!coordinator.runCycle());
    assert(coordinator.lastError().code == oss::SyncErrorCode::DiscoveryFailed);
    assert(coordinator.state() == oss::SyncState::Failed);
    assert(coordinator.snapshot().ports.empty());
    assert(coordinator.topology().empty());

    transport.clearFailures();
    assert(coordinator.runCycle());
    assert(coordinator.state() == oss::SyncState::Polling);
    assert(coordinator.lastError().ok());
    assert(coordinator.snapshot().ports.size() == 4U);
}

} // namespace

int main() {
    testOnlyEthernetInterfacesAreDiscovered();
    testDiscoveryIsRepeatable();
    testMissingPoeTableIsNotFatal();
    testPoeKeysAreSubsetOfPorts();
    testMalformedRowsAreSkipped();
    testRequiredWalkFailures();
    testCoordinatorDiscoversOnce();
    testDiscoveryFailureIsRetried();
    std::cout << "topology_discovery_tests passed\n";
    return 0;
}
