#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

#include "openswitchsync/core/identifier_normalizer.hpp"
#include "openswitchsync/core/switch_oids.hpp"
#include "openswitchsync/master/sync_coordinator.hpp"
#include "openswitchsync/transport/mock_transport.hpp"
#include "switch_fixture.hpp"

namespace oids = oss::oids;
using oss::SnmpValue;

namespace {

// Forwards to a MockTransport and runs a hook before every walk.
class HookedTransport final : public oss::ITransport {
public:
    explicit HookedTransport(oss::MockTransport& inner) : inner_(inner) {}

    bool open() override { return inner_.open(); }
    void close() override { inner_.close(); }
    oss::TransportResult<SnmpValue> get(const std::string& oid) override {
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        return inner_.get(oid);
    }
    oss::TransportResult<std::vector<oss::VarBind>> walk(const std::string& oidPrefix) override {
        if (beforeWalk_) {
            beforeWalk_(oidPrefix);
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        return inner_.walk(oidPrefix);
    }
    oss::TransportStatus set(const std::string& oid, const SnmpValue& value) override { return inner_.set(oid, value); }
    std::string lastError() const override { return inner_.lastError(); }

    std::function<void(const std::string&)> beforeWalk_;
    std::chrono::milliseconds delay_{0};

private:
    oss::MockTransport& inner_;
};

void testSnapshotCoversEveryDiscoveredPort() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.state() == oss::SyncState::Uninitialized);
    assert(coordinator.runCycle());
    assert(coordinator.state() == oss::SyncState::Polling);

    const auto topology = coordinator.topology();
    const auto snapshot = coordinator.snapshot();
    assert(snapshot.generation == 1U);
    assert(snapshot.ports.size() == topology.ports.size());
    for (const auto& kv : topology.ports) {
        assert(snapshot.ports.count(kv.first) == 1U);
    }

    const auto& port1 = snapshot.ports.at(1);
    assert(port1.rawName == "1/1");
    assert(port1.displayName == "1/1");
    assert(port1.status == oss::PortOperStatus::Up);
    assert(port1.adminOn);
    assert(port1.poe);
    assert(port1.poe->enabled == true);
    assert(port1.poe->detection);
    assert(port1.poe->detection->status == oss::PoeDetectionStatus::Delivering);
    assert(port1.poe->powerWatts == 7);

    const auto& port2 = snapshot.ports.at(2);
    assert(port2.status == oss::PortOperStatus::Down);
    assert(port2.poe);
    assert(port2.poe->detection->status == oss::PoeDetectionStatus::Searching);
    // No vendor power row for port 2.
    assert(!port2.poe->powerWatts);

    assert(!snapshot.ports.at(3).poe);
    assert(snapshot.ports.count(5) == 0U);

    const auto stats = coordinator.statistics();
    assert(stats.cyclesTotal == 1U);
    assert(stats.cyclesFailed == 0U);
    assert(stats.lastCycleSucceeded);
    assert(stats.lastSuccessTime.has_value());
}

void testMissingStatusRowsDefaultToDownAndOff() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.removeValue(oss::joinOid(oids::kIfAdminStatus, 3U));
    transport.removeValue(oss::joinOid(oids::kIfOperStatus, 3U));
    // lowerLayerDown(7) is not Up.
    transport.setValue(oss::joinOid(oids::kIfOperStatus, 1U), SnmpValue::integer(7));
    // Garbage row values are ignored for that port only.
    transport.setValue(oss::joinOid(oids::kIfAdminStatus, 4U), SnmpValue::text("up"));

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.runCycle());
    const auto snapshot = coordinator.snapshot();
    assert(snapshot.ports.size() == 4U);
    assert(!snapshot.ports.at(3).adminOn);
    assert(snapshot.ports.at(3).status == oss::PortOperStatus::Down);
    assert(snapshot.ports.at(1).status == oss::PortOperStatus::Down);
    assert(!snapshot.ports.at(4).adminOn);
    assert(snapshot.ports.at(2).adminOn);
}

void testStackedNamesAreShortened() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.setValue(oss::joinOid(oids::kIfName, 2U), SnmpValue::text("1/2/5"));

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.runCycle());
    const auto port = coordinator.snapshot().ports.at(2);
    assert(port.rawName == "1/2/5");
    assert(port.displayName == "2/5");
}

void testPoeReadsDegradePerField() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.failGet(oss::joinOid(oids::kPethPsePortDetectionStatus, oss::PoeGroupPort{1, 2}));
    transport.setValue(oss::joinOid(oids::kPethPsePortAdminEnable, oss::PoeGroupPort{1, 1}), SnmpValue::text("?"));
    transport.setValue(oss::joinOid(oids::kPethPsePortDetectionStatus, oss::PoeGroupPort{1, 1}),
                       SnmpValue::integer(9));

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.runCycle());
    const auto snapshot = coordinator.snapshot();

    const auto& port1 = snapshot.ports.at(1);
    assert(port1.poe);
    assert(!port1.poe->enabled);
    assert(port1.poe->detection->status == oss::PoeDetectionStatus::Unknown);
    assert(port1.poe->detection->rawCode == 9);
    assert(port1.poe->powerWatts == 7);

    const auto& port2 = snapshot.ports.at(2);
    assert(port2.poe);
    assert(port2.poe->enabled == true);
    assert(!port2.poe->detection);
}

void testPoeReadsSurviveTransportFailures() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.failGet(oss::joinOid(oids::kVendorPortPowerWatts, 1U));

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.runCycle());
    auto port1 = coordinator.snapshot().ports.at(1);
    assert(port1.poe);
    assert(port1.poe->enabled == true);
    assert(port1.poe->detection);
    assert(port1.poe->detection->status == oss::PoeDetectionStatus::Delivering);
    assert(!port1.poe->powerWatts);

    transport.clearFailures();
    transport.failGet(oss::joinOid(oids::kPethPsePortAdminEnable, oss::PoeGroupPort{1, 1}));
    assert(coordinator.runCycle());
    port1 = coordinator.snapshot().ports.at(1);
    assert(port1.poe);
    assert(!port1.poe->enabled);
    assert(port1.poe->detection->status == oss::PoeDetectionStatus::Delivering);
    assert(port1.poe->powerWatts == 7);
}

void testEmptyStatusTables() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.runCycle());

    // Agent restarted with an empty MIB: walks succeed with no rows.
    transport.clearValues();
    assert(!transport.hasValue(oids::kSysName));
    assert(coordinator.runCycle());
    const auto snapshot = coordinator.snapshot();
    assert(snapshot.ports.size() == 4U);
    for (const auto& kv : snapshot.ports) {
        assert(kv.second.status == oss::PortOperStatus::Down);
        assert(!kv.second.adminOn);
    }
    assert(snapshot.ports.at(1).poe);
    assert(!snapshot.ports.at(1).poe->enabled);
    assert(!snapshot.ports.at(1).poe->detection);
    assert(!coordinator.deviceMeta().temperatureCelsius);
    // Identity is kept from discovery.
    assert(coordinator.deviceMeta().systemName == std::string("sw-test"));
}

void testFailedCycleKeepsPreviousSnapshot() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.runCycle());
    const auto before = coordinator.snapshot();

    transport.setValue(oss::joinOid(oids::kIfOperStatus, 2U), SnmpValue::integer(oids::kIfStatusUp));
    transport.failWalk(oids::kIfOperStatus);
    assert(!coordinator.runCycle());
    assert(coordinator.lastError().code == oss::SyncErrorCode::UpdateFailed);
    assert(coordinator.state() == oss::SyncState::Failed);

    const auto during = coordinator.snapshot();
    assert(during.generation == before.generation);
    assert(during.ports.size() == before.ports.size());
    assert(during.ports.at(2).status == oss::PortOperStatus::Down);

    auto stats = coordinator.statistics();
    assert(!stats.lastCycleSucceeded);
    assert(stats.cyclesFailed == 1U);

    transport.clearFailures();
    assert(coordinator.runCycle());
    const auto after = coordinator.snapshot();
    assert(after.generation == before.generation + 1U);
    assert(after.ports.at(2).status == oss::PortOperStatus::Up);
    stats = coordinator.statistics();
    assert(stats.lastCycleSucceeded);
    assert(stats.cyclesTotal == 3U);
    assert(coordinator.lastError().ok());
}

void testAdminWalkFailureFailsCycle() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    transport.failWalk(oids::kIfAdminStatus);

    oss::SyncCoordinator coordinator(transport);
    assert(!coordinator.runCycle());
    assert(coordinator.lastError().code == oss::SyncErrorCode::UpdateFailed);
    assert(coordinator.lastError().message.find("ifAdminStatus") != std::string::npos);
    assert(coordinator.snapshot().ports.empty());
    // Discovery succeeded and stays cached.
    assert(coordinator.topology().ports.size() == 4U);
}

void testCancelledCyclePublishesNothing() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    HookedTransport hooked(transport);

    oss::SyncCoordinator coordinator(hooked);
    assert(coordinator.runCycle());
    const auto before = coordinator.snapshot();

    hooked.beforeWalk_ = [&coordinator](const std::string& prefix) {
        if (prefix == oids::kIfAdminStatus) {
            coordinator.cancel();
        }
    };
    assert(!coordinator.runCycle());
    assert(coordinator.lastError().code == oss::SyncErrorCode::Cancelled);
    assert(coordinator.snapshot().generation == before.generation);

    // The cancel request only applies to the cycle in flight.
    hooked.beforeWalk_ = nullptr;
    assert(coordinator.runCycle());
    assert(coordinator.snapshot().generation == before.generation + 1U);
}

void testCancelBeforeCycleStarts() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::SyncCoordinator coordinator(transport);
    coordinator.cancel();
    const auto walksBefore = transport.walkCount();
    assert(!coordinator.runCycle());
    assert(coordinator.lastError().code == oss::SyncErrorCode::Cancelled);
    assert(transport.walkCount() == walksBefore);
    assert(coordinator.topology().empty());

    // The request was consumed by the cancelled cycle.
    assert(coordinator.runCycle());
    assert(coordinator.snapshot().ports.size() == 4U);
}

void testCycleDeadline() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);
    HookedTransport hooked(transport);
    hooked.delay_ = std::chrono::milliseconds(20);

    oss::PollOptions options;
    options.cycleTimeout = std::chrono::milliseconds(5);
    oss::SyncCoordinator coordinator(hooked, options);
    assert(!coordinator.runCycle());
    assert(coordinator.lastError().code == oss::SyncErrorCode::Cancelled);
    assert(coordinator.lastError().message.find("deadline") != std::string::npos);
    assert(coordinator.snapshot().ports.empty());

    options.cycleTimeout = std::chrono::milliseconds(0);
    coordinator.setPollOptions(options);
    hooked.delay_ = std::chrono::milliseconds(0);
    assert(coordinator.runCycle());
    assert(coordinator.snapshot().ports.size() == 4U);
}

void testResetForcesRediscovery() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::SyncCoordinator coordinator(transport);
    assert(coordinator.runCycle());
    coordinator.reset();
    assert(coordinator.state() == oss::SyncState::Uninitialized);
    assert(coordinator.topology().empty());
    assert(coordinator.snapshot().ports.empty());
    assert(!coordinator.deviceMeta().systemName);

    // New layout after a stack change: port 4 is gone.
    transport.removeValue(oss::joinOid(oids::kIfType, 4U));
    assert(coordinator.runCycle());
    assert(coordinator.snapshot().ports.size() == 3U);
    assert(coordinator.deviceMeta().systemName == std::string("sw-test"));
}

void testReadersDuringCycles() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::SyncCoordinator coordinator(transport);
    std::atomic<bool> done{false};
    std::thread poller([&]() {
        for (int i = 0; i < 50; ++i) {
            (void)coordinator.runCycle();
        }
        done.store(true);
    });

    while (!done.load()) {
        const auto snapshot = coordinator.snapshot();
        assert(snapshot.ports.empty() || snapshot.ports.size() == 4U);
        (void)coordinator.deviceMeta();
        (void)coordinator.statistics();
    }
    poller.join();
    assert(coordinator.snapshot().generation == 50U);
}

void testConnectionCheck() {
    oss::MockTransport transport;
    transport.open();
    oss_test::seedFourPortSwitch(transport);

    oss::SyncCoordinator coordinator(transport);
    std::string name;
    assert(coordinator.testConnection(name).ok());
    assert(name == "sw-test");

    transport.close();
    const auto closed = coordinator.testConnection(name);
    assert(!closed.ok());
    assert(closed.code == oss::SyncErrorCode::UpdateFailed);
}

} // namespace

int main() {
    testSnapshotCoversEveryDiscoveredPort();
    testMissingStatusRowsDefaultToDownAndOff();
    testStackedNamesAreShortened();
    testPoeReadsDegradePerField();
    testPoeReadsSurviveTransportFailures();
    testEmptyStatusTables();
    testFailedCycleKeepsPreviousSnapshot();
    testAdminWalkFailureFailsCycle();
    testCancelledCyclePublishesNothing();
    testCancelBeforeCycleStarts();
    testCycleDeadline();
    testResetForcesRediscovery();
    testReadersDuringCycles();
    testConnectionCheck();
    std::cout << "sync_coordinator_tests passed\n";
    return 0;
}
