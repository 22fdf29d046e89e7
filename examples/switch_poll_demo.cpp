/**
 * @file switch_poll_demo.cpp
 * @brief openSwitchSync source file.
 */

#include <chrono>
#include <iostream>
#include <thread>

#include "openswitchsync/config/device_profile_loader.hpp"
#include "openswitchsync/config/session_config.hpp"
#include "openswitchsync/master/cycle_controller.hpp"
#include "openswitchsync/master/sync_coordinator.hpp"
#include "openswitchsync/transport/mock_transport.hpp"

using namespace std::chrono_literals;

namespace {

void printPorts(const oss::SyncCoordinator& coordinator) {
    const auto snapshot = coordinator.snapshot();
    for (const auto& kv : snapshot.ports) {
        const auto& port = kv.second;
        std::cout << "  port=" << port.displayName
                  << " if=" << port.ifIndex
                  << " status=" << oss::toString(port.status)
                  << " admin=" << (port.adminOn ? "on" : "off");
        if (port.poe) {
            std::cout << " poe=" << (port.poe->enabled.value_or(false) ? "on" : "off");
            if (port.poe->detection) {
                std::cout << " detection=" << oss::toString(*port.poe->detection);
            }
        }
        std::cout << '\n';
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: switch_poll_demo <session.json> <device.profile>\n"
                  << "  e.g. switch_poll_demo examples/config/demo_session.json examples/config/demo_switch.profile\n";
        return 2;
    }

    oss::SessionConfig session;
    std::string error;
    if (!oss::SessionConfigLoader::loadFromJsonFile(argv[1], session, error)) {
        std::cerr << "Session config load failed: " << error << '\n';
        return 1;
    }
    session.applyEnvironmentOverrides();
    for (const auto& issue : oss::validateSessionConfig(session)) {
        std::cerr << (issue.severity == oss::SessionIssueSeverity::Error ? "error: " : "warning: ")
                  << issue.message << '\n';
    }

    // The mock stands in for the switch; the profile scripts its MIB contents.
    oss::MockTransport transport(session);
    if (!oss::DeviceProfileLoader::loadFromFile(argv[2], transport, error)) {
        std::cerr << "Device profile load failed: " << error << '\n';
        return 1;
    }
    if (!transport.open()) {
        std::cerr << "Transport open failed: " << transport.lastError() << '\n';
        return 1;
    }

    oss::SyncCoordinator coordinator(transport, session.poll);
    oss::PollController controller;
    oss::PollControllerOptions options;
    options.period = session.poll.period;

    const bool started = controller.start(coordinator, options, [](const oss::CycleReport& report) {
        std::cout << "cycle=" << report.cycleIndex
                  << " trigger=" << (report.trigger == oss::CycleTrigger::Refresh ? "refresh" : "schedule")
                  << " ok=" << (report.success ? 1 : 0)
                  << " runtime_us=" << report.runtime.count() << '\n';
    });
    if (!started) {
        std::cerr << "Poll controller failed to start\n";
        return 1;
    }

    std::this_thread::sleep_for(200ms);
    const auto meta = coordinator.deviceMeta();
    std::cout << "device=" << meta.systemName.value_or("?")
              << " model=" << meta.hardwareModel.value_or("?")
              << " firmware=" << meta.firmwareVersion.value_or("?") << '\n';
    printPorts(coordinator);

    // Shut port 2 down; the mock applies the write, the refresh picks it up.
    const auto result = coordinator.setPortAdmin(2, false);
    if (!result.ok()) {
        std::cerr << "setPortAdmin failed: " << oss::toString(result.code) << ": " << result.message << '\n';
    }
    controller.requestRefresh();
    std::this_thread::sleep_for(200ms);
    printPorts(coordinator);

    controller.stop();
    transport.close();

    const auto stats = coordinator.statistics();
    std::cout << "total_cycles=" << stats.cyclesTotal
              << " failed_cycles=" << stats.cyclesFailed << '\n';
    return 0;
}
