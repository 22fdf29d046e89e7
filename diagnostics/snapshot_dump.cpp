/**
 * @file snapshot_dump.cpp
 * @brief openSwitchSync source file.
 */

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

#include "openswitchsync/config/device_profile_loader.hpp"
#include "openswitchsync/master/sync_coordinator.hpp"
#include "openswitchsync/transport/mock_transport.hpp"

namespace {

template <typename T>
void printField(const char* name, const std::optional<T>& value) {
    std::cout << "  " << name << '=';
    if (value) {
        std::cout << *value;
    } else {
        std::cout << "-";
    }
    std::cout << '\n';
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: snapshot_dump <device.profile>\n";
        return 2;
    }

    oss::MockTransport transport;
    std::string error;
    if (!oss::DeviceProfileLoader::loadFromFile(argv[1], transport, error)) {
        std::cerr << "Device profile load failed: " << error << '\n';
        return 1;
    }
    if (!transport.open()) {
        std::cerr << "Transport open failed: " << transport.lastError() << '\n';
        return 1;
    }

    oss::SyncCoordinator coordinator(transport);
    const bool ok = coordinator.runCycle();

    const auto lastError = coordinator.lastError();
    const auto stats = coordinator.statistics();
    std::cout << "status:\n"
              << "  state=" << oss::toString(coordinator.state()) << '\n'
              << "  last_cycle_ok=" << (ok ? 1 : 0) << '\n'
              << "  error=" << oss::toString(lastError.code)
              << (lastError.message.empty() ? std::string() : ": " + lastError.message) << '\n'
              << "  runtime_us=" << stats.lastCycleRuntime.count() << '\n';

    const auto meta = coordinator.deviceMeta();
    std::cout << "device:\n";
    printField("sys_name", meta.systemName);
    printField("mac", meta.macAddress);
    printField("model", meta.hardwareModel);
    printField("firmware", meta.firmwareVersion);
    printField("temperature_c", meta.temperatureCelsius);
    std::cout << std::fixed << std::setprecision(2);
    printField("uptime_s", meta.uptimeSeconds);
    printField("poe_budget_w", meta.poeBudgetWatts);

    const auto snapshot = coordinator.snapshot();
    std::cout << "ports (generation " << snapshot.generation << "):\n";
    for (const auto& kv : snapshot.ports) {
        const auto& port = kv.second;
        std::cout << "  if=" << port.ifIndex
                  << " name=" << port.rawName
                  << " display=" << port.displayName
                  << " status=" << oss::toString(port.status)
                  << " admin=" << (port.adminOn ? 1 : 0);
        if (port.poe) {
            std::cout << " poe_enabled=";
            if (port.poe->enabled) {
                std::cout << (*port.poe->enabled ? 1 : 0);
            } else {
                std::cout << '-';
            }
            std::cout << " detection="
                      << (port.poe->detection ? oss::toString(*port.poe->detection) : std::string("-"))
                      << " power_w=";
            if (port.poe->powerWatts) {
                std::cout << *port.poe->powerWatts;
            } else {
                std::cout << '-';
            }
        }
        std::cout << '\n';
    }
    return ok ? 0 : 1;
}
