/**
 * @file topology_discoverer.cpp
 * @brief openSwitchSync source file.
 */

#include "openswitchsync/master/topology_discoverer.hpp"

#include <iostream>
#include <set>

#include "openswitchsync/core/identifier_normalizer.hpp"
#include "openswitchsync/core/switch_oids.hpp"

namespace oss {

TopologyDiscoverer::TopologyDiscoverer(ITransport& transport) : transport_(transport) {}

bool TopologyDiscoverer::discover(TopologyCache& outTopology, std::string& outError) {
    outError.clear();
    TopologyCache topology;
    if (!walkEthernetPorts(topology, outError)) {
        return false;
    }
    walkPoePorts(topology);
    outTopology = std::move(topology);
    return true;
}

bool TopologyDiscoverer::walkEthernetPorts(TopologyCache& topology, std::string& outError) {
    const auto types = transport_.walk(oids::kIfType);
    if (!types) {
        outError = "ifType walk failed: " + types.error().message;
        return false;
    }

    std::set<std::uint32_t> ethernet;
    for (const auto& row : types.value()) {
        try {
            const auto index = parsePortIndex(row.oid);
            const auto type = row.value.asInteger();
            if (type && *type == oids::kIfTypeEthernetCsmacd) {
                ethernet.insert(index);
            }
        } catch (const MalformedKeyError&) {
            continue;
        }
    }

    const auto names = transport_.walk(oids::kIfName);
    if (!names) {
        outError = "ifName walk failed: " + names.error().message;
        return false;
    }

    for (const auto& row : names.value()) {
        try {
            const auto index = parsePortIndex(row.oid);
            if (ethernet.count(index) != 0U) {
                topology.ports[index] = row.value.asText();
            }
        } catch (const MalformedKeyError&) {
            continue;
        }
    }

    if (topology.ports.empty()) {
        outError = "no ethernetCsmacd interfaces with an ifName entry";
        return false;
    }
    return true;
}

void TopologyDiscoverer::walkPoePorts(TopologyCache& topology) {
    const auto rows = transport_.walk(oids::kPethPsePortTable);
    if (!rows) {
        // Plenty of switch models do not implement POWER-ETHERNET-MIB.
        std::cerr << "[oss-discovery] pethPsePortTable unavailable (" << rows.error().message
                  << "), treating device as non-PoE\n";
        return;
    }

    for (const auto& row : rows.value()) {
        try {
            const auto groupPort = parsePoeGroupPort(row.oid);
            if (topology.ports.count(groupPort.port) != 0U) {
                topology.poePorts[groupPort.port] = groupPort;
            }
        } catch (const MalformedKeyError&) {
            continue;
        }
    }
}

} // namespace oss
