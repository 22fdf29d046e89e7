/**
 * @file topology_discoverer.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <string>

#include "openswitchsync/core/port_state.hpp"
#include "openswitchsync/transport/i_transport.hpp"

namespace oss {

/**
 * @brief One-shot port enumeration over the interface and PoE tables.
 *
 * Physical ports are the ifType rows equal to ethernetCsmacd, named from
 * ifName. PoE-capable ports come from pethPsePortTable row suffixes and are
 * keyed by the port component, restricted to known physical ports.
 */
class TopologyDiscoverer {
public:
    explicit TopologyDiscoverer(ITransport& transport);

    /**
     * @brief Walk the tables and build a fresh topology.
     *
     * Fails when either interface table cannot be walked or no Ethernet port
     * is found. A missing or failing PoE table yields an empty PoE mapping.
     */
    bool discover(TopologyCache& outTopology, std::string& outError);

private:
    bool walkEthernetPorts(TopologyCache& topology, std::string& outError);
    void walkPoePorts(TopologyCache& topology);

    ITransport& transport_;
};

} // namespace oss
