#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "openswitchsync/config/session_config.hpp"
#include "openswitchsync/transport/i_transport.hpp"

namespace oss {

enum class TransportKind {
    Mock,
    Udp,
};

struct TransportFactoryConfig {
    TransportKind kind = TransportKind::Mock;
    std::string host;
    std::uint16_t port = 161;
    AddressFamily family = AddressFamily::Ipv4;
};

/**
 * @brief Builds a protocol adapter for one address family.
 *
 * Returns nullptr and fills outError when the family cannot be used for the
 * target (for example an IPv6 literal handed to an IPv4 socket).
 */
using TransportConnector = std::function<std::unique_ptr<ITransport>(
    const SessionConfig& session, AddressFamily family, std::string& outError)>;

struct TransportSession {
    std::unique_ptr<ITransport> transport;
    AddressFamily family = AddressFamily::Ipv4;
    bool usedFallback = false;
};

/**
 * @brief Create transport instances from a small runtime config.
 *
 * Transport spec format for parseTransportSpec:
 * - mock
 * - udp:<host>[:port]
 * - udp6:<host>[:port]   (IPv6 literals in brackets, e.g. udp6:[fe80::1]:161)
 */
class TransportFactory {
public:
    static bool parseTransportSpec(const std::string& spec,
                                   TransportFactoryConfig& outConfig,
                                   std::string& outError);

    /**
     * @brief Open a session on the preferred family, falling back to the other family once.
     *
     * The fallback happens here only; an established session never switches
     * family per request.
     */
    static bool establish(const SessionConfig& session,
                          const TransportConnector& connector,
                          TransportSession& outSession,
                          std::string& outError);

    static std::unique_ptr<ITransport> create(const TransportFactoryConfig& config,
                                              const SessionConfig& session,
                                              const TransportConnector& connector,
                                              std::string& outError);
};

} // namespace oss
