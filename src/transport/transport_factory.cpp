#include "openswitchsync/transport/transport_factory.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "openswitchsync/transport/mock_transport.hpp"

namespace oss {
namespace {

std::string trimCopy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    return value;
}

AddressFamily otherFamily(AddressFamily family) {
    return family == AddressFamily::Ipv4 ? AddressFamily::Ipv6 : AddressFamily::Ipv4;
}

bool parsePort(const std::string& text, std::uint16_t& outPort) {
    if (text.empty() || text.size() > 5U ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    const auto value = std::stoul(text);
    if (value == 0UL || value > 0xFFFFUL) {
        return false;
    }
    outPort = static_cast<std::uint16_t>(value);
    return true;
}

// Accepts "host", "host:port", "[v6addr]" and "[v6addr]:port".
bool splitHostPort(const std::string& text, std::string& outHost, std::uint16_t& outPort, std::string& outError) {
    if (!text.empty() && text.front() == '[') {
        const auto close = text.find(']');
        if (close == std::string::npos) {
            outError = "unterminated '[' in address '" + text + "'";
            return false;
        }
        outHost = text.substr(1, close - 1U);
        const auto rest = text.substr(close + 1U);
        if (rest.empty()) {
            return !outHost.empty();
        }
        if (rest.front() != ':' || !parsePort(rest.substr(1), outPort)) {
            outError = "invalid port in address '" + text + "'";
            return false;
        }
        return !outHost.empty();
    }

    const auto colon = text.rfind(':');
    if (colon == std::string::npos || text.find(':') != colon) {
        // No port, or a bare IPv6 literal.
        outHost = text;
        return !outHost.empty();
    }
    outHost = text.substr(0, colon);
    if (!parsePort(text.substr(colon + 1U), outPort)) {
        outError = "invalid port in address '" + text + "'";
        return false;
    }
    return !outHost.empty();
}

} // namespace

bool TransportFactory::parseTransportSpec(const std::string& spec,
                                          TransportFactoryConfig& outConfig,
                                          std::string& outError) {
    outError.clear();
    const auto trimmed = trimCopy(spec);
    if (trimmed.empty()) {
        outError = "transport spec is empty";
        return false;
    }

    if (trimmed == "mock") {
        outConfig.kind = TransportKind::Mock;
        outConfig.host.clear();
        return true;
    }

    AddressFamily family = AddressFamily::Ipv4;
    std::string rest;
    if (trimmed.rfind("udp6:", 0) == 0) {
        family = AddressFamily::Ipv6;
        rest = trimCopy(trimmed.substr(5));
    } else if (trimmed.rfind("udp:", 0) == 0) {
        rest = trimCopy(trimmed.substr(4));
    } else {
        outError = "unsupported transport spec '" + spec + "', expected 'mock' or 'udp[6]:<host>[:port]'";
        return false;
    }

    std::string host;
    std::uint16_t port = 161;
    if (!splitHostPort(rest, host, port, outError)) {
        if (outError.empty()) {
            outError = "udp transport requires a host, e.g. udp:192.0.2.10";
        }
        return false;
    }
    outConfig.kind = TransportKind::Udp;
    outConfig.host = host;
    outConfig.port = port;
    outConfig.family = family;
    return true;
}

bool TransportFactory::establish(const SessionConfig& session,
                                 const TransportConnector& connector,
                                 TransportSession& outSession,
                                 std::string& outError) {
    outError.clear();
    outSession = TransportSession{};
    if (!connector) {
        outError = "no transport connector available";
        return false;
    }

    const AddressFamily attempts[] = {session.preferredFamily, otherFamily(session.preferredFamily)};
    std::string firstError;
    for (std::size_t i = 0; i < 2U; ++i) {
        const auto family = attempts[i];
        std::string error;
        auto transport = connector(session, family, error);
        if (transport && !transport->open()) {
            error = "open failed: " + transport->lastError();
            transport.reset();
        }
        if (transport) {
            outSession.transport = std::move(transport);
            outSession.family = family;
            outSession.usedFallback = (i != 0U);
            return true;
        }
        if (i == 0U) {
            firstError = error;
            std::cerr << "[oss-transport] host=" << session.host << " family=" << toString(family)
                      << " failed (" << error << "), trying " << toString(attempts[1]) << '\n';
        } else {
            outError = std::string("session establishment failed: ") + toString(attempts[0]) + ": " + firstError +
                       "; " + toString(family) + ": " + error;
        }
    }
    return false;
}

std::unique_ptr<ITransport> TransportFactory::create(const TransportFactoryConfig& config,
                                                     const SessionConfig& session,
                                                     const TransportConnector& connector,
                                                     std::string& outError) {
    outError.clear();

    if (config.kind == TransportKind::Mock) {
        auto transport = std::make_unique<MockTransport>(session);
        if (!transport->open()) {
            outError = "mock transport open failed: " + transport->lastError();
            return nullptr;
        }
        return transport;
    }

    if (config.kind != TransportKind::Udp) {
        outError = "unsupported transport kind";
        return nullptr;
    }

    auto target = session;
    target.host = config.host;
    target.port = config.port;
    target.preferredFamily = config.family;
    if (target.host.empty()) {
        outError = "udp transport requires host";
        return nullptr;
    }

    TransportSession established;
    if (!establish(target, connector, established, outError)) {
        return nullptr;
    }
    return std::move(established.transport);
}

} // namespace oss
