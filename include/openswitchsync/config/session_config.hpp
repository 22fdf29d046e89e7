/**
 * @file session_config.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace oss {

enum class SnmpVersion : std::uint8_t {
    V1,
    V2c,
    V3,
};

enum class SnmpAuthProtocol : std::uint8_t {
    None,
    Md5,
    Sha,
};

enum class SnmpPrivProtocol : std::uint8_t {
    None,
    Des,
    Aes,
};

enum class AddressFamily : std::uint8_t {
    Ipv4,
    Ipv6,
};

/**
 * @brief Security parameters attached to one request.
 *
 * For v1/v2c `principal` is the community string; for v3 it is the USM user name.
 */
struct SnmpAuth {
    SnmpVersion version = SnmpVersion::V2c;
    std::string principal;
    SnmpAuthProtocol authProtocol = SnmpAuthProtocol::None;
    std::string authPassword;
    SnmpPrivProtocol privProtocol = SnmpPrivProtocol::None;
    std::string privPassword;
};

/**
 * @brief Polling cadence for the coordinator and its scheduler.
 */
struct PollOptions {
    std::chrono::milliseconds period{30000};
    // Zero disables the per-cycle deadline.
    std::chrono::milliseconds cycleTimeout{20000};
};

struct SessionConfig {
    std::string host;
    std::uint16_t port = 161;
    SnmpVersion version = SnmpVersion::V2c;
    std::string communityRead;
    std::string communityWrite;
    std::string username;
    SnmpAuthProtocol authProtocol = SnmpAuthProtocol::None;
    std::string authPassword;
    SnmpPrivProtocol privProtocol = SnmpPrivProtocol::None;
    std::string privPassword;
    AddressFamily preferredFamily = AddressFamily::Ipv4;
    PollOptions poll{};

    /**
     * @brief Credentials used for GET and WALK requests.
     */
    SnmpAuth readAuth() const;
    /**
     * @brief Credentials used for SET requests.
     *
     * v1/v2c sessions use the write community when one is configured and fall
     * back to the read community otherwise; v3 sessions reuse the USM user.
     */
    SnmpAuth writeAuth() const;

    /**
     * @brief Override polling and addressing fields from OSS_* environment variables.
     */
    void applyEnvironmentOverrides();
};

enum class SessionIssueSeverity {
    Warning,
    Error,
};

struct SessionIssue {
    SessionIssueSeverity severity = SessionIssueSeverity::Error;
    std::string message;
};

std::vector<SessionIssue> validateSessionConfig(const SessionConfig& config);
bool hasErrors(const std::vector<SessionIssue>& issues);

class SessionConfigLoader {
public:
    /**
     * @brief Load a flat JSON session description.
     *
     * Recognized keys: host, port, snmp_version, community_read, community_write,
     * username, auth_type, auth_password, priv_type, priv_password,
     * address_family, scan_interval_s, cycle_timeout_s.
     */
    static bool loadFromJsonFile(const std::string& filePath,
                                 SessionConfig& outConfig,
                                 std::string& outError);
    static bool loadFromJsonText(const std::string& json,
                                 SessionConfig& outConfig,
                                 std::string& outError);
};

std::optional<SnmpVersion> parseSnmpVersion(const std::string& text);
std::optional<SnmpAuthProtocol> parseAuthProtocol(const std::string& text);
std::optional<SnmpPrivProtocol> parsePrivProtocol(const std::string& text);
std::optional<AddressFamily> parseAddressFamily(const std::string& text);
const char* toString(SnmpVersion version);
const char* toString(AddressFamily family);

} // namespace oss
