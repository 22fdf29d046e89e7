/**
 * @file session_config.cpp
 * @brief openSwitchSync source file.
 */

#include "openswitchsync/config/session_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace oss {
namespace {

std::string lowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream file(path);
    if (!file) {
        outError = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

// Matches "key": "value" or "key": 123 / 1.5 in a flat JSON object.
std::optional<std::string> jsonValue(const std::string& json, const std::string& key) {
    std::regex re("\"" + key + "\"\\s*:\\s*(?:\"([^\"]*)\"|([-+0-9.]+))", std::regex_constants::icase);
    std::smatch match;
    if (!std::regex_search(json, match, re)) {
        return std::nullopt;
    }
    if (match[1].matched) {
        return match[1].str();
    }
    return match[2].str();
}

// Upper bound for scan_interval_s/cycle_timeout_s.
constexpr double kMaxDurationSeconds = 86400.0;

std::chrono::milliseconds parseSeconds(const std::string& text) {
    std::size_t consumed = 0;
    const double seconds = std::stod(text, &consumed);
    if (consumed != text.size() || !std::isfinite(seconds) || seconds < 0.0) {
        throw std::invalid_argument("invalid duration: " + text);
    }
    if (seconds > kMaxDurationSeconds) {
        throw std::out_of_range("duration exceeds one day: " + text);
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

std::optional<std::int64_t> parseIntegralEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    try {
        return static_cast<std::int64_t>(std::stoll(value, nullptr, 0));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

SnmpAuth SessionConfig::readAuth() const {
    SnmpAuth auth;
    auth.version = version;
    if (version == SnmpVersion::V3) {
        auth.principal = username;
        auth.authProtocol = authProtocol;
        auth.authPassword = authPassword;
        auth.privProtocol = privProtocol;
        auth.privPassword = privPassword;
    } else {
        auth.principal = communityRead;
    }
    return auth;
}

SnmpAuth SessionConfig::writeAuth() const {
    auto auth = readAuth();
    if (version != SnmpVersion::V3) {
        auto write = communityWrite;
        write.erase(write.begin(),
                    std::find_if(write.begin(), write.end(), [](unsigned char c) { return !std::isspace(c); }));
        write.erase(std::find_if(write.rbegin(), write.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                    write.end());
        if (!write.empty()) {
            auth.principal = write;
        }
    }
    return auth;
}

void SessionConfig::applyEnvironmentOverrides() {
    if (const auto periodMs = parseIntegralEnv("OSS_SCAN_INTERVAL_MS"); periodMs && *periodMs > 0) {
        poll.period = std::chrono::milliseconds(*periodMs);
    }
    if (const auto timeoutMs = parseIntegralEnv("OSS_CYCLE_TIMEOUT_MS"); timeoutMs && *timeoutMs >= 0) {
        poll.cycleTimeout = std::chrono::milliseconds(*timeoutMs);
    }
    if (const char* family = std::getenv("OSS_ADDRESS_FAMILY"); family != nullptr) {
        if (const auto parsed = parseAddressFamily(family)) {
            preferredFamily = *parsed;
        }
    }
}

std::vector<SessionIssue> validateSessionConfig(const SessionConfig& config) {
    std::vector<SessionIssue> issues;
    const auto error = [&](std::string message) {
        issues.push_back({SessionIssueSeverity::Error, std::move(message)});
    };

    if (config.host.empty()) {
        error("host is empty");
    }
    if (config.port == 0U) {
        error("port must be non-zero");
    }
    if (config.version == SnmpVersion::V3) {
        if (config.username.empty()) {
            error("SNMPv3 requires a username");
        }
        if (config.privProtocol != SnmpPrivProtocol::None && config.authProtocol == SnmpAuthProtocol::None) {
            error("SNMPv3 privacy requires an authentication protocol");
        }
        if (config.authProtocol != SnmpAuthProtocol::None && config.authPassword.empty()) {
            error("SNMPv3 authentication protocol set without auth_password");
        }
        if (config.privProtocol != SnmpPrivProtocol::None && config.privPassword.empty()) {
            error("SNMPv3 privacy protocol set without priv_password");
        }
    } else {
        if (config.communityRead.empty()) {
            error("SNMPv1/v2c requires community_read");
        }
        if (config.communityWrite.empty()) {
            issues.push_back({SessionIssueSeverity::Warning,
                              "community_write not set, port control uses community_read"});
        }
    }
    if (config.poll.period.count() <= 0) {
        error("scan interval must be positive");
    }
    if (config.poll.cycleTimeout.count() > 0 && config.poll.cycleTimeout > config.poll.period) {
        issues.push_back({SessionIssueSeverity::Warning, "cycle timeout exceeds scan interval"});
    }
    return issues;
}

bool hasErrors(const std::vector<SessionIssue>& issues) {
    return std::any_of(issues.begin(), issues.end(),
                       [](const SessionIssue& issue) { return issue.severity == SessionIssueSeverity::Error; });
}

bool SessionConfigLoader::loadFromJsonFile(const std::string& filePath,
                                           SessionConfig& outConfig,
                                           std::string& outError) {
    outError.clear();
    std::string json;
    if (!readFile(filePath, json, outError)) {
        return false;
    }
    return loadFromJsonText(json, outConfig, outError);
}

bool SessionConfigLoader::loadFromJsonText(const std::string& json,
                                           SessionConfig& outConfig,
                                           std::string& outError) {
    outConfig = SessionConfig{};
    outError.clear();

    try {
        const auto host = jsonValue(json, "host");
        if (!host) {
            outError = "Session config is missing 'host'";
            return false;
        }
        outConfig.host = *host;

        if (const auto port = jsonValue(json, "port")) {
            std::size_t consumed = 0;
            const auto value = std::stoul(*port, &consumed, 10);
            if (consumed != port->size() || value == 0UL || value > 0xFFFFUL) {
                outError = "Invalid port: " + *port;
                return false;
            }
            outConfig.port = static_cast<std::uint16_t>(value);
        }

        if (const auto version = jsonValue(json, "snmp_version")) {
            const auto parsed = parseSnmpVersion(*version);
            if (!parsed) {
                outError = "Unknown snmp_version: " + *version;
                return false;
            }
            outConfig.version = *parsed;
        }

        outConfig.communityRead = jsonValue(json, "community_read").value_or("");
        outConfig.communityWrite = jsonValue(json, "community_write").value_or("");
        outConfig.username = jsonValue(json, "username").value_or("");
        outConfig.authPassword = jsonValue(json, "auth_password").value_or("");
        outConfig.privPassword = jsonValue(json, "priv_password").value_or("");

        if (const auto auth = jsonValue(json, "auth_type")) {
            const auto parsed = parseAuthProtocol(*auth);
            if (!parsed) {
                outError = "Unknown auth_type: " + *auth;
                return false;
            }
            outConfig.authProtocol = *parsed;
        }
        if (const auto priv = jsonValue(json, "priv_type")) {
            const auto parsed = parsePrivProtocol(*priv);
            if (!parsed) {
                outError = "Unknown priv_type: " + *priv;
                return false;
            }
            outConfig.privProtocol = *parsed;
        }
        if (const auto family = jsonValue(json, "address_family")) {
            const auto parsed = parseAddressFamily(*family);
            if (!parsed) {
                outError = "Unknown address_family: " + *family;
                return false;
            }
            outConfig.preferredFamily = *parsed;
        }
        if (const auto interval = jsonValue(json, "scan_interval_s")) {
            outConfig.poll.period = parseSeconds(*interval);
        }
        if (const auto timeout = jsonValue(json, "cycle_timeout_s")) {
            outConfig.poll.cycleTimeout = parseSeconds(*timeout);
        }
        return true;
    } catch (const std::exception& ex) {
        outError = std::string("Session config parse error: ") + ex.what();
        return false;
    }
}

std::optional<SnmpVersion> parseSnmpVersion(const std::string& text) {
    const auto value = lowerCopy(text);
    if (value == "v1" || value == "1") {
        return SnmpVersion::V1;
    }
    if (value == "v2c" || value == "2c" || value == "2") {
        return SnmpVersion::V2c;
    }
    if (value == "v3" || value == "3") {
        return SnmpVersion::V3;
    }
    return std::nullopt;
}

std::optional<SnmpAuthProtocol> parseAuthProtocol(const std::string& text) {
    const auto value = lowerCopy(text);
    if (value == "none") {
        return SnmpAuthProtocol::None;
    }
    if (value == "md5") {
        return SnmpAuthProtocol::Md5;
    }
    if (value == "sha") {
        return SnmpAuthProtocol::Sha;
    }
    return std::nullopt;
}

std::optional<SnmpPrivProtocol> parsePrivProtocol(const std::string& text) {
    const auto value = lowerCopy(text);
    if (value == "none") {
        return SnmpPrivProtocol::None;
    }
    if (value == "des") {
        return SnmpPrivProtocol::Des;
    }
    if (value == "aes") {
        return SnmpPrivProtocol::Aes;
    }
    return std::nullopt;
}

std::optional<AddressFamily> parseAddressFamily(const std::string& text) {
    const auto value = lowerCopy(text);
    if (value == "ipv4" || value == "udp" || value == "4") {
        return AddressFamily::Ipv4;
    }
    if (value == "ipv6" || value == "udp6" || value == "6") {
        return AddressFamily::Ipv6;
    }
    return std::nullopt;
}

const char* toString(SnmpVersion version) {
    switch (version) {
    case SnmpVersion::V1:
        return "v1";
    case SnmpVersion::V2c:
        return "v2c";
    case SnmpVersion::V3:
        return "v3";
    }
    return "unknown";
}

const char* toString(AddressFamily family) {
    return family == AddressFamily::Ipv6 ? "ipv6" : "ipv4";
}

} // namespace oss
