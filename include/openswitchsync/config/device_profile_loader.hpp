/**
 * @file device_profile_loader.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <string>

#include "openswitchsync/transport/mock_transport.hpp"

namespace oss {

/**
 * @brief Seeds a MockTransport from a plain-text device profile.
 *
 * One entry per line: `<oid> <TYPE> <value>` where TYPE is one of INTEGER,
 * STRING, HEX, GAUGE, COUNTER or TIMETICKS. `fail-walk <oid>` and
 * `fail-get <oid>` inject transport failures. `#` starts a comment.
 */
class DeviceProfileLoader {
public:
    static bool loadFromFile(const std::string& filePath,
                             MockTransport& transport,
                             std::string& outError);
    static bool loadFromText(const std::string& text,
                             MockTransport& transport,
                             std::string& outError);
};

} // namespace oss
