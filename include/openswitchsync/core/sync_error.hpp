/**
 * @file sync_error.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace oss {

enum class SyncErrorCode {
    None,
    MalformedKey,
    DiscoveryFailed,
    UpdateFailed,
    ControlRejected,
    UnsupportedOperation,
    PortNotFound,
    Cancelled,
};

/**
 * @brief Typed failure reported by coordinator operations.
 */
struct SyncError {
    SyncErrorCode code = SyncErrorCode::None;
    std::string message;

    bool ok() const noexcept { return code == SyncErrorCode::None; }
};

/**
 * @brief Raised by identifier parsers when a table-row key has no usable numeric suffix.
 */
class MalformedKeyError : public std::invalid_argument {
public:
    explicit MalformedKeyError(const std::string& rowKey)
        : std::invalid_argument("malformed row key: '" + rowKey + "'"), rowKey_(rowKey) {}

    const std::string& rowKey() const noexcept { return rowKey_; }
    SyncErrorCode code() const noexcept { return SyncErrorCode::MalformedKey; }

private:
    std::string rowKey_;
};

inline const char* toString(SyncErrorCode code) {
    switch (code) {
    case SyncErrorCode::None:
        return "None";
    case SyncErrorCode::MalformedKey:
        return "MalformedKey";
    case SyncErrorCode::DiscoveryFailed:
        return "DiscoveryFailed";
    case SyncErrorCode::UpdateFailed:
        return "UpdateFailed";
    case SyncErrorCode::ControlRejected:
        return "ControlRejected";
    case SyncErrorCode::UnsupportedOperation:
        return "UnsupportedOperation";
    case SyncErrorCode::PortNotFound:
        return "PortNotFound";
    case SyncErrorCode::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

} // namespace oss
