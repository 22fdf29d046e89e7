/**
 * @file result.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace oss {

enum class TransportErrorKind : std::uint8_t {
    // Request never produced a response (timeout, socket, USM negotiation).
    Transport,
    // Device answered with a non-zero error-status PDU field.
    ErrorStatus,
};

struct TransportError {
    TransportErrorKind kind = TransportErrorKind::Transport;
    std::int32_t errorStatus = 0;
    std::string message;
};

/**
 * @brief Either a value or a transport error; produced once at the transport boundary.
 */
template <typename T>
class TransportResult {
public:
    static TransportResult success(T value) {
        TransportResult result;
        result.value_ = std::move(value);
        return result;
    }

    static TransportResult failure(TransportError error) {
        TransportResult result;
        result.error_ = std::move(error);
        return result;
    }

    static TransportResult failure(TransportErrorKind kind, std::string message, std::int32_t errorStatus = 0) {
        return failure(TransportError{kind, errorStatus, std::move(message)});
    }

    bool ok() const noexcept { return value_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }

    // Only meaningful when !ok().
    const TransportError& error() const noexcept { return error_; }

private:
    TransportResult() = default;

    std::optional<T> value_;
    TransportError error_{};
};

using TransportStatus = TransportResult<std::monostate>;

} // namespace oss
