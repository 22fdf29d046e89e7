/**
 * @file snmp_value.cpp
 * @brief openSwitchSync source file.
 */

#include "openswitchsync/transport/snmp_value.hpp"

#include <cctype>
#include <stdexcept>

namespace oss {

SnmpValue SnmpValue::integer(std::int64_t value) {
    SnmpValue v;
    v.type = SnmpValueType::Integer;
    v.number = value;
    return v;
}

SnmpValue SnmpValue::gauge(std::uint32_t value) {
    SnmpValue v;
    v.type = SnmpValueType::Gauge32;
    v.number = static_cast<std::int64_t>(value);
    return v;
}

SnmpValue SnmpValue::counter(std::uint32_t value) {
    SnmpValue v;
    v.type = SnmpValueType::Counter32;
    v.number = static_cast<std::int64_t>(value);
    return v;
}

SnmpValue SnmpValue::timeTicks(std::uint32_t value) {
    SnmpValue v;
    v.type = SnmpValueType::TimeTicks;
    v.number = static_cast<std::int64_t>(value);
    return v;
}

SnmpValue SnmpValue::text(const std::string& value) {
    SnmpValue v;
    v.type = SnmpValueType::OctetString;
    v.octets.assign(value.begin(), value.end());
    return v;
}

SnmpValue SnmpValue::bytes(std::vector<std::uint8_t> value) {
    SnmpValue v;
    v.type = SnmpValueType::OctetString;
    v.octets = std::move(value);
    return v;
}

SnmpValue SnmpValue::exception(SnmpValueType type) {
    SnmpValue v;
    v.type = type;
    return v;
}

bool SnmpValue::isNumeric() const noexcept {
    switch (type) {
    case SnmpValueType::Integer:
    case SnmpValueType::Gauge32:
    case SnmpValueType::Counter32:
    case SnmpValueType::TimeTicks:
        return true;
    default:
        return false;
    }
}

bool SnmpValue::isException() const noexcept {
    return type == SnmpValueType::Null ||
           type == SnmpValueType::NoSuchObject ||
           type == SnmpValueType::NoSuchInstance ||
           type == SnmpValueType::EndOfMibView;
}

std::optional<std::int64_t> SnmpValue::asInteger() const {
    if (isNumeric()) {
        return number;
    }
    if (type != SnmpValueType::OctetString) {
        return std::nullopt;
    }

    const std::string text(octets.begin(), octets.end());
    if (text.empty()) {
        return std::nullopt;
    }
    std::size_t digitsStart = (text[0] == '-' || text[0] == '+') ? 1U : 0U;
    if (digitsStart == text.size()) {
        return std::nullopt;
    }
    for (std::size_t i = digitsStart; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return std::nullopt;
        }
    }
    try {
        return static_cast<std::int64_t>(std::stoll(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string SnmpValue::asText() const {
    if (type == SnmpValueType::OctetString) {
        return std::string(octets.begin(), octets.end());
    }
    if (isNumeric()) {
        return std::to_string(number);
    }
    return {};
}

const char* toString(SnmpValueType type) {
    switch (type) {
    case SnmpValueType::Integer:
        return "INTEGER";
    case SnmpValueType::OctetString:
        return "STRING";
    case SnmpValueType::Gauge32:
        return "Gauge32";
    case SnmpValueType::Counter32:
        return "Counter32";
    case SnmpValueType::TimeTicks:
        return "Timeticks";
    case SnmpValueType::Null:
        return "Null";
    case SnmpValueType::NoSuchObject:
        return "noSuchObject";
    case SnmpValueType::NoSuchInstance:
        return "noSuchInstance";
    case SnmpValueType::EndOfMibView:
        return "endOfMibView";
    }
    return "UNKNOWN";
}

} // namespace oss
