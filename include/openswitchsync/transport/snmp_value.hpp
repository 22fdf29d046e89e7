/**
 * @file snmp_value.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace oss {

enum class SnmpValueType : std::uint8_t {
    Integer,
    OctetString,
    Gauge32,
    Counter32,
    TimeTicks,
    Null,
    NoSuchObject,
    NoSuchInstance,
    EndOfMibView,
};

/**
 * @brief Decoded variable-binding value as handed over by a transport.
 *
 * Numeric SMI types share `number`; OCTET STRING payloads keep their raw bytes
 * in `octets` so callers can choose between text and binary rendering.
 */
struct SnmpValue {
    SnmpValueType type = SnmpValueType::Null;
    std::int64_t number = 0;
    std::vector<std::uint8_t> octets;

    static SnmpValue integer(std::int64_t value);
    static SnmpValue gauge(std::uint32_t value);
    static SnmpValue counter(std::uint32_t value);
    static SnmpValue timeTicks(std::uint32_t value);
    static SnmpValue text(const std::string& value);
    static SnmpValue bytes(std::vector<std::uint8_t> value);
    static SnmpValue exception(SnmpValueType type);

    bool isNumeric() const noexcept;
    /**
     * @brief True for NoSuchObject/NoSuchInstance/EndOfMibView and Null.
     */
    bool isException() const noexcept;
    /**
     * @brief Integer view of the value.
     *
     * Numeric types convert directly. OCTET STRING converts only when its text
     * is a plain (optionally signed) decimal integer.
     */
    std::optional<std::int64_t> asInteger() const;
    /**
     * @brief Textual rendering; exception values render as an empty string.
     */
    std::string asText() const;
};

/**
 * @brief One (OID, value) row returned by a table walk.
 */
struct VarBind {
    std::string oid;
    SnmpValue value;
};

const char* toString(SnmpValueType type);

} // namespace oss
