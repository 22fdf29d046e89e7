/**
 * @file identifier_normalizer.hpp
 * @brief openSwitchSync source file.
 */

#pragma once

#include <cstdint>
#include <string>

#include "openswitchsync/core/port_state.hpp"
#include "openswitchsync/core/sync_error.hpp"

namespace oss {

/**
 * @brief Extract the trailing integer component of a table-row OID.
 *
 * "1.3.6.1.2.1.2.2.1.8.17" yields 17.
 *
 * @throws MalformedKeyError if the last dot-separated component is empty,
 *         non-numeric, or does not fit in 32 bits.
 */
std::uint32_t parsePortIndex(const std::string& rowKey);

/**
 * @brief Extract the last two components of a PoE table-row OID as group/port.
 *
 * @throws MalformedKeyError on fewer than two numeric trailing components.
 */
PoeGroupPort parsePoeGroupPort(const std::string& rowKey);

/**
 * @brief Drop the stack/unit prefix from names with more than two '/' segments.
 *
 * "1/2/5" becomes "2/5"; "1/5" and "eth0" are returned unchanged.
 */
std::string normalizeDisplayName(const std::string& raw);

std::string joinOid(const std::string& base, const std::string& suffix);
std::string joinOid(const std::string& base, std::uint32_t index);
std::string joinOid(const std::string& base, const PoeGroupPort& groupPort);

} // namespace oss
