/**
 * @file identifier_normalizer.cpp
 * @brief openSwitchSync source file.
 */

#include "openswitchsync/core/identifier_normalizer.hpp"

#include <cctype>
#include <limits>
#include <vector>

namespace oss {
namespace {

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::string::size_type begin = 0;
    while (true) {
        const auto pos = text.find(separator, begin);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(begin));
            return parts;
        }
        parts.push_back(text.substr(begin, pos - begin));
        begin = pos + 1U;
    }
}

bool parseComponent(const std::string& component, std::uint32_t& outValue) {
    if (component.empty()) {
        return false;
    }
    std::uint64_t value = 0;
    for (const char c : component) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10U + static_cast<std::uint64_t>(c - '0');
        if (value > std::numeric_limits<std::uint32_t>::max()) {
            return false;
        }
    }
    outValue = static_cast<std::uint32_t>(value);
    return true;
}

} // namespace

std::uint32_t parsePortIndex(const std::string& rowKey) {
    const auto lastDot = rowKey.rfind('.');
    const auto component = (lastDot == std::string::npos) ? rowKey : rowKey.substr(lastDot + 1U);
    std::uint32_t index = 0;
    if (!parseComponent(component, index)) {
        throw MalformedKeyError(rowKey);
    }
    return index;
}

PoeGroupPort parsePoeGroupPort(const std::string& rowKey) {
    const auto parts = split(rowKey, '.');
    if (parts.size() < 2U) {
        throw MalformedKeyError(rowKey);
    }
    PoeGroupPort result;
    if (!parseComponent(parts[parts.size() - 2U], result.group) ||
        !parseComponent(parts.back(), result.port)) {
        throw MalformedKeyError(rowKey);
    }
    return result;
}

std::string normalizeDisplayName(const std::string& raw) {
    const auto parts = split(raw, '/');
    if (parts.size() <= 2U) {
        return raw;
    }
    std::string result = parts[1];
    for (std::size_t i = 2; i < parts.size(); ++i) {
        result += '/';
        result += parts[i];
    }
    return result;
}

std::string joinOid(const std::string& base, const std::string& suffix) {
    return base + "." + suffix;
}

std::string joinOid(const std::string& base, std::uint32_t index) {
    return joinOid(base, std::to_string(index));
}

std::string joinOid(const std::string& base, const PoeGroupPort& groupPort) {
    return joinOid(base, std::to_string(groupPort.group) + "." + std::to_string(groupPort.port));
}

} // namespace oss
