/**
 * @file device_profile_loader.cpp
 * @brief openSwitchSync source file.
 */

#include "openswitchsync/config/device_profile_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace oss {
namespace {

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

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::int64_t parseSigned(const std::string& text) {
    std::size_t consumed = 0;
    const auto value = std::stoll(text, &consumed, 10);
    if (consumed != text.size()) {
        throw std::invalid_argument("invalid integer '" + text + "'");
    }
    return value;
}

std::uint32_t parseUnsigned32(const std::string& text) {
    if (text.empty() || text.front() == '-') {
        throw std::invalid_argument("invalid unsigned value '" + text + "'");
    }
    std::size_t consumed = 0;
    const auto value = std::stoull(text, &consumed, 10);
    if (consumed != text.size() || value > std::numeric_limits<std::uint32_t>::max()) {
        throw std::invalid_argument("invalid unsigned value '" + text + "'");
    }
    return static_cast<std::uint32_t>(value);
}

std::vector<std::uint8_t> parseHex(const std::string& text) {
    std::string digits;
    for (const char c : text) {
        if (c == ':' || c == ' ' || c == '-') {
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("invalid hex payload '" + text + "'");
        }
        digits.push_back(c);
    }
    if (digits.size() % 2U != 0U) {
        throw std::invalid_argument("odd hex digit count in '" + text + "'");
    }
    std::vector<std::uint8_t> out;
    out.reserve(digits.size() / 2U);
    for (std::size_t i = 0; i < digits.size(); i += 2U) {
        out.push_back(static_cast<std::uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return out;
}

std::string unquote(const std::string& text) {
    if (text.size() >= 2U && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2U);
    }
    return text;
}

SnmpValue parseValue(const std::string& type, const std::string& text) {
    if (type == "INTEGER") {
        return SnmpValue::integer(parseSigned(text));
    }
    if (type == "STRING") {
        return SnmpValue::text(unquote(text));
    }
    if (type == "HEX") {
        return SnmpValue::bytes(parseHex(text));
    }
    if (type == "GAUGE") {
        return SnmpValue::gauge(parseUnsigned32(text));
    }
    if (type == "COUNTER") {
        return SnmpValue::counter(parseUnsigned32(text));
    }
    if (type == "TIMETICKS") {
        return SnmpValue::timeTicks(parseUnsigned32(text));
    }
    throw std::invalid_argument("unknown value type '" + type + "'");
}

} // namespace

bool DeviceProfileLoader::loadFromFile(const std::string& filePath,
                                       MockTransport& transport,
                                       std::string& outError) {
    outError.clear();
    std::string text;
    if (!readFile(filePath, text, outError)) {
        return false;
    }
    return loadFromText(text, transport, outError);
}

bool DeviceProfileLoader::loadFromText(const std::string& text,
                                       MockTransport& transport,
                                       std::string& outError) {
    outError.clear();
    std::istringstream lines(text);
    std::string line;
    std::size_t lineNumber = 0;
    std::size_t entries = 0;

    while (std::getline(lines, line)) {
        ++lineNumber;
        const auto hash = line.find('#');
        if (hash != std::string::npos && line.find('"') > hash) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        try {
            const auto firstSpace = line.find_first_of(" \t");
            if (firstSpace == std::string::npos) {
                throw std::invalid_argument("expected '<oid> <TYPE> <value>'");
            }
            const auto head = line.substr(0, firstSpace);
            const auto rest = trim(line.substr(firstSpace + 1));

            if (head == "fail-walk") {
                transport.failWalk(rest);
                ++entries;
                continue;
            }
            if (head == "fail-get") {
                transport.failGet(rest);
                ++entries;
                continue;
            }

            const auto typeEnd = rest.find_first_of(" \t");
            const auto type = upper(rest.substr(0, typeEnd));
            const auto valueText = typeEnd == std::string::npos ? std::string{} : trim(rest.substr(typeEnd + 1));
            if (valueText.empty() && type != "STRING") {
                throw std::invalid_argument("missing value");
            }
            transport.setValue(head, parseValue(type, valueText));
            ++entries;
        } catch (const std::exception& ex) {
            outError = "Device profile line " + std::to_string(lineNumber) + ": " + ex.what();
            return false;
        }
    }

    if (entries == 0U) {
        outError = "No device profile entries found";
        return false;
    }
    return true;
}

} // namespace oss
