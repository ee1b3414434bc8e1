/**
 * @file config.cpp
 * @brief Generator configuration parsing.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/core/config.hpp"
#include "uuidkit/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace uuidkit {
namespace core {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace

std::optional<NodeId> parseNodeAddress(const std::string& text) {
    // "aa:bb:cc:dd:ee:ff"
    if (text.size() != kNodeSize * 3 - 1) {
        return std::nullopt;
    }

    const char separator = text[2];
    if (separator != ':' && separator != '-') {
        return std::nullopt;
    }

    NodeId node{};
    for (size_t i = 0; i < kNodeSize; ++i) {
        size_t pos = i * 3;
        if (i > 0 && text[pos - 1] != separator) {
            return std::nullopt;
        }
        int hi = hexValue(text[pos]);
        int lo = hexValue(text[pos + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        node[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return node;
}

std::optional<bool> parseFlag(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

GeneratorConfig loadConfigFromEnvironment() {
    GeneratorConfig config;

    if (auto level = readEnv("UUIDKIT_LOG_LEVEL")) {
        if (auto parsed = utils::parseLogLevel(*level)) {
            config.log_level = *level;
            utils::Logger::instance().setLevel(*parsed);
        } else {
            LOG_WARN("Config", "Ignoring unknown UUIDKIT_LOG_LEVEL '{}'", *level);
        }
    }

    if (auto node = readEnv("UUIDKIT_NODE")) {
        config.node = parseNodeAddress(*node);
        if (!config.node) {
            LOG_WARN("Config", "Ignoring malformed UUIDKIT_NODE '{}'", *node);
        }
    }

    if (auto probe = readEnv("UUIDKIT_PROBE_INTERFACES")) {
        if (auto flag = parseFlag(*probe)) {
            config.probe_interfaces = *flag;
        } else {
            LOG_WARN("Config", "Ignoring malformed UUIDKIT_PROBE_INTERFACES '{}'", *probe);
        }
    }

    return config;
}

}  // namespace core
}  // namespace uuidkit
