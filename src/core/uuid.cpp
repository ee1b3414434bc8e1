/**
 * @file uuid.cpp
 * @brief UUID formatting and inspection.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/core/uuid.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace uuidkit {
namespace core {

namespace {

// Exclusive end byte of each group in the 8-4-4-4-12 layout
constexpr size_t kGroupEnds[] = {4, 6, 8, 10, 16};

std::string formatBytes(const uint8_t* bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    size_t i = 0;
    for (size_t group = 0; group < 5; ++group) {
        if (group > 0) {
            oss << '-';
        }
        for (; i < kGroupEnds[group]; ++i) {
            oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
        }
    }

    return oss.str();
}

}  // namespace

UuidVersion versionOf(const Uuid& uuid) {
    uint8_t nibble = static_cast<uint8_t>(uuid[6] >> 4);
    if (nibble > static_cast<uint8_t>(UuidVersion::NAME_SHA1)) {
        return UuidVersion::NONE;
    }
    return static_cast<UuidVersion>(nibble);
}

bool isNil(const Uuid& uuid) {
    return std::all_of(uuid.begin(), uuid.end(), [](uint8_t b) { return b == 0; });
}

std::string nilString() {
    return "00000000-0000-0000-0000-000000000000";
}

std::string format(const Uuid& uuid) {
    return formatBytes(uuid.data());
}

std::string format(const std::optional<Uuid>& uuid) {
    if (!uuid) {
        return nilString();
    }
    return formatBytes(uuid->data());
}

std::string format(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return nilString();
    }
    return format(bytes.data(), bytes.size());
}

std::string format(const uint8_t* bytes, size_t length) {
    if (bytes == nullptr) {
        return nilString();
    }
    if (length != kUuidSize) {
        throw std::invalid_argument("UUID must be 16 bytes, got " + std::to_string(length));
    }
    return formatBytes(bytes);
}

bool isValid(const std::string& text) {
    if (text.length() != 36) {
        return false;
    }

    for (size_t i = 0; i < text.length(); ++i) {
        char c = text[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else {
            if (!((c >= '0' && c <= '9') ||
                  (c >= 'a' && c <= 'f') ||
                  (c >= 'A' && c <= 'F'))) {
                return false;
            }
        }
    }

    return true;
}

}  // namespace core
}  // namespace uuidkit
