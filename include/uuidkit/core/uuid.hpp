/**
 * @file uuid.hpp
 * @brief RFC 4122 UUID value and canonical string formatting.
 *
 * A UUID is a plain 16-byte array. Version and variant live in fixed bit
 * positions: the high nibble of byte 6 holds the version, the top two
 * bits of byte 8 hold the variant (0b10 for RFC 4122).
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uuidkit {
namespace core {

constexpr size_t kUuidSize = 16;
constexpr size_t kNodeSize = 6;

using Uuid = std::array<uint8_t, kUuidSize>;
using NodeId = std::array<uint8_t, kNodeSize>;

/**
 * @enum UuidVersion
 * @brief Value of the version nibble (byte 6, bits 4-7).
 */
enum class UuidVersion : uint8_t {
    NONE = 0,           ///< Nil UUID or unknown version
    TIME_BASED = 1,     ///< Timestamp + clock sequence + node
    DCE_SECURITY = 2,   ///< Not generated by this library
    NAME_MD5 = 3,       ///< MD5 of namespace + name
    RANDOM = 4,         ///< Random bits
    NAME_SHA1 = 5       ///< SHA-1 of namespace + name
};

/**
 * @brief Overwrite the version nibble and the variant bits in place.
 */
inline void stampVersionAndVariant(Uuid& uuid, UuidVersion version) {
    uuid[6] = static_cast<uint8_t>((uuid[6] & 0x0F) | (static_cast<uint8_t>(version) << 4));
    uuid[8] = static_cast<uint8_t>((uuid[8] & 0x3F) | 0x80);
}

/**
 * @brief Read the version nibble. Values above 5 report NONE.
 */
UUIDKIT_CORE_API UuidVersion versionOf(const Uuid& uuid);

/**
 * @brief True if byte 8 carries the RFC 4122 variant marker 0b10.
 */
inline bool hasRfc4122Variant(const Uuid& uuid) {
    return (uuid[8] & 0xC0) == 0x80;
}

inline Uuid nilUuid() {
    return Uuid{};
}

UUIDKIT_CORE_API bool isNil(const Uuid& uuid);

/**
 * @brief "00000000-0000-0000-0000-000000000000"
 */
UUIDKIT_CORE_API std::string nilString();

// =============================================================================
// Canonical Formatting
// =============================================================================

/**
 * @brief Format as lowercase xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
 */
UUIDKIT_CORE_API std::string format(const Uuid& uuid);

/**
 * @brief Format an optional UUID; an absent value formats as the nil UUID.
 */
UUIDKIT_CORE_API std::string format(const std::optional<Uuid>& uuid);

/**
 * @brief Format a raw byte sequence.
 *
 * An empty vector is treated as absent and formats as the nil UUID.
 *
 * @throws std::invalid_argument if the vector is non-empty and not 16 bytes.
 */
UUIDKIT_CORE_API std::string format(const std::vector<uint8_t>& bytes);

/**
 * @brief Format a raw buffer; nullptr formats as the nil UUID.
 *
 * @throws std::invalid_argument if bytes is non-null and length is not 16.
 */
UUIDKIT_CORE_API std::string format(const uint8_t* bytes, size_t length);

/**
 * @brief Check whether a string has the canonical 8-4-4-4-12 hex shape.
 *
 * Accepts upper- and lowercase digits. This is a shape check only.
 */
UUIDKIT_CORE_API bool isValid(const std::string& text);

// =============================================================================
// Well-known Namespaces (RFC 4122 Appendix C)
// =============================================================================

namespace namespaces {

/// 6ba7b810-9dad-11d1-80b4-00c04fd430c8, fully-qualified domain names
constexpr Uuid DNS = {0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                      0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};

/// 6ba7b811-9dad-11d1-80b4-00c04fd430c8, URLs
constexpr Uuid URL = {0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                      0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};

/// 6ba7b812-9dad-11d1-80b4-00c04fd430c8, ISO OIDs
constexpr Uuid OID = {0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                      0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};

/// 6ba7b814-9dad-11d1-80b4-00c04fd430c8, X.500 DNs
constexpr Uuid X500 = {0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                       0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};

}  // namespace namespaces

}  // namespace core
}  // namespace uuidkit
