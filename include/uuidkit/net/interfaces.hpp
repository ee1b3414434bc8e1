/**
 * @file interfaces.hpp
 * @brief Host network interface enumeration.
 *
 * Reports the hardware (link-layer) address of each interface. Used to
 * pick a node identifier for time-based UUIDs.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/net/export.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace uuidkit {
namespace net {

/**
 * @brief Length of an IEEE 802 MAC-48 address.
 */
constexpr size_t kMacAddressLength = 6;

using MacAddress = std::array<uint8_t, kMacAddressLength>;

/**
 * @struct HardwareInterface
 * @brief One network interface and its hardware address.
 */
struct UUIDKIT_NET_API HardwareInterface {
    std::string name;                       ///< OS interface name ("eth0")
    uint32_t index;                         ///< OS interface index
    std::vector<uint8_t> hardware_address;  ///< Empty when none or all-zero

    HardwareInterface() : index(0) {}

    /**
     * @brief Colon-separated lowercase hex, e.g. "00:1a:2b:3c:4d:5e".
     */
    std::string addressString() const;
};

/**
 * @brief Enumerate the host's network interfaces, ordered by index.
 *
 * Best-effort probe: a failure of the OS call is logged and reported as
 * std::nullopt rather than thrown.
 *
 * @return The interfaces, or std::nullopt if enumeration failed.
 */
UUIDKIT_NET_API std::optional<std::vector<HardwareInterface>> listHardwareInterfaces();

/**
 * @brief Select the first interface whose address is exactly 6 bytes.
 * @return The address, or std::nullopt if none qualifies.
 */
UUIDKIT_NET_API std::optional<MacAddress> firstSixByteAddress(
    const std::vector<HardwareInterface>& interfaces);

/**
 * @brief Format bytes as colon-separated lowercase hex.
 */
UUIDKIT_NET_API std::string formatHardwareAddress(const uint8_t* bytes, size_t length);

}  // namespace net
}  // namespace uuidkit
