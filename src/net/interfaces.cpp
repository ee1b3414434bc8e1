/**
 * @file interfaces.cpp
 * @brief Cross-platform network interface enumeration.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/net/interfaces.hpp"
#include "uuidkit/net/platform.hpp"
#include "uuidkit/utils/logger.hpp"

#include <algorithm>
#include <cstdio>
#include <memory>

namespace uuidkit {
namespace net {

namespace {

bool isAllZero(const uint8_t* bytes, size_t length) {
    return std::all_of(bytes, bytes + length, [](uint8_t b) { return b == 0; });
}

void assignAddress(HardwareInterface& iface, const uint8_t* bytes, size_t length) {
    // Loopback and tunnel devices report an all-zero address
    if (length == 0 || isAllZero(bytes, length)) {
        iface.hardware_address.clear();
        return;
    }
    iface.hardware_address.assign(bytes, bytes + length);
}

}  // namespace

std::string HardwareInterface::addressString() const {
    return formatHardwareAddress(hardware_address.data(), hardware_address.size());
}

std::string formatHardwareAddress(const uint8_t* bytes, size_t length) {
    std::string result;
    result.reserve(length * 3);

    char octet[3];
    for (size_t i = 0; i < length; ++i) {
        if (i > 0) {
            result.push_back(':');
        }
        std::snprintf(octet, sizeof(octet), "%02x", static_cast<unsigned>(bytes[i]));
        result.append(octet);
    }
    return result;
}

#ifdef _WIN32

std::optional<std::vector<HardwareInterface>> listHardwareInterfaces() {
    const ULONG flags = GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST |
                        GAA_FLAG_SKIP_DNS_SERVER;
    ULONG bufferSize = 15 * 1024;
    std::vector<uint8_t> buffer;
    ULONG rc = ERROR_BUFFER_OVERFLOW;

    // The adapter list can grow between the sizing call and the real one
    for (int attempt = 0; attempt < 3 && rc == ERROR_BUFFER_OVERFLOW; ++attempt) {
        buffer.resize(bufferSize);
        rc = GetAdaptersAddresses(AF_UNSPEC, flags, nullptr,
                                  reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()),
                                  &bufferSize);
    }

    if (rc != NO_ERROR) {
        LOG_WARN("Interfaces", "GetAdaptersAddresses failed: error {}", rc);
        return std::nullopt;
    }

    std::vector<HardwareInterface> result;
    for (auto* adapter = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data());
         adapter != nullptr; adapter = adapter->Next) {
        HardwareInterface iface;
        iface.name = adapter->AdapterName ? adapter->AdapterName : "";
        iface.index = adapter->IfIndex;
        assignAddress(iface, adapter->PhysicalAddress, adapter->PhysicalAddressLength);
        result.push_back(std::move(iface));
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const HardwareInterface& a, const HardwareInterface& b) {
                         return a.index < b.index;
                     });

    LOG_DEBUG("Interfaces", "Found {} network interfaces", result.size());
    return result;
}

#else

std::optional<std::vector<HardwareInterface>> listHardwareInterfaces() {
    struct ifaddrs* head = nullptr;
    if (getifaddrs(&head) != 0) {
        LOG_WARN("Interfaces", "getifaddrs failed: errno {}", getLastPlatformError());
        return std::nullopt;
    }
    std::unique_ptr<struct ifaddrs, decltype(&freeifaddrs)> guard(head, &freeifaddrs);

    std::vector<HardwareInterface> result;
    for (struct ifaddrs* ifa = head; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) {
            continue;
        }

        HardwareInterface iface;
        iface.name = ifa->ifa_name ? ifa->ifa_name : "";

#if defined(__linux__)
        if (ifa->ifa_addr->sa_family != AF_PACKET) {
            continue;
        }
        const auto* ll = reinterpret_cast<const struct sockaddr_ll*>(ifa->ifa_addr);
        iface.index = static_cast<uint32_t>(ll->sll_ifindex);
        assignAddress(iface, ll->sll_addr,
                      std::min<size_t>(ll->sll_halen, sizeof(ll->sll_addr)));
#else
        if (ifa->ifa_addr->sa_family != AF_LINK) {
            continue;
        }
        const auto* dl = reinterpret_cast<const struct sockaddr_dl*>(ifa->ifa_addr);
        iface.index = static_cast<uint32_t>(dl->sdl_index);
        assignAddress(iface, reinterpret_cast<const uint8_t*>(LLADDR(dl)), dl->sdl_alen);
#endif

        result.push_back(std::move(iface));
    }

    std::stable_sort(result.begin(), result.end(),
                     [](const HardwareInterface& a, const HardwareInterface& b) {
                         return a.index < b.index;
                     });

    LOG_DEBUG("Interfaces", "Found {} link-layer interfaces", result.size());
    return result;
}

#endif

std::optional<MacAddress> firstSixByteAddress(const std::vector<HardwareInterface>& interfaces) {
    for (const auto& iface : interfaces) {
        if (iface.hardware_address.size() != kMacAddressLength) {
            continue;
        }

        MacAddress mac{};
        std::copy(iface.hardware_address.begin(), iface.hardware_address.end(), mac.begin());
        LOG_DEBUG("Interfaces", "Selected {} ({})", iface.name, iface.addressString());
        return mac;
    }
    return std::nullopt;
}

}  // namespace net
}  // namespace uuidkit
