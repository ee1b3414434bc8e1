/**
 * @file platform.hpp
 * @brief Cross-platform includes for network interface enumeration.
 *
 * Abstracts the Windows IP Helper API and POSIX getifaddrs() behind a
 * common set of includes and error helpers.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#ifdef _WIN32
    // Windows
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
    #include <WinSock2.h>
    #include <WS2tcpip.h>
    #include <iphlpapi.h>

    // Link with IP Helper library
    #pragma comment(lib, "iphlpapi.lib")

    namespace uuidkit {
    namespace net {
        inline int getLastPlatformError() { return static_cast<int>(GetLastError()); }
    }  // namespace net
    }  // namespace uuidkit

#else
    // POSIX (Linux, macOS, BSD)
    #include <errno.h>
    #include <ifaddrs.h>
    #include <net/if.h>
    #include <sys/socket.h>
    #include <sys/types.h>

    #if defined(__linux__)
        #include <netpacket/packet.h>
    #else
        #include <net/if_dl.h>
    #endif

    namespace uuidkit {
    namespace net {
        inline int getLastPlatformError() { return errno; }
    }  // namespace net
    }  // namespace uuidkit

#endif
