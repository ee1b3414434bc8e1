/**
 * @file config.hpp
 * @brief UuidGenerator configuration and environment parsing.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/export.hpp"
#include "uuidkit/core/uuid.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace uuidkit {
namespace core {

/**
 * @brief Source of the current time in 100-ns ticks since 1582-10-15.
 */
using TickSource = std::function<uint64_t()>;

/**
 * @struct GeneratorConfig
 * @brief Start-up options for a UuidGenerator.
 */
struct UUIDKIT_CORE_API GeneratorConfig {
    std::optional<NodeId> node;         ///< Explicit node id; skips the interface probe
    bool probe_interfaces = true;       ///< Look for a hardware address before falling back to random
    TickSource tick_source;             ///< Clock override (empty = system clock)
    std::string log_level = "INFO";     ///< Applied by loadConfigFromEnvironment()
};

/**
 * @brief Parse "aa:bb:cc:dd:ee:ff" (or '-' separated) into a node id.
 * @return The node id, or std::nullopt if the text is malformed.
 */
UUIDKIT_CORE_API std::optional<NodeId> parseNodeAddress(const std::string& text);

/**
 * @brief Parse "1"/"0"/"true"/"false"/"yes"/"no"/"on"/"off".
 */
UUIDKIT_CORE_API std::optional<bool> parseFlag(const std::string& text);

/**
 * @brief Build a configuration from the process environment.
 *
 * Recognised variables:
 *  - UUIDKIT_NODE               explicit node id, "aa:bb:cc:dd:ee:ff"
 *  - UUIDKIT_PROBE_INTERFACES   "0" disables the hardware address probe
 *  - UUIDKIT_LOG_LEVEL          TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF
 *
 * Malformed values are logged and ignored. A valid log level is also
 * applied to the Logger.
 */
UUIDKIT_CORE_API GeneratorConfig loadConfigFromEnvironment();

}  // namespace core
}  // namespace uuidkit
