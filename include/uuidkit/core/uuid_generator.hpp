/**
 * @file uuid_generator.hpp
 * @brief RFC 4122 UUID generation, versions 1, 3, 4 and 5.
 *
 * The UuidGenerator owns the state needed by time-based UUIDs: the last
 * timestamp, the clock sequence, a per-tick collision counter and the
 * node id. Name-based and random UUIDs do not touch that state.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#pragma once

#include "uuidkit/core/config.hpp"
#include "uuidkit/core/export.hpp"
#include "uuidkit/core/uuid.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace uuidkit {
namespace core {

/**
 * @brief 100-ns ticks between 1582-10-15 and 1970-01-01 (141427 days).
 */
constexpr uint64_t kGregorianEpochOffset = 122192928000000000ULL;

/**
 * @brief Current wall-clock time in 100-ns ticks since 1582-10-15.
 */
UUIDKIT_CORE_API uint64_t currentGregorianTicks();

/**
 * @enum NodeSource
 * @brief Where the node id of a generator came from.
 */
enum class NodeSource {
    CONFIGURED,   ///< GeneratorConfig::node
    INTERFACE,    ///< First 6-byte hardware address on the host
    RANDOM        ///< Random bytes with bit 0x80 of byte 0 set
};

inline const char* nodeSourceToString(NodeSource source) {
    switch (source) {
        case NodeSource::CONFIGURED: return "configured";
        case NodeSource::INTERFACE: return "interface";
        case NodeSource::RANDOM: return "random";
        default: return "unknown";
    }
}

/**
 * @class UuidGenerator
 * @brief Thread-safe RFC 4122 UUID generator.
 *
 * Version 1 generation serializes on an internal mutex held only while
 * the timestamp, clock sequence and collision counter are updated.
 * Everything else is lock-free.
 *
 * Usage:
 * @code
 * UuidGenerator& gen = UuidGenerator::instance();
 * Uuid a = gen.generateV1();
 * Uuid b = UuidGenerator::generateV5(namespaces::DNS, "www.example.com");
 * std::string text = format(a);
 * @endcode
 *
 * Tests and embedders can construct independent generators with their
 * own GeneratorConfig.
 */
class UUIDKIT_CORE_API UuidGenerator {
public:
    /**
     * @brief Initialize generator state.
     *
     * Picks the node id (configured, hardware address, or random), seeds
     * the clock sequence, reads the clock and creates a random default
     * namespace.
     *
     * @throws utils::EntropyError if the secure random source fails.
     */
    explicit UuidGenerator(GeneratorConfig config = GeneratorConfig());

    ~UuidGenerator() = default;

    // Non-copyable
    UuidGenerator(const UuidGenerator&) = delete;
    UuidGenerator& operator=(const UuidGenerator&) = delete;

    /**
     * @brief Process-wide generator, configured from the environment on first use.
     */
    static UuidGenerator& instance();

    // =========================================================================
    // Generation
    // =========================================================================

    /**
     * @brief Time-based UUID (version 1).
     *
     * When the clock has not advanced since the previous call the
     * collision counter is added to the last timestamp, so rapid calls
     * still produce distinct values.
     */
    Uuid generateV1();

    /**
     * @brief Name-based UUID using MD5 (version 3).
     * @param nameSpace Namespace UUID.
     * @param name Name within the namespace, hashed as raw UTF-8 bytes.
     */
    static Uuid generateV3(const Uuid& nameSpace, const std::string& name);

    /**
     * @throws std::invalid_argument unless nameSpace is exactly 16 bytes.
     */
    static Uuid generateV3(const std::vector<uint8_t>& nameSpace, const std::string& name);

    /**
     * @brief Version 3 UUID in this generator's default namespace.
     */
    Uuid generateV3(const std::string& name) const;

    /**
     * @brief Random UUID (version 4).
     * @throws utils::EntropyError if the secure random source fails.
     */
    static Uuid generateV4();

    /**
     * @brief Name-based UUID using SHA-1 truncated to 16 bytes (version 5).
     */
    static Uuid generateV5(const Uuid& nameSpace, const std::string& name);

    /**
     * @throws std::invalid_argument unless nameSpace is exactly 16 bytes.
     */
    static Uuid generateV5(const std::vector<uint8_t>& nameSpace, const std::string& name);

    /**
     * @brief Version 5 UUID in this generator's default namespace.
     */
    Uuid generateV5(const std::string& name) const;

    // =========================================================================
    // State
    // =========================================================================

    const NodeId& node() const { return node_; }
    NodeSource nodeSource() const { return nodeSource_; }

    /**
     * @brief Random version 4 UUID created at construction.
     */
    const Uuid& defaultNamespace() const { return defaultNamespace_; }

    uint16_t clockSequence() const;

    /**
     * @brief Last clock reading that advanced the generator, in ticks.
     */
    uint64_t lastTimestamp() const;

private:
    void selectNode(const GeneratorConfig& config);

    uint64_t readClock() const;

    TickSource tickSource_;

    mutable std::mutex mutex_;
    uint64_t timestamp_;        // guarded by mutex_
    uint16_t clockSequence_;    // guarded by mutex_
    uint32_t collisionCount_;   // guarded by mutex_

    NodeId node_;
    NodeSource nodeSource_;
    Uuid defaultNamespace_;
};

// =============================================================================
// Process-wide convenience functions
// =============================================================================

UUIDKIT_CORE_API Uuid generateV1();
UUIDKIT_CORE_API Uuid generateV3(const Uuid& nameSpace, const std::string& name);
UUIDKIT_CORE_API Uuid generateV4();
UUIDKIT_CORE_API Uuid generateV5(const Uuid& nameSpace, const std::string& name);

}  // namespace core
}  // namespace uuidkit
