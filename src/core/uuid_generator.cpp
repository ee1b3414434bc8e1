/**
 * @file uuid_generator.cpp
 * @brief UuidGenerator implementation.
 *
 * @copyright Copyright (c) 2024 uuidkit Contributors
 * @license MIT License
 */

#include "uuidkit/core/uuid_generator.hpp"
#include "uuidkit/net/interfaces.hpp"
#include "uuidkit/utils/digest.hpp"
#include "uuidkit/utils/logger.hpp"
#include "uuidkit/utils/random.hpp"

#include <algorithm>
#include <chrono>
#include <ratio>
#include <stdexcept>

namespace uuidkit {
namespace core {

namespace {

using Ticks = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;

// Big-endian field writers
void putU32(Uuid& out, size_t offset, uint32_t value) {
    out[offset] = static_cast<uint8_t>(value >> 24);
    out[offset + 1] = static_cast<uint8_t>(value >> 16);
    out[offset + 2] = static_cast<uint8_t>(value >> 8);
    out[offset + 3] = static_cast<uint8_t>(value);
}

void putU16(Uuid& out, size_t offset, uint16_t value) {
    out[offset] = static_cast<uint8_t>(value >> 8);
    out[offset + 1] = static_cast<uint8_t>(value);
}

/**
 * Lay out a version 1 UUID:
 *   time_low(32) time_mid(16) version(4)+time_hi(12)
 *   variant(2)+clock_seq_hi(6) clock_seq_low(8) node(48)
 */
Uuid packTimeBased(uint64_t ticks, uint16_t clockSequence, const NodeId& node) {
    Uuid out{};
    putU32(out, 0, static_cast<uint32_t>(ticks & 0xFFFFFFFFULL));
    putU16(out, 4, static_cast<uint16_t>((ticks >> 32) & 0xFFFF));
    putU16(out, 6, static_cast<uint16_t>(((ticks >> 48) & 0x0FFF) | 0x1000));
    out[8] = static_cast<uint8_t>(((clockSequence >> 8) & 0x3F) | 0x80);
    out[9] = static_cast<uint8_t>(clockSequence & 0xFF);
    std::copy(node.begin(), node.end(), out.begin() + 10);
    return out;
}

// Namespace bytes followed by the name bytes, no separator (RFC 4122 4.3)
Uuid hashNameBased(utils::DigestAlgorithm algorithm, UuidVersion version,
                   const uint8_t* nameSpace, const std::string& name) {
    utils::MessageDigest digest(algorithm);
    digest.update(nameSpace, kUuidSize);
    digest.update(name);
    std::vector<uint8_t> hash = digest.finalize();

    Uuid out{};
    std::copy_n(hash.begin(), kUuidSize, out.begin());
    stampVersionAndVariant(out, version);
    return out;
}

void requireUuidLength(const std::vector<uint8_t>& nameSpace) {
    if (nameSpace.size() != kUuidSize) {
        throw std::invalid_argument("namespace must be 16 bytes, got " +
                                    std::to_string(nameSpace.size()));
    }
}

}  // namespace

uint64_t currentGregorianTicks() {
    auto sinceUnixEpoch = std::chrono::duration_cast<Ticks>(
        std::chrono::system_clock::now().time_since_epoch());
    return kGregorianEpochOffset + static_cast<uint64_t>(sinceUnixEpoch.count());
}

UuidGenerator::UuidGenerator(GeneratorConfig config)
    : tickSource_(std::move(config.tick_source))
    , timestamp_(0)
    , clockSequence_(0)
    , collisionCount_(0)
    , node_{}
    , nodeSource_(NodeSource::RANDOM)
    , defaultNamespace_{}
{
    selectNode(config);

    clockSequence_ = utils::secureRandomU16();
    timestamp_ = readClock();
    defaultNamespace_ = generateV4();

    LOG_INFO("Generator", "Initialized with {} node {}",
             nodeSourceToString(nodeSource_),
             net::formatHardwareAddress(node_.data(), node_.size()));
    LOG_DEBUG("Generator", "Clock sequence {}, default namespace {}",
              clockSequence_, format(defaultNamespace_));
}

UuidGenerator& UuidGenerator::instance() {
    static UuidGenerator generator(loadConfigFromEnvironment());
    return generator;
}

void UuidGenerator::selectNode(const GeneratorConfig& config) {
    if (config.node) {
        node_ = *config.node;
        nodeSource_ = NodeSource::CONFIGURED;
        return;
    }

    if (config.probe_interfaces) {
        auto interfaces = net::listHardwareInterfaces();
        if (interfaces) {
            if (auto mac = net::firstSixByteAddress(*interfaces)) {
                node_ = *mac;
                nodeSource_ = NodeSource::INTERFACE;
                return;
            }
            LOG_WARN("Generator", "No 6-byte hardware address among {} interfaces",
                     interfaces->size());
        }
    }

    LOG_IF(utils::LogLevel::WARN, "Generator", config.probe_interfaces,
           "Falling back to random node id");

    node_ = utils::secureRandomBytes<kNodeSize>();
    // Not a real hardware address
    node_[0] |= 0x80;
    nodeSource_ = NodeSource::RANDOM;
}

uint64_t UuidGenerator::readClock() const {
    return tickSource_ ? tickSource_() : currentGregorianTicks();
}

Uuid UuidGenerator::generateV1() {
    uint64_t ticks;
    uint16_t clockSequence;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t now = readClock();

        if (now > timestamp_) {
            ++clockSequence_;
            timestamp_ = now;
            collisionCount_ = 0;
            ticks = now;
        } else {
            // Clock did not advance: synthesize sub-tick values
            ++collisionCount_;
            ticks = timestamp_ + collisionCount_;
        }
        clockSequence = clockSequence_;
    }

    return packTimeBased(ticks, clockSequence, node_);
}

Uuid UuidGenerator::generateV3(const Uuid& nameSpace, const std::string& name) {
    return hashNameBased(utils::DigestAlgorithm::MD5, UuidVersion::NAME_MD5,
                         nameSpace.data(), name);
}

Uuid UuidGenerator::generateV3(const std::vector<uint8_t>& nameSpace, const std::string& name) {
    requireUuidLength(nameSpace);
    return hashNameBased(utils::DigestAlgorithm::MD5, UuidVersion::NAME_MD5,
                         nameSpace.data(), name);
}

Uuid UuidGenerator::generateV3(const std::string& name) const {
    return generateV3(defaultNamespace_, name);
}

Uuid UuidGenerator::generateV4() {
    Uuid out = utils::secureRandomBytes<kUuidSize>();
    stampVersionAndVariant(out, UuidVersion::RANDOM);
    return out;
}

Uuid UuidGenerator::generateV5(const Uuid& nameSpace, const std::string& name) {
    return hashNameBased(utils::DigestAlgorithm::SHA1, UuidVersion::NAME_SHA1,
                         nameSpace.data(), name);
}

Uuid UuidGenerator::generateV5(const std::vector<uint8_t>& nameSpace, const std::string& name) {
    requireUuidLength(nameSpace);
    return hashNameBased(utils::DigestAlgorithm::SHA1, UuidVersion::NAME_SHA1,
                         nameSpace.data(), name);
}

Uuid UuidGenerator::generateV5(const std::string& name) const {
    return generateV5(defaultNamespace_, name);
}

uint16_t UuidGenerator::clockSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clockSequence_;
}

uint64_t UuidGenerator::lastTimestamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timestamp_;
}

// =============================================================================
// Process-wide convenience functions
// =============================================================================

Uuid generateV1() {
    return UuidGenerator::instance().generateV1();
}

Uuid generateV3(const Uuid& nameSpace, const std::string& name) {
    return UuidGenerator::generateV3(nameSpace, name);
}

Uuid generateV4() {
    return UuidGenerator::generateV4();
}

Uuid generateV5(const Uuid& nameSpace, const std::string& name) {
    return UuidGenerator::generateV5(nameSpace, name);
}

}  // namespace core
}  // namespace uuidkit
