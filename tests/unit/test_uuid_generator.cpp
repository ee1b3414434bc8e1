/**
 * @file test_uuid_generator.cpp
 * @brief Unit tests for UUID generation
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uuidkit/core/uuid_generator.hpp>
#include <uuidkit/utils/logger.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace uuidkit::core;
using ::testing::MatchesRegex;

namespace {

const char* const kCanonicalPattern =
    "[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}";

const NodeId kTestNode = {0x02, 0x42, 0xac, 0x11, 0x00, 0x02};

// Reassemble the 60-bit timestamp of a version 1 UUID
uint64_t timestampOf(const Uuid& uuid) {
    return (static_cast<uint64_t>(uuid[6] & 0x0F) << 56) |
           (static_cast<uint64_t>(uuid[7]) << 48) |
           (static_cast<uint64_t>(uuid[4]) << 40) |
           (static_cast<uint64_t>(uuid[5]) << 32) |
           (static_cast<uint64_t>(uuid[0]) << 24) |
           (static_cast<uint64_t>(uuid[1]) << 16) |
           (static_cast<uint64_t>(uuid[2]) << 8) |
           static_cast<uint64_t>(uuid[3]);
}

uint16_t clockSequenceOf(const Uuid& uuid) {
    return static_cast<uint16_t>(((uuid[8] & 0x3F) << 8) | uuid[9]);
}

GeneratorConfig testConfig() {
    GeneratorConfig config;
    config.node = kTestNode;
    return config;
}

}  // namespace

class UuidGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        uuidkit::utils::Logger::instance().setLevel(uuidkit::utils::LogLevel::WARN);
    }

    void TearDown() override {
        uuidkit::utils::Logger::instance().setLevel(uuidkit::utils::LogLevel::INFO);
    }
};

// =============================================================================
// Initialization
// =============================================================================

TEST_F(UuidGeneratorTest, ConfiguredNode) {
    UuidGenerator gen(testConfig());
    EXPECT_EQ(gen.nodeSource(), NodeSource::CONFIGURED);
    EXPECT_EQ(gen.node(), kTestNode);

    Uuid uuid = gen.generateV1();
    EXPECT_TRUE(std::equal(kTestNode.begin(), kTestNode.end(), uuid.begin() + 10));
}

TEST_F(UuidGeneratorTest, RandomNodeFallbackSetsTopBit) {
    GeneratorConfig config;
    config.probe_interfaces = false;

    for (int i = 0; i < 16; ++i) {
        UuidGenerator gen(config);
        EXPECT_EQ(gen.nodeSource(), NodeSource::RANDOM);
        EXPECT_EQ(gen.node()[0] & 0x80, 0x80);
    }
}

TEST_F(UuidGeneratorTest, ProbedNodeIsNeverEmpty) {
    UuidGenerator gen;
    EXPECT_NE(gen.nodeSource(), NodeSource::CONFIGURED);
    if (gen.nodeSource() == NodeSource::RANDOM) {
        EXPECT_EQ(gen.node()[0] & 0x80, 0x80);
    }
    NodeId zero{};
    EXPECT_NE(gen.node(), zero);
}

TEST_F(UuidGeneratorTest, DefaultNamespaceIsVersion4) {
    UuidGenerator gen(testConfig());
    EXPECT_EQ(versionOf(gen.defaultNamespace()), UuidVersion::RANDOM);
    EXPECT_TRUE(hasRfc4122Variant(gen.defaultNamespace()));

    UuidGenerator other(testConfig());
    EXPECT_NE(gen.defaultNamespace(), other.defaultNamespace());
}

TEST_F(UuidGeneratorTest, InstanceIsShared) {
    EXPECT_EQ(&UuidGenerator::instance(), &UuidGenerator::instance());
}

// =============================================================================
// Version and Variant Bits
// =============================================================================

TEST_F(UuidGeneratorTest, VersionAndVariantBits) {
    UuidGenerator gen(testConfig());

    Uuid v1 = gen.generateV1();
    Uuid v3 = UuidGenerator::generateV3(gen.defaultNamespace(), "test");
    Uuid v4 = UuidGenerator::generateV4();
    Uuid v5 = UuidGenerator::generateV5(gen.defaultNamespace(), "test");

    EXPECT_EQ(v1[6] >> 4, 1);
    EXPECT_EQ(v3[6] >> 4, 3);
    EXPECT_EQ(v4[6] >> 4, 4);
    EXPECT_EQ(v5[6] >> 4, 5);

    for (const Uuid& uuid : {v1, v3, v4, v5}) {
        EXPECT_EQ(uuid[8] >> 6, 2);
    }
}

TEST_F(UuidGeneratorTest, FreeFunctionsCarryVersions) {
    EXPECT_EQ(versionOf(generateV1()), UuidVersion::TIME_BASED);
    EXPECT_EQ(versionOf(generateV3(namespaces::URL, "a")), UuidVersion::NAME_MD5);
    EXPECT_EQ(versionOf(generateV4()), UuidVersion::RANDOM);
    EXPECT_EQ(versionOf(generateV5(namespaces::URL, "a")), UuidVersion::NAME_SHA1);
}

// =============================================================================
// Version 1
// =============================================================================

TEST_F(UuidGeneratorTest, V1ConsecutiveValuesDiffer) {
    UuidGenerator gen(testConfig());

    Uuid last = gen.generateV1();
    for (int i = 0; i < 10000; ++i) {
        Uuid next = gen.generateV1();
        ASSERT_NE(format(next), format(last)) << "duplicate at iteration " << i;
        last = next;
    }
}

TEST_F(UuidGeneratorTest, V1GloballyUnique) {
    UuidGenerator gen(testConfig());

    std::set<Uuid> seen;
    for (int i = 0; i < 10000; ++i) {
        seen.insert(gen.generateV1());
    }
    EXPECT_EQ(seen.size(), 10000u);
}

TEST_F(UuidGeneratorTest, V1FrozenClockUsesCollisionCounter) {
    const uint64_t frozen = currentGregorianTicks();
    GeneratorConfig config = testConfig();
    config.tick_source = [frozen]() { return frozen; };

    UuidGenerator gen(config);
    const uint16_t sequence = gen.clockSequence();

    for (uint64_t i = 1; i <= 100; ++i) {
        Uuid uuid = gen.generateV1();
        EXPECT_EQ(timestampOf(uuid), frozen + i);
        EXPECT_EQ(clockSequenceOf(uuid), sequence & 0x3FFF);
    }

    EXPECT_EQ(gen.lastTimestamp(), frozen);
    EXPECT_EQ(gen.clockSequence(), sequence);
}

TEST_F(UuidGeneratorTest, V1AdvancingClockBumpsClockSequence) {
    auto tick = std::make_shared<std::atomic<uint64_t>>(currentGregorianTicks());
    GeneratorConfig config = testConfig();
    config.tick_source = [tick]() { return tick->fetch_add(10) + 10; };

    UuidGenerator gen(config);
    uint16_t sequence = gen.clockSequence();

    for (int i = 0; i < 5; ++i) {
        Uuid uuid = gen.generateV1();
        ++sequence;
        EXPECT_EQ(gen.clockSequence(), sequence);
        EXPECT_EQ(clockSequenceOf(uuid), sequence & 0x3FFF);
        EXPECT_EQ(timestampOf(uuid), gen.lastTimestamp());
    }
}

TEST_F(UuidGeneratorTest, V1BackwardClockNeverDecreases) {
    const uint64_t start = currentGregorianTicks();
    auto readings = std::make_shared<std::vector<uint64_t>>(std::vector<uint64_t>{
        start,          // construction
        start - 1000,   // clock stepped back
        start - 999,
        start + 5000,   // recovered
        start + 5000,
    });
    auto next = std::make_shared<size_t>(0);

    GeneratorConfig config = testConfig();
    config.tick_source = [readings, next]() {
        size_t i = std::min(*next, readings->size() - 1);
        ++*next;
        return (*readings)[i];
    };

    UuidGenerator gen(config);

    EXPECT_EQ(timestampOf(gen.generateV1()), start + 1);
    EXPECT_EQ(timestampOf(gen.generateV1()), start + 2);
    EXPECT_EQ(timestampOf(gen.generateV1()), start + 5000);
    EXPECT_EQ(timestampOf(gen.generateV1()), start + 5001);
}

TEST_F(UuidGeneratorTest, V1TimestampTracksWallClock) {
    UuidGenerator gen(testConfig());
    uint64_t before = currentGregorianTicks();
    Uuid uuid = gen.generateV1();
    uint64_t after = currentGregorianTicks();

    uint64_t ts = timestampOf(uuid);
    EXPECT_GE(ts, before);
    // Collision counter may push it a little past the second reading
    EXPECT_LE(ts, after + 10000);
}

TEST_F(UuidGeneratorTest, ConcurrentV1Unique) {
    UuidGenerator gen(testConfig());

    std::set<Uuid> uuids;
    std::mutex mtx;
    std::vector<std::thread> threads;
    const int num_threads = 8;
    const int uuids_per_thread = 2000;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&gen, &uuids, &mtx]() {
            std::vector<Uuid> local;
            local.reserve(uuids_per_thread);
            for (int j = 0; j < uuids_per_thread; ++j) {
                local.push_back(gen.generateV1());
            }
            std::lock_guard<std::mutex> lock(mtx);
            uuids.insert(local.begin(), local.end());
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(uuids.size(), static_cast<size_t>(num_threads * uuids_per_thread));
}

// =============================================================================
// Version 4
// =============================================================================

TEST_F(UuidGeneratorTest, V4Unique) {
    std::set<Uuid> seen;
    for (int i = 0; i < 10000; ++i) {
        seen.insert(UuidGenerator::generateV4());
    }
    EXPECT_EQ(seen.size(), 10000u);
}

TEST_F(UuidGeneratorTest, V4FormatsCanonically) {
    for (int i = 0; i < 100; ++i) {
        EXPECT_THAT(format(UuidGenerator::generateV4()), MatchesRegex(kCanonicalPattern));
    }
}

// =============================================================================
// Versions 3 and 5
// =============================================================================

TEST_F(UuidGeneratorTest, V3GoldenZeroNamespace) {
    Uuid zero{};
    EXPECT_EQ(format(UuidGenerator::generateV3(zero, "test")),
              "96e17d7a-ac89-38cf-95e1-bf5098da34e1");
}

TEST_F(UuidGeneratorTest, V5GoldenZeroNamespace) {
    Uuid zero{};
    EXPECT_EQ(format(UuidGenerator::generateV5(zero, "test")),
              "e8b764da-5fe5-51ed-8af8-c5c6eca28d7a");
}

TEST_F(UuidGeneratorTest, GoldenDnsNamespace) {
    EXPECT_EQ(format(UuidGenerator::generateV3(namespaces::DNS, "www.example.com")),
              "5df41881-3aed-3515-88a7-2f4a814cf09e");
    EXPECT_EQ(format(UuidGenerator::generateV5(namespaces::DNS, "www.example.com")),
              "2ed6657d-e927-568b-95e1-2665a8aea6a2");
}

TEST_F(UuidGeneratorTest, NameBasedDeterministic) {
    Uuid ns = UuidGenerator::generateV4();
    EXPECT_EQ(UuidGenerator::generateV3(ns, "test"), UuidGenerator::generateV3(ns, "test"));
    EXPECT_EQ(UuidGenerator::generateV5(ns, "test"), UuidGenerator::generateV5(ns, "test"));
}

TEST_F(UuidGeneratorTest, V3AndV5Differ) {
    Uuid ns = UuidGenerator::generateV4();
    EXPECT_NE(UuidGenerator::generateV3(ns, "test"), UuidGenerator::generateV5(ns, "test"));
}

TEST_F(UuidGeneratorTest, NamespaceScopesNames) {
    EXPECT_NE(UuidGenerator::generateV5(namespaces::DNS, "example"),
              UuidGenerator::generateV5(namespaces::URL, "example"));
    EXPECT_NE(UuidGenerator::generateV5(namespaces::DNS, "example"),
              UuidGenerator::generateV5(namespaces::DNS, "example2"));
}

TEST_F(UuidGeneratorTest, DefaultNamespaceOverloads) {
    UuidGenerator gen(testConfig());
    EXPECT_EQ(gen.generateV3("test"),
              UuidGenerator::generateV3(gen.defaultNamespace(), "test"));
    EXPECT_EQ(gen.generateV5("test"),
              UuidGenerator::generateV5(gen.defaultNamespace(), "test"));
}

TEST_F(UuidGeneratorTest, ByteVectorNamespace) {
    std::vector<uint8_t> ns(namespaces::DNS.begin(), namespaces::DNS.end());
    EXPECT_EQ(UuidGenerator::generateV3(ns, "www.example.com"),
              UuidGenerator::generateV3(namespaces::DNS, "www.example.com"));
    EXPECT_EQ(UuidGenerator::generateV5(ns, "www.example.com"),
              UuidGenerator::generateV5(namespaces::DNS, "www.example.com"));
}

TEST_F(UuidGeneratorTest, ByteVectorNamespaceWrongLength) {
    std::vector<uint8_t> shortNs(15, 0);
    std::vector<uint8_t> longNs(17, 0);
    EXPECT_THROW(UuidGenerator::generateV3(shortNs, "x"), std::invalid_argument);
    EXPECT_THROW(UuidGenerator::generateV5(longNs, "x"), std::invalid_argument);
}

TEST_F(UuidGeneratorTest, EmptyAndUtf8Names) {
    Uuid empty = UuidGenerator::generateV5(namespaces::URL, "");
    EXPECT_EQ(versionOf(empty), UuidVersion::NAME_SHA1);

    Uuid utf8 = UuidGenerator::generateV5(namespaces::URL, "\xc3\xa9t\xc3\xa9");
    EXPECT_NE(utf8, empty);
}

// =============================================================================
// Clock
// =============================================================================

TEST(GregorianClockTest, EpochOffset) {
    EXPECT_EQ(kGregorianEpochOffset, 0x01B21DD213814000ULL);
    EXPECT_EQ(kGregorianEpochOffset, 141427ULL * 86400ULL * 10000000ULL);
}

TEST(GregorianClockTest, MatchesSystemClock) {
    auto unixTicks = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count() * 10;
    uint64_t gregorian = currentGregorianTicks();

    int64_t delta = static_cast<int64_t>(gregorian - kGregorianEpochOffset) - unixTicks;
    EXPECT_LT(std::llabs(delta), 10000000LL);
}
