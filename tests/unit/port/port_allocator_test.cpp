/**
 * Tests for PortAllocator - deterministic preferred ports, conflict resolution and the CI
 * lease file. Availability is injected so no socket is ever bound.
 */

#include <gtest/gtest.h>
#include <servherd/port/port_allocator.h>

#include "temp_dir_scope.hpp"

#include <fstream>
#include <set>

using namespace servherd;
using namespace servherd::port;
using servherd::test_support::TempDirScope;

namespace {

PortAllocator::Probe busy(std::set<int> ports) {
    return [ports = std::move(ports)](int port) -> Result<bool> { return ports.count(port) == 0; };
}

config::GlobalConfig rangeConfig(int min, int max, const std::string& tempDir = "/tmp/servherd") {
    config::GlobalConfig cfg;
    cfg.portRange = {min, max};
    cfg.tempDir = tempDir;
    return cfg;
}

} // namespace

TEST(PortAllocatorTest, Fnv1aKnownVectors) {
    static_assert(fnv1a32("") == 0x811c9dc5u);
    EXPECT_EQ(fnv1a32("a"), 0xe40c292cu);
    EXPECT_EQ(fnv1a32("foobar"), 0xbf9cf968u);
}

TEST(PortAllocatorTest, PreferredPortIsStableAndInRange) {
    PortAllocator alloc(rangeConfig(3000, 9999), busy({}));
    const int p = alloc.preferredPort("/home/dev/app", "npm start");
    EXPECT_GE(p, 3000);
    EXPECT_LE(p, 9999);
    EXPECT_EQ(p, alloc.preferredPort("/home/dev/app", "npm start"));
    EXPECT_EQ(p, 3000 + static_cast<int>(fnv1a32("/home/dev/app:npm start") % 7000));
}

TEST(PortAllocatorTest, PreferredPortNormalizesWhitespace) {
    PortAllocator alloc(rangeConfig(3000, 9999), busy({}));
    EXPECT_EQ(alloc.preferredPort("/p", "  npm   start "), alloc.preferredPort("/p", "npm start"));
}

TEST(PortAllocatorTest, AssignUsesPreferredWhenFree) {
    PortAllocator alloc(rangeConfig(3000, 9999), busy({}));
    auto r = alloc.assign("/p", "npm start");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().port, alloc.preferredPort("/p", "npm start"));
    EXPECT_FALSE(r.value().reassigned);
}

TEST(PortAllocatorTest, ConflictMovesUpAndWraps) {
    auto cfg = rangeConfig(3000, 3002);
    PortAllocator probeOnly(cfg, busy({}));
    const int preferred = probeOnly.preferredPort("/p", "npm start");

    PortAllocator alloc(cfg, busy({preferred}));
    auto r = alloc.assign("/p", "npm start");
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.value().reassigned);
    EXPECT_EQ(r.value().requestedPort, preferred);
    EXPECT_EQ(r.value().port, preferred == 3002 ? 3000 : preferred + 1);
}

TEST(PortAllocatorTest, ExplicitPortOutsideRangeRejected) {
    PortAllocator alloc(rangeConfig(3000, 9999), busy({}));
    auto r = alloc.assign("/p", "npm start", 70000);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PortOutOfRange);
    EXPECT_EQ(r.error().message, "Port 70000 is outside configured range 3000-9999");
}

TEST(PortAllocatorTest, ExplicitPortIsStartPoint) {
    PortAllocator alloc(rangeConfig(3000, 9999), busy({4000}));
    auto r = alloc.assign("/p", "npm start", 4000);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().port, 4001);
    EXPECT_EQ(r.value().requestedPort, 4000);
}

TEST(PortAllocatorTest, ExhaustedRangeFails) {
    PortAllocator alloc(rangeConfig(3000, 3001), busy({3000, 3001}));
    auto r = alloc.assign("/p", "npm start");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PortUnavailable);
    EXPECT_EQ(r.error().message, "No available ports in range 3000-3001");
}

TEST(PortAllocatorTest, ProbeErrorPropagates) {
    PortAllocator alloc(rangeConfig(3000, 3001), [](int) -> Result<bool> {
        return Error{ErrorCode::NetworkError, "probe failed"};
    });
    auto r = alloc.assign("/p", "npm start");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NetworkError);
}

TEST(PortAllocatorTest, CiModeSkipsLeasedAndRegisteredPorts) {
    auto cfg = rangeConfig(3000, 3003);
    PortAllocator alloc(cfg, busy({}));
    const int preferred = alloc.preferredPort("/p", "npm start");
    const int next = cfg.portRange.min + (preferred - cfg.portRange.min + 1) % 4;

    alloc.trackUsedPort(preferred);
    auto r = alloc.assign("/p", "npm start", std::nullopt, true, {next});
    ASSERT_TRUE(r);
    EXPECT_NE(r.value().port, preferred);
    EXPECT_NE(r.value().port, next);
    EXPECT_TRUE(alloc.ciUsedPorts().count(r.value().port));
}

TEST(PortAllocatorTest, LeaseFileRoundTrip) {
    auto tmp = TempDirScope::unique_under("servherd-ports");
    auto cfg = rangeConfig(3000, 9999, tmp.path().string());

    PortAllocator writer(cfg, busy({}));
    writer.trackUsedPort(3001);
    writer.trackUsedPort(3005);
    writer.saveCiUsedPorts();
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "ci-ports.json"));

    PortAllocator reader(cfg, busy({}));
    reader.loadCiUsedPorts();
    EXPECT_EQ(reader.ciUsedPorts(), (std::set<int>{3001, 3005}));
}

TEST(PortAllocatorTest, StaleOrCorruptLeaseFileIgnored) {
    auto tmp = TempDirScope::unique_under("servherd-ports");
    auto cfg = rangeConfig(3000, 9999, tmp.path().string());
    const auto lease = tmp.path() / "ci-ports.json";

    {
        std::ofstream out(lease);
        out << R"({"ports":[3001],"timestamp":1000})";
    }
    PortAllocator stale(cfg, busy({}));
    stale.loadCiUsedPorts();
    EXPECT_TRUE(stale.ciUsedPorts().empty());

    {
        std::ofstream out(lease, std::ios::trunc);
        out << "not json";
    }
    PortAllocator corrupt(cfg, busy({}));
    corrupt.loadCiUsedPorts();
    EXPECT_TRUE(corrupt.ciUsedPorts().empty());
}

TEST(PortAllocatorTest, ProbeDetectsBoundPort) {
    // Port 0 asks the kernel for any free port, which must be bindable
    auto r = probeTcpPort(0);
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_TRUE(r.value());
}
