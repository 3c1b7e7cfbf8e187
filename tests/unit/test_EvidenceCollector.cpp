#include <gtest/gtest.h>
#include "crypto/Hash.hpp"
#include "evidence/EvidenceCollector.hpp"
#include "util/system.hpp"
#include "TestHelpers.hpp"

#include <algorithm>
#include <unistd.h>

using namespace fv;
using namespace fv::evidence;
using namespace fv::test;

namespace {

constexpr auto* ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

class FixedOwner final : public OwnerResolver {
public:
    [[nodiscard]] std::string ownerOf(const std::filesystem::path&) const override { return "mallory"; }
    [[nodiscard]] std::string_view name() const override { return "fixed"; }
};

std::vector<uint8_t> header(const std::string& s) { return {s.begin(), s.end()}; }

}

class EvidenceCollectorTest : public ::testing::Test {
protected:
    TempDir dir;
    config::DetectionConfig cfg;
};

TEST_F(EvidenceCollectorTest, HashesWholeFile) {
    writeText(dir / "abc.jpg", "abc");
    const EvidenceCollector collector(cfg, nullptr);

    const auto ev = collector.collect(dir / "abc.jpg", header("abc"));
    ASSERT_TRUE(ev.sha256.has_value());
    EXPECT_EQ(*ev.sha256, ABC_SHA256);
    EXPECT_TRUE(ev.hashAvailable());
    EXPECT_EQ(ev.size_bytes, 3u);
    EXPECT_TRUE(ev.modified_at.has_value());
}

TEST_F(EvidenceCollectorTest, HashDisabledLeavesHashAbsent) {
    cfg.calculate_hash = false;
    writeText(dir / "abc.jpg", "abc");

    const auto ev = EvidenceCollector(cfg, nullptr).collect(dir / "abc.jpg", header("abc"));
    EXPECT_FALSE(ev.sha256.has_value());
    EXPECT_FALSE(ev.hashAvailable());
}

TEST_F(EvidenceCollectorTest, VanishedFileDegradesToUnavailableHash) {
    const auto ev = EvidenceCollector(cfg, nullptr).collect(dir / "gone.jpg", header("%PDF-1.4"));
    ASSERT_TRUE(ev.sha256.has_value());
    EXPECT_EQ(*ev.sha256, HASH_UNAVAILABLE);
    EXPECT_FALSE(ev.hashAvailable());
    EXPECT_EQ(ev.magic_hex, "255044462d312e34");
}

TEST_F(EvidenceCollectorTest, FileGrownPastLimitDegradesToUnavailableHash) {
    cfg.max_file_size_bytes = 16;
    writeBytes(dir / "grown.jpg", std::vector<uint8_t>(64, 0x25));

    const auto ev = EvidenceCollector(cfg, nullptr).collect(dir / "grown.jpg", {});
    EXPECT_EQ(ev.sha256, std::optional<std::string>(HASH_UNAVAILABLE));
    EXPECT_EQ(ev.size_bytes, 64u);
}

TEST_F(EvidenceCollectorTest, MagicHexIsFirstSixteenBytesLowerCase) {
    std::vector<uint8_t> h(40);
    for (size_t i = 0; i < h.size(); ++i) h[i] = static_cast<uint8_t>(0xA0 + i);
    writeBytes(dir / "x.bin", h);

    const auto ev = EvidenceCollector(cfg, nullptr).collect(dir / "x.bin", h);
    EXPECT_EQ(ev.magic_hex, "a0a1a2a3a4a5a6a7a8a9aaabacadaeaf");
}

TEST_F(EvidenceCollectorTest, MagicHexPrefersMatchedBytes) {
    std::vector<uint8_t> h(300, 0);
    const std::string ustar = "ustar";
    std::ranges::copy(ustar, h.begin() + 257);
    writeBytes(dir / "x.zip", h);

    const std::vector<uint8_t> matched(ustar.begin(), ustar.end());
    const auto ev = EvidenceCollector(cfg, nullptr).collect(dir / "x.zip", h, matched);
    EXPECT_EQ(ev.magic_hex, "7573746172");
}

TEST_F(EvidenceCollectorTest, OwnerComesFromResolver) {
    writeText(dir / "abc.jpg", "abc");
    const auto ev = EvidenceCollector(cfg, std::make_shared<FixedOwner>()).collect(dir / "abc.jpg", header("abc"));
    EXPECT_EQ(ev.owner, std::optional<std::string>("mallory"));
}

TEST_F(EvidenceCollectorTest, NoResolverMeansNoOwner) {
    writeText(dir / "abc.jpg", "abc");
    const auto ev = EvidenceCollector(cfg, nullptr).collect(dir / "abc.jpg", header("abc"));
    EXPECT_FALSE(ev.owner.has_value());
}

TEST(OwnerResolverTest, PosixResolverReportsFileOwner) {
    TempDir dir;
    writeText(dir / "mine.txt", "x");
    EXPECT_EQ(PosixOwnerResolver().ownerOf(dir / "mine.txt"), util::userNameForUid(::geteuid()));
}

TEST(OwnerResolverTest, PosixResolverFallsBackToProcessIdentity) {
    EXPECT_EQ(PosixOwnerResolver().ownerOf("/nonexistent/definitely/not/here"), util::processUser());
}

TEST(OwnerResolverTest, ProcessIdentityIgnoresPath) {
    const ProcessIdentityResolver resolver;
    EXPECT_EQ(resolver.ownerOf("/etc/passwd"), util::processUser());
    EXPECT_EQ(resolver.name(), "process-identity");
}

TEST(OwnerResolverTest, FactoryHonorsToggle) {
    config::DetectionConfig cfg;
    cfg.get_file_owner = false;
    EXPECT_EQ(makeOwnerResolver(cfg), nullptr);

    cfg.get_file_owner = true;
    EXPECT_NE(makeOwnerResolver(cfg), nullptr);
}

TEST(HashTest, Blake2bIsStableAndDistinct) {
    EXPECT_EQ(crypto::Hash::blake2b("a"), crypto::Hash::blake2b("a"));
    EXPECT_NE(crypto::Hash::blake2b("a"), crypto::Hash::blake2b("b"));
    EXPECT_EQ(crypto::Hash::blake2b("a").size(), 64u);
}
