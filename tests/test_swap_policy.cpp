#include <gtest/gtest.h>

#include "ota/swap_policy.hpp"

#include <string>
#include <vector>

namespace fwsync {
namespace {

TEST(SwapPolicyTest, DefaultKeepsEntryPointsLibAndStaging) {
    const SwapPolicy policy = SwapPolicy::Default("temp-firmware");
    EXPECT_TRUE(policy.KeepsFile("main.py"));
    EXPECT_TRUE(policy.KeepsFile("boot.py"));
    EXPECT_TRUE(policy.KeepsFile("settings.toml"));
    EXPECT_FALSE(policy.KeepsFile("code.py"));
    EXPECT_TRUE(policy.KeepsDirectory("lib"));
    EXPECT_TRUE(policy.KeepsDirectory("temp-firmware"));
    EXPECT_FALSE(policy.KeepsDirectory("assets"));
}

TEST(SwapPolicyTest, NestedStagingDirKeepsItsTopLevelComponent) {
    const SwapPolicy policy = SwapPolicy::Default("./.fwsync/staging/");
    EXPECT_TRUE(policy.KeepsDirectory(".fwsync"));
    EXPECT_FALSE(policy.KeepsDirectory("staging"));
}

TEST(SwapPolicyTest, ProtectedPaths) {
    const SwapPolicy policy = SwapPolicy::Default("temp-firmware");
    EXPECT_TRUE(policy.IsProtected("main.py"));
    EXPECT_TRUE(policy.IsProtected("lib/neopixel.py"));
    EXPECT_TRUE(policy.IsProtected("lib"));
    EXPECT_TRUE(policy.IsProtected("temp-firmware/x"));
    EXPECT_FALSE(policy.IsProtected("code.py"));
    EXPECT_FALSE(policy.IsProtected("docs/main.py"));
    EXPECT_FALSE(policy.IsProtected("library/x.py"));
}

TEST(SwapPolicyTest, NormalizeStagedPathAcceptsRepositoryPaths) {
    const SwapPolicy policy = SwapPolicy::Default("temp-firmware");
    std::string out;
    ASSERT_TRUE(policy.NormalizeStagedPath("assets//img/logo.bmp", out).is_ok());
    EXPECT_EQ(out, "assets/img/logo.bmp");
    ASSERT_TRUE(policy.NormalizeStagedPath("./code.py", out).is_ok());
    EXPECT_EQ(out, "code.py");
}

TEST(SwapPolicyTest, NormalizeStagedPathRejectsUnsafePaths) {
    const SwapPolicy policy = SwapPolicy::Default("temp-firmware");
    for (const char* bad : {"", "/etc/passwd", "../escape.py", "a/../../b", "a\\b.py", "./"}) {
        std::string out;
        auto res = policy.NormalizeStagedPath(bad, out);
        EXPECT_FALSE(res.is_ok()) << bad;
        EXPECT_EQ(res.code(), ErrorCode::UnsafePath) << bad;
    }
}

TEST(SwapPolicyTest, AbsoluteStagingDirAddsNoKeepEntry) {
    const SwapPolicy policy = SwapPolicy::Default("/var/tmp/stage");
    EXPECT_FALSE(policy.KeepsDirectory("var"));
    EXPECT_FALSE(policy.IsProtected("var/log.txt"));
    EXPECT_EQ(policy.keep_dirs(), std::vector<std::string>{"lib"});
}

} // namespace
} // namespace fwsync
