#include <gtest/gtest.h>

#include "ota/firmware_swapper.hpp"
#include "testing.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace fs = std::filesystem;

namespace fwsync {
namespace {

class FirmwareSwapperTest : public ::testing::Test {
  protected:
    void SetUp() override {
        live = dir.Path() / "live";
        staging = live / "temp-firmware";

        testutil::WriteFile(live / "main.py", "device main");
        testutil::WriteFile(live / "boot.py", "device boot");
        testutil::WriteFile(live / "settings.toml", "WIFI=1");
        testutil::WriteFile(live / "lib" / "neopixel.py", "driver");
        testutil::WriteFile(live / "code.py", "old code");
        testutil::WriteFile(live / "assets" / "old.bmp", "old asset");
    }

    testutil::TemporaryDirectory dir;
    fs::path live;
    fs::path staging;
    SwapPolicy policy = SwapPolicy::Default("temp-firmware");
};

TEST_F(FirmwareSwapperTest, WipeKeepsOnlyProtectedEntries) {
    fs::create_directories(staging);
    const FirmwareSwapper swapper(policy);
    ASSERT_TRUE(swapper.WipeLiveTree(live).is_ok());

    EXPECT_TRUE(fs::exists(live / "main.py"));
    EXPECT_TRUE(fs::exists(live / "boot.py"));
    EXPECT_TRUE(fs::exists(live / "settings.toml"));
    EXPECT_TRUE(fs::exists(live / "lib" / "neopixel.py"));
    EXPECT_TRUE(fs::exists(staging));
    EXPECT_FALSE(fs::exists(live / "code.py"));
    EXPECT_FALSE(fs::exists(live / "assets"));
}

TEST_F(FirmwareSwapperTest, KeptNamesMatchOnlyTheirKind) {
    // A directory named like a kept file is not kept, and vice versa.
    fs::remove(live / "main.py");
    testutil::WriteFile(live / "main.py" / "inner", "dir");
    const SwapPolicy custom({"main.py"}, {"code.py"});

    const FirmwareSwapper swapper(custom);
    ASSERT_TRUE(swapper.WipeLiveTree(live).is_ok());
    EXPECT_FALSE(fs::exists(live / "main.py"));
    EXPECT_FALSE(fs::exists(live / "code.py"));
}

TEST_F(FirmwareSwapperTest, SwapInstallsStagedTree) {
    testutil::WriteFile(staging / "code.py", "new code");
    testutil::WriteFile(staging / "assets" / "logo.bmp", "new asset");

    const FirmwareSwapper swapper(policy);
    auto res = swapper.Swap(staging, live);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    const std::map<std::string, std::string> expected = {
        {"assets/logo.bmp", "new asset"},
        {"boot.py", "device boot"},
        {"code.py", "new code"},
        {"lib/neopixel.py", "driver"},
        {"main.py", "device main"},
        {"settings.toml", "WIFI=1"},
    };
    EXPECT_EQ(testutil::SnapshotTree(live), expected);
    EXPECT_FALSE(fs::exists(staging));
}

TEST_F(FirmwareSwapperTest, MoveMergesIntoExistingDirectories) {
    const fs::path other = dir.Path() / "stage";
    testutil::WriteFile(other / "lib" / "extra.py", "extra");

    const FirmwareSwapper swapper(policy);
    ASSERT_TRUE(swapper.MoveStagedContents(other, live).is_ok());
    EXPECT_EQ(testutil::ReadFile(live / "lib" / "extra.py"), "extra");
    EXPECT_EQ(testutil::ReadFile(live / "lib" / "neopixel.py"), "driver");
    EXPECT_FALSE(fs::exists(other));
}

TEST_F(FirmwareSwapperTest, MissingStagingTreeFails) {
    const FirmwareSwapper swapper(policy);
    auto res = swapper.Swap(dir.Path() / "nope", live);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::Io);
    EXPECT_TRUE(fs::exists(live / "code.py"));
}

} // namespace
} // namespace fwsync
