#include <gtest/gtest.h>

#include "system/device_restarter.hpp"

#include <string>
#include <vector>

namespace fwsync {
namespace {

TEST(CommandRestarterTest, SucceedsWhenCommandExitsZero) {
    CommandRestarter restarter({"true"});
    auto res = restarter.Restart();
    EXPECT_TRUE(res.is_ok()) << res.msg;
}

TEST(CommandRestarterTest, NonZeroExitIsIoError) {
    CommandRestarter restarter({"sh", "-c", "exit 3"});
    auto res = restarter.Restart();
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::Io);
    EXPECT_NE(res.msg.find("exited with 3"), std::string::npos);
}

TEST(CommandRestarterTest, MissingCommandIsIoError) {
    CommandRestarter restarter({"/nonexistent/fwsync-reboot"});
    auto res = restarter.Restart();
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::Io);
}

TEST(CommandRestarterTest, EmptyCommandIsConfigError) {
    CommandRestarter restarter(std::vector<std::string>{});
    auto res = restarter.Restart();
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::Config);
}

} // namespace
} // namespace fwsync
