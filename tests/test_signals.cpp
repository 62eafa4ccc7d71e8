#include <gtest/gtest.h>

#include "system/signals.hpp"

#include <chrono>

namespace fwsync {
namespace {

TEST(SignalsTest, SleepReturnsTrueWhenNotCancelled) {
    g_cancel.store(false);
    EXPECT_TRUE(SleepUnlessCancelled(std::chrono::seconds(0)));
}

TEST(SignalsTest, SleepStopsOnceCancelled) {
    g_cancel.store(true);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(SleepUnlessCancelled(std::chrono::seconds(30)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(CancelRequested());
    g_cancel.store(false);
}

} // namespace
} // namespace fwsync
