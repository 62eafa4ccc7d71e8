#include <gtest/gtest.h>

#include "util/result.hpp"

namespace fwsync {
namespace {

TEST(ErrorCodeTest, UpdateErrorKinds) {
    EXPECT_TRUE(IsUpdateError(ErrorCode::InvalidRepositoryUrl));
    EXPECT_TRUE(IsUpdateError(ErrorCode::EmptyRepository));
    EXPECT_TRUE(IsUpdateError(ErrorCode::HashMismatch));
    EXPECT_TRUE(IsUpdateError(ErrorCode::ConnectionExhausted));
    EXPECT_FALSE(IsUpdateError(ErrorCode::Io));
    EXPECT_TRUE(IsTransient(ErrorCode::ConnectionExhausted));
    EXPECT_FALSE(IsTransient(ErrorCode::HashMismatch));
    EXPECT_STREQ(ToString(ErrorCode::HashMismatch), "hash-mismatch");
}

TEST(ResultTest, WrapKeepsCodeAndPrefixesContext) {
    auto inner = Result::Fail(ErrorCode::Io, "fsync failed");
    auto wrapped = Result::Wrap(inner, "swap");
    EXPECT_FALSE(wrapped.is_ok());
    EXPECT_EQ(wrapped.code(), ErrorCode::Io);
    EXPECT_EQ(wrapped.message(), "swap: fsync failed");
}

} // namespace
} // namespace fwsync
