#include <gtest/gtest.h>

#include "io/fd.hpp"
#include "testing.hpp"

#include <cerrno>
#include <fcntl.h>
#include <string>
#include <unistd.h>

namespace fwsync {
namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, MoveTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    Fd a(fd);
    Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_EQ(b.Get(), fd);
}

TEST(FdTests, OpenForWriteTruncatesAndSyncs) {
    testutil::TemporaryDirectory dir;
    const auto path = dir.Path() / "blob.bin";
    testutil::WriteFile(path, "previous, longer content");

    const std::string payload = "new";
    Fd fd;
    auto res = Fd::OpenForWrite(path.string(), fd);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(fd.WriteAll({reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size()})
                    .is_ok());
    ASSERT_TRUE(fd.Sync().is_ok());
    fd.Close();

    EXPECT_EQ(testutil::ReadFile(path), "new");
}

TEST(FdTests, OpenForWriteReportsMissingDirectory) {
    testutil::TemporaryDirectory dir;
    Fd fd;
    auto res = Fd::OpenForWrite((dir.Path() / "missing" / "file").string(), fd);
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(res.code(), ErrorCode::Io);
    EXPECT_FALSE(fd.Valid());
}

} // namespace
} // namespace fwsync
