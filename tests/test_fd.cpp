#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <fcntl.h>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        billsync::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, ReleaseKeepsDescriptorOpen) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        billsync::Fd holder(fd);
        EXPECT_EQ(holder.Release(), fd);
        EXPECT_FALSE(holder.Valid());
    }

    EXPECT_EQ(::close(fd), 0);
}

TEST(FdTests, MoveTransfersOwnership) {
    billsync::Fd a(::open("/dev/null", O_RDONLY));
    ASSERT_TRUE(a.Valid());
    const int raw = a.Get();

    billsync::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_EQ(b.Get(), raw);
}

TEST(FdTests, MakePipeCarriesBytes) {
    billsync::Fd r, w;
    auto res = billsync::Fd::MakePipe(r, w);
    ASSERT_TRUE(res.ok) << res.msg;

    ASSERT_EQ(::write(w.Get(), "ok", 2), 2);
    char buf[2] = {};
    ASSERT_EQ(::read(r.Get(), buf, 2), 2);
    EXPECT_EQ(std::string(buf, 2), "ok");
}

} // namespace
