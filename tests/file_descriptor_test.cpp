#include "gwt/file_descriptor.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <utility>

#include <gtest/gtest.h>

namespace {

    TEST(FileDescriptor, DefaultConstructsInvalid) {
        gwt::FileDescriptor fd;
        EXPECT_EQ(fd.get(), -1);
        EXPECT_FALSE(static_cast<bool>(fd));
    }

    TEST(FileDescriptor, ClosesOnDestruction) {
        int pipe_fds[2];
        ASSERT_EQ(::pipe(pipe_fds), 0);
        int read_fd = pipe_fds[0];
        { gwt::FileDescriptor fd(read_fd); }
        EXPECT_EQ(::fcntl(read_fd, F_GETFD), -1);
        ::close(pipe_fds[1]);
    }

    TEST(FileDescriptor, MoveConstructsTransfersOwnership) {
        int pipe_fds[2];
        ASSERT_EQ(::pipe(pipe_fds), 0);
        int                 read_fd = pipe_fds[0];
        gwt::FileDescriptor fd1(read_fd);
        gwt::FileDescriptor fd2(std::move(fd1));
        EXPECT_EQ(fd1.get(), -1);
        EXPECT_EQ(fd2.get(), read_fd);
        ::close(pipe_fds[1]);
    }

    TEST(FileDescriptor, ReleaseGivesUpOwnership) {
        int pipe_fds[2];
        ASSERT_EQ(::pipe(pipe_fds), 0);
        int released = -1;
        {
            gwt::FileDescriptor fd(pipe_fds[0]);
            released = fd.release();
            EXPECT_FALSE(static_cast<bool>(fd));
        }
        EXPECT_NE(::fcntl(released, F_GETFD), -1);
        ::close(released);
        ::close(pipe_fds[1]);
    }

    TEST(MakePipe, CreatesCloseOnExecEnds) {
        auto pipe = gwt::make_pipe();
        ASSERT_TRUE(pipe.has_value());
        EXPECT_TRUE(static_cast<bool>(pipe->read_end));
        EXPECT_TRUE(static_cast<bool>(pipe->write_end));
        EXPECT_NE(::fcntl(pipe->read_end.get(), F_GETFD) & FD_CLOEXEC, 0);
        EXPECT_NE(::fcntl(pipe->write_end.get(), F_GETFD) & FD_CLOEXEC, 0);
    }

}
