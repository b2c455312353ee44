#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <optional>
#include <utility>

namespace gwt {

    class FileDescriptor {
      public:
        FileDescriptor() = default;
        explicit FileDescriptor(int fd) : fd_(fd) {}
        ~FileDescriptor() {
            if (fd_ >= 0) {
                ::close(fd_);
            }
        }

        FileDescriptor(const FileDescriptor&)            = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.fd_) {
            other.fd_ = -1;
        }
        FileDescriptor& operator=(FileDescriptor&& other) noexcept {
            if (this == &other) {
                return *this;
            }
            reset(other.fd_);
            other.fd_ = -1;
            return *this;
        }

        int get() const {
            return fd_;
        }
        explicit operator bool() const {
            return fd_ >= 0;
        }

        void reset(int fd = -1) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            fd_ = fd;
        }

        int release() {
            const int fd = fd_;
            fd_          = -1;
            return fd;
        }

      private:
        int fd_ = -1;
    };

    struct Pipe {
        FileDescriptor read_end;
        FileDescriptor write_end;
    };

    // Both ends are close-on-exec so sibling children never inherit them.
    inline std::optional<Pipe> make_pipe() {
        int fds[2] = {-1, -1};
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return std::nullopt;
        }
        return Pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};
    }

}
