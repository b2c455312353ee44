#include "gwt/process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

#include "gwt/file_descriptor.hpp"

namespace gwt {

    namespace {

        constexpr int kExecFailedExitCode = 127;

        // Returns false once the descriptor reached EOF or failed.
        bool drain_into(int fd, std::string& output) {
            std::array<char, 4096> buffer{};
            while (true) {
                const ssize_t bytes = ::read(fd, buffer.data(), buffer.size());
                if (bytes > 0) {
                    output.append(buffer.data(), static_cast<size_t>(bytes));
                    continue;
                }
                if (bytes == 0) {
                    return false;
                }
                if (errno == EINTR) {
                    continue;
                }
                return errno == EAGAIN || errno == EWOULDBLOCK;
            }
        }

        void set_nonblocking(int fd) {
            const int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags >= 0) {
                ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
            }
        }

    } // namespace

    std::expected<ProcessResult, std::string> run_process(const std::vector<std::string>& argv, const std::optional<std::filesystem::path>& cwd) {
        if (argv.empty()) {
            return std::unexpected(std::string("empty command"));
        }

        auto out_pipe = make_pipe();
        auto err_pipe = make_pipe();
        if (!out_pipe || !err_pipe) {
            return std::unexpected(std::string("failed to create pipe: ") + std::strerror(errno));
        }

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);
        const std::string workdir = cwd ? cwd->string() : std::string();

        const pid_t       pid = ::fork();
        if (pid < 0) {
            return std::unexpected(std::string("failed to fork: ") + std::strerror(errno));
        }

        if (pid == 0) {
            // Own process group: a terminal Ctrl-C reaches gwt only, so a
            // running git command is left to finish.
            ::setpgid(0, 0);
            const int null_fd = ::open("/dev/null", O_RDONLY);
            if (null_fd >= 0) {
                ::dup2(null_fd, STDIN_FILENO);
                ::close(null_fd);
            }
            ::dup2(out_pipe->write_end.get(), STDOUT_FILENO);
            ::dup2(err_pipe->write_end.get(), STDERR_FILENO);
            if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
                _exit(kExecFailedExitCode);
            }
            ::execvp(args[0], args.data());
            _exit(kExecFailedExitCode);
        }

        ::setpgid(pid, pid);
        out_pipe->write_end.reset();
        err_pipe->write_end.reset();
        set_nonblocking(out_pipe->read_end.get());
        set_nonblocking(err_pipe->read_end.get());

        ProcessResult result;
        bool          out_open = true;
        bool          err_open = true;
        while (out_open || err_open) {
            std::array<pollfd, 2> fds{{
                {.fd = out_open ? out_pipe->read_end.get() : -1, .events = POLLIN, .revents = 0},
                {.fd = err_open ? err_pipe->read_end.get() : -1, .events = POLLIN, .revents = 0},
            }};
            const int ready = ::poll(fds.data(), fds.size(), -1);
            if (ready < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (out_open && fds[0].revents != 0) {
                out_open = drain_into(out_pipe->read_end.get(), result.stdout_text);
            }
            if (err_open && fds[1].revents != 0) {
                err_open = drain_into(err_pipe->read_end.get(), result.stderr_text);
            }
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return std::unexpected(std::string("failed to wait for ") + argv.front() + ": " + std::strerror(errno));
            }
        }
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.exit_code = 128 + WTERMSIG(status);
        }
        return result;
    }

} // namespace gwt
