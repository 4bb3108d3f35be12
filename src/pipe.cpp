#include <array>
#include <cerrno>
#include <csignal>
#include <ctime>

#include <fcntl.h>
#include <pthread.h>
#include <unistd.h>

#include "error.hpp"
#include "macros/unwrap.hpp"
#include "pipe.hpp"

namespace launcher {
namespace {
// blocks SIGPIPE on this thread for its lifetime and discards one raised meanwhile
class SigpipeGuard {
  private:
    sigset_t old_mask;
    bool     was_pending = false;
    bool     blocked     = false;

  public:
    auto discard() -> void {
        if(!blocked || was_pending) {
            return;
        }
        auto set = sigset_t();
        sigemptyset(&set);
        sigaddset(&set, SIGPIPE);
        const auto zero = timespec{.tv_sec = 0, .tv_nsec = 0};
        while(sigtimedwait(&set, nullptr, &zero) == -1 && errno == EINTR) {
        }
    }

    SigpipeGuard() {
        auto set = sigset_t();
        sigemptyset(&set);
        sigaddset(&set, SIGPIPE);
        auto pending = sigset_t();
        sigpending(&pending);
        was_pending = sigismember(&pending, SIGPIPE) == 1;
        blocked     = pthread_sigmask(SIG_BLOCK, &set, &old_mask) == 0;
    }

    ~SigpipeGuard() {
        if(blocked) {
            pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
        }
    }
};
} // namespace

auto Pipe::create(std::error_code& error) -> std::optional<Pipe> {
    auto fd = std::array<int, 2>();
    if(pipe2(fd.data(), O_CLOEXEC) == -1) {
        error = last_error();
        warn("pipe2() failed: ", error.message());
        return std::nullopt;
    }
    return Pipe{
        fd[0],
        fd[1],
    };
}

auto PipeSet::create(std::error_code& error) -> std::optional<PipeSet> {
    unwrap_mut(stdin_pipe, Pipe::create(error));
    unwrap_mut(stdout_pipe, Pipe::create(error));
    unwrap_mut(stderr_pipe, Pipe::create(error));
    return PipeSet{
        .stdin_writer  = std::move(stdin_pipe.input),
        .stdout_reader = std::move(stdout_pipe.output),
        .stderr_reader = std::move(stderr_pipe.output),
        .child_stdin   = std::move(stdin_pipe.output),
        .child_stdout  = std::move(stdout_pipe.input),
        .child_stderr  = std::move(stderr_pipe.input),
    };
}

auto PipeSet::release_child_ends() -> void {
    child_stdin.close();
    child_stdout.close();
    child_stderr.close();
}

auto write_once(const int fd, const std::span<const char> data, std::error_code& error) -> size_t {
    error.clear();
    auto guard = SigpipeGuard();
    while(true) {
        const auto len = write(fd, data.data(), data.size());
        if(len >= 0) {
            return size_t(len);
        }
        if(errno == EINTR) {
            continue;
        }
        error = last_error();
        if(errno == EPIPE) {
            guard.discard();
        }
        return 0;
    }
}

auto read_once(const int fd, const std::span<char> buffer, std::error_code& error) -> size_t {
    error.clear();
    while(true) {
        const auto len = read(fd, buffer.data(), buffer.size());
        if(len >= 0) {
            return size_t(len);
        }
        if(errno == EINTR) {
            continue;
        }
        error = last_error();
        return 0;
    }
}
} // namespace launcher
