#pragma once
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "common.hpp"
#include "error.hpp"
#include "pipe.hpp"
#include "scope.hpp"

namespace launcher {
// Manages one child process bound to a scope derived at creation.
// Lifecycle operations are not synchronized against each other, queries may run concurrently.
class Launcher {
  private:
    struct Private {};

    std::string              file;
    std::string              path;
    std::vector<std::string> argv; // argv[0] is the resolved path
    std::vector<std::string> env;
    LaunchParams             params;
    std::shared_ptr<Scope>   scope;
    PipeSet                  pipes;
    bool                     attempted = false;

    // process bookkeeping, shared with the reaper and the kill callback
    mutable std::mutex                                       mutex;
    std::condition_variable                                  cond;
    pid_t                                                    pid    = 0;
    Status                                                   status = Status::Initialized;
    bool                                                     killed = false;
    std::optional<Result>                                    result;
    std::error_code                                          wait_error;
    std::optional<std::stop_callback<std::function<void()>>> kill_link;
    std::jthread                                             reaper;

    auto spawn() -> std::error_code;
    auto terminate() -> void;
    auto reap() -> void;

  public:
    // env entries are KEY=VALUE and form the whole child environment
    // args exclude the program name
    static auto create(std::shared_ptr<Scope>   parent,
                       std::string              file,
                       std::vector<std::string> env,
                       std::vector<std::string> args,
                       std::error_code&         error,
                       LaunchParams             params = {}) -> std::unique_ptr<Launcher>;

    auto get_file() const -> const std::string&;
    auto get_path() const -> const std::string&;
    auto get_args() const -> std::vector<std::string>;
    auto get_env() const -> std::vector<std::string>;
    auto get_pid() const -> pid_t;
    auto get_status() const -> Status;
    auto get_result() const -> std::optional<Result>;
    auto is_started() const -> bool;
    auto is_running() const -> bool;

    auto start() -> std::error_code;
    auto run() -> std::error_code;
    // blocks until the started process is reaped
    auto wait() -> std::error_code;
    auto cancel() -> void;
    auto close() -> std::error_code;

    // short writes are Error::IncompleteTransfer, the written prefix is not retried
    auto send_stdin(std::span<const char> data) -> std::error_code;
    auto read_stdout(std::span<char> buffer, std::error_code& error) -> size_t;
    auto read_stderr(std::span<char> buffer, std::error_code& error) -> size_t;
    auto get_stdin() -> FileDescriptor&;
    auto get_stdout() -> FileDescriptor&;
    auto get_stderr() -> FileDescriptor&;

    Launcher(Private, std::string file, std::string path, std::vector<std::string> argv, std::vector<std::string> env, LaunchParams params, std::shared_ptr<Scope> scope, PipeSet pipes);
    ~Launcher();
};
} // namespace launcher
