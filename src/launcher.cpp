#include <cerrno>
#include <csignal>
#include <iterator>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "launcher.hpp"
#include "macros/unwrap.hpp"
#include "path.hpp"

namespace launcher {
namespace {
// tells the parent why the child never reached the target program
[[noreturn]] auto child_fail(const int report, const int code) -> void {
    if(write(report, &code, sizeof(code)) < 0) {
        // nothing left to tell
    }
    _exit(127);
}

auto redirect(const int fd, const int target) -> bool {
    if(fd == target) {
        // dup2() would keep close-on-exec
        return fcntl(fd, F_SETFD, 0) != -1;
    }
    return dup2(fd, target) != -1;
}

auto to_pointers(const std::vector<std::string>& strings) -> std::vector<const char*> {
    auto ret = std::vector<const char*>();
    ret.reserve(strings.size() + 1);
    for(const auto& str : strings) {
        ret.push_back(str.data());
    }
    ret.push_back(NULL);
    return ret;
}

auto reap_now(const pid_t pid) -> void {
    while(waitpid(pid, nullptr, 0) == -1 && errno == EINTR) {
    }
}
} // namespace

auto Launcher::spawn() -> std::error_code {
    auto error  = std::error_code();
    auto report = Pipe::create(error);
    if(!report) {
        return error;
    }

    const auto args = to_pointers(argv);
    const auto envs = to_pointers(env);
    const auto ppid = getpid();

    const auto child = fork();
    if(child < 0) {
        error = last_error();
        warn("fork() failed: ", error.message());
        return error;
    }
    if(child == 0) {
        const auto fd = report->input.as_handle();
        if(params.die_on_parent_exit) {
            if(prctl(PR_SET_PDEATHSIG, SIGTERM) == -1) {
                child_fail(fd, errno);
            }
            if(getppid() != ppid) {
                // parent exitted
                _exit(0);
            }
        }
        if(!redirect(pipes.child_stdin.as_handle(), 0) ||
           !redirect(pipes.child_stdout.as_handle(), 1) ||
           !redirect(pipes.child_stderr.as_handle(), 2)) {
            child_fail(fd, errno);
        }
        if(!params.workdir.empty() && chdir(params.workdir.data()) == -1) {
            child_fail(fd, errno);
        }
        execve(args[0], const_cast<char* const*>(args.data()), const_cast<char* const*>(envs.data()));
        child_fail(fd, errno);
    }

    report->input.close();
    pipes.release_child_ends();

    // the report pipe closes on a successful exec, otherwise it carries errno
    auto       code = int();
    const auto len  = read_once(report->output.as_handle(), {reinterpret_cast<char*>(&code), sizeof(code)}, error);
    if(error || len != 0) {
        if(!error) {
            error = len == sizeof(code) ? std::error_code(code, std::generic_category()) : std::make_error_code(std::errc::io_error);
        }
        warn("failed to spawn ", path, ": ", error.message());
        if(len == 0) {
            kill(child, SIGKILL);
        }
        reap_now(child);
        return error;
    }

    const auto lock = std::lock_guard(mutex);
    pid             = child;
    status          = Status::Started;
    return {};
}

auto Launcher::terminate() -> void {
    const auto lock = std::lock_guard(mutex);
    if(status != Status::Started) {
        return;
    }
    // the reaper has not collected the pid yet, so it cannot be reused
    if(kill(pid, SIGKILL) == -1) {
        warn("kill() failed: ", last_error().message());
        return;
    }
    killed = true;
}

auto Launcher::reap() -> void {
    auto error = std::error_code();
    auto info  = siginfo_t();
    // wait without reaping, so terminate() never signals a recycled pid
    while(waitid(P_PID, id_t(pid), &info, WEXITED | WNOWAIT) == -1) {
        if(errno != EINTR) {
            error = last_error();
            warn("waitid() failed: ", error.message());
            break;
        }
    }

    {
        const auto lock = std::lock_guard(mutex);
        status          = Status::Terminated;
        auto raw        = int();
        while(!error && waitpid(pid, &raw, 0) == -1) {
            if(errno != EINTR) {
                error = last_error();
                warn("waitpid() failed: ", error.message());
            }
        }
        if(!error) {
            const auto exitted = bool(WIFEXITED(raw));
            result             = Result{
                            .reason = exitted ? Result::ExitReason::Exit : Result::ExitReason::Signal,
                            .code   = exitted ? WEXITSTATUS(raw) : WTERMSIG(raw),
            };
        }
        wait_error = error;
    }
    cond.notify_all();
}

auto Launcher::create(std::shared_ptr<Scope>   parent,
                      std::string              file,
                      std::vector<std::string> env,
                      std::vector<std::string> args,
                      std::error_code&         error,
                      LaunchParams             params) -> std::unique_ptr<Launcher> {
    error.clear();
    if(!parent) {
        error = Error::MissingScope;
        return nullptr;
    }
    auto scope = Scope::derive(std::move(parent));

    auto path = resolve_path(file, error);
    if(!error) {
        error = scope->err();
    }
    if(error) {
        scope->cancel();
        return nullptr;
    }

    auto pipes = PipeSet::create(error);
    if(!pipes) {
        scope->cancel();
        return nullptr;
    }

    auto argv = std::vector<std::string>{path};
    argv.insert(argv.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
    return std::make_unique<Launcher>(Private{}, std::move(file), std::move(path), std::move(argv), std::move(env), std::move(params), std::move(scope), std::move(*pipes));
}

auto Launcher::get_file() const -> const std::string& {
    return file;
}

auto Launcher::get_path() const -> const std::string& {
    return path;
}

auto Launcher::get_args() const -> std::vector<std::string> {
    return {argv.begin() + 1, argv.end()};
}

auto Launcher::get_env() const -> std::vector<std::string> {
    return env;
}

auto Launcher::get_pid() const -> pid_t {
    const auto lock = std::lock_guard(mutex);
    return pid;
}

auto Launcher::get_status() const -> Status {
    const auto lock = std::lock_guard(mutex);
    return status;
}

auto Launcher::get_result() const -> std::optional<Result> {
    const auto lock = std::lock_guard(mutex);
    return result;
}

auto Launcher::is_started() const -> bool {
    const auto lock = std::lock_guard(mutex);
    return status != Status::Initialized;
}

auto Launcher::is_running() const -> bool {
    const auto lock = std::lock_guard(mutex);
    return status == Status::Started && !scope->done();
}

auto Launcher::start() -> std::error_code {
    if(attempted) {
        return Error::AlreadyStarted;
    }
    if(const auto error = scope->err(); error) {
        return error;
    }
    attempted = true;
    if(const auto error = spawn(); error) {
        // otherwise readers never see end of stream
        pipes.release_child_ends();
        return error;
    }
    // fires at once if the scope ended while spawning
    kill_link.emplace(scope->get_token(), std::function<void()>([this]() { terminate(); }));
    reaper = std::jthread([this]() { reap(); });
    return {};
}

auto Launcher::run() -> std::error_code {
    if(const auto error = start(); error) {
        return error;
    }
    return wait();
}

auto Launcher::wait() -> std::error_code {
    auto lock = std::unique_lock(mutex);
    if(status == Status::Initialized) {
        return Error::NotStarted;
    }
    cond.wait(lock, [this]() { return status == Status::Terminated; });
    if(wait_error) {
        return wait_error;
    }
    if(killed && result->reason == Result::ExitReason::Signal) {
        return scope->err();
    }
    if(result->reason != Result::ExitReason::Exit || result->code != 0) {
        return Error::AbnormalExit;
    }
    return {};
}

auto Launcher::cancel() -> void {
    scope->cancel();
}

auto Launcher::close() -> std::error_code {
    scope->cancel();
    if(pipes.stdin_writer.as_handle() < 0) {
        return {};
    }
    if(::close(pipes.stdin_writer.release()) == -1) {
        const auto error = last_error();
        warn("close() of stdin failed: ", error.message());
        return error;
    }
    return {};
}

auto Launcher::send_stdin(const std::span<const char> data) -> std::error_code {
    const auto fd = pipes.stdin_writer.as_handle();
    if(fd < 0) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }
    auto       error = std::error_code();
    const auto len   = write_once(fd, data, error);
    if(error) {
        return error;
    }
    if(len != data.size()) {
        return Error::IncompleteTransfer;
    }
    return {};
}

auto Launcher::read_stdout(const std::span<char> buffer, std::error_code& error) -> size_t {
    return read_once(pipes.stdout_reader.as_handle(), buffer, error);
}

auto Launcher::read_stderr(const std::span<char> buffer, std::error_code& error) -> size_t {
    return read_once(pipes.stderr_reader.as_handle(), buffer, error);
}

auto Launcher::get_stdin() -> FileDescriptor& {
    return pipes.stdin_writer;
}

auto Launcher::get_stdout() -> FileDescriptor& {
    return pipes.stdout_reader;
}

auto Launcher::get_stderr() -> FileDescriptor& {
    return pipes.stderr_reader;
}

Launcher::Launcher(Private, std::string file, std::string path, std::vector<std::string> argv, std::vector<std::string> env, LaunchParams params, std::shared_ptr<Scope> scope, PipeSet pipes)
    : file(std::move(file)),
      path(std::move(path)),
      argv(std::move(argv)),
      env(std::move(env)),
      params(std::move(params)),
      scope(std::move(scope)),
      pipes(std::move(pipes)) {}

Launcher::~Launcher() {
    // kills a child that is still running, then waits for the reaper to collect it
    scope->cancel();
    if(reaper.joinable()) {
        reaper.join();
    }
}
} // namespace launcher
