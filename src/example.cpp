#include <array>
#include <charconv>
#include <cstring>
#include <string_view>

#include <poll.h>

#include "launcher.hpp"
#include "macros/unwrap.hpp"

namespace {
struct Args {
    std::optional<std::chrono::milliseconds> timeout;
    std::string                              file;
    std::vector<std::string>                 args;
};

auto parse_args(const int argc, const char* const argv[]) -> std::optional<Args> {
    auto ret = Args();
    auto i   = 1;
    if(i + 1 < argc && std::strcmp(argv[i], "-t") == 0) {
        const auto str  = std::string_view(argv[i + 1]);
        auto       msec = 0;
        const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), msec);
        ensure(ec == std::errc() && ptr == str.data() + str.size() && msec > 0, "invalid timeout ", str);
        ret.timeout = std::chrono::milliseconds(msec);
        i += 2;
    }
    ensure(i < argc, "usage: ", argv[0], " [-t <timeout-ms>] <file> [args...]");
    ret.file = argv[i];
    for(i += 1; i < argc; i += 1) {
        ret.args.emplace_back(argv[i]);
    }
    return ret;
}

// drains both streams until the child closes them
auto collect_outputs(launcher::Launcher& child, std::string& outputs, std::string& errors) -> bool {
    auto fds = std::array{
        pollfd{.fd = child.get_stdout().as_handle(), .events = POLLIN, .revents = 0},
        pollfd{.fd = child.get_stderr().as_handle(), .events = POLLIN, .revents = 0},
    };

    while(fds[0].fd >= 0 || fds[1].fd >= 0) {
        ensure(poll(fds.data(), fds.size(), -1) != -1);
        for(auto i = 0; i < 2; i += 1) {
            if(!(fds[i].revents & (POLLIN | POLLHUP))) {
                continue;
            }
            auto       buf   = std::array<char, 256>();
            auto       error = std::error_code();
            const auto len   = i == 0 ? child.read_stdout(buf, error) : child.read_stderr(buf, error);
            ensure(!error, "read failed: ", error.message());
            if(len == 0) {
                // negative fds are ignored by poll()
                fds[i].fd = -1;
                continue;
            }
            auto& dest = i == 0 ? outputs : errors;
            dest.insert(dest.end(), buf.begin(), buf.begin() + len);
        }
    }
    return true;
}
} // namespace

auto main(const int argc, const char* const argv[]) -> int {
    unwrap(args, parse_args(argc, argv));

    auto scope = args.timeout ? launcher::Scope::with_timeout(launcher::Scope::background(), *args.timeout) : launcher::Scope::background();
    auto error = std::error_code();
    auto child = launcher::Launcher::create(scope, args.file, {}, args.args, error);
    ensure(child, "cannot prepare ", args.file, ": ", error.message());

    error = child->start();
    ensure(!error, "cannot start ", args.file, ": ", error.message());

    auto outputs = std::string();
    auto errors  = std::string();
    ensure(collect_outputs(*child, outputs, errors));
    error = child->wait();
    unwrap(result, child->get_result());
    print("result:");
    print("  reason=", int(result.reason));
    print("  code=", result.code);
    print("  error=", error ? error.message() : "none");
    print("  stdout=", outputs);
    print("  stderr=", errors);
    return error ? 1 : 0;
}
