#pragma once
#include <optional>
#include <span>
#include <system_error>

#define CUTIL_NS launcher
#include "util/fd.hpp"
#undef CUTIL_NS

namespace launcher {
struct Pipe {
    FileDescriptor output; // read end
    FileDescriptor input;  // write end

    // both ends are close-on-exec
    static auto create(std::error_code& error) -> std::optional<Pipe>;
};

struct PipeSet {
    FileDescriptor stdin_writer;
    FileDescriptor stdout_reader;
    FileDescriptor stderr_reader;

    // handed to the child, closed in the parent once it is spawned
    FileDescriptor child_stdin;
    FileDescriptor child_stdout;
    FileDescriptor child_stderr;

    static auto create(std::error_code& error) -> std::optional<PipeSet>;
    auto release_child_ends() -> void;
};

// one write(2), without raising SIGPIPE when the reader is gone
auto write_once(int fd, std::span<const char> data, std::error_code& error) -> size_t;
// one blocking read(2), 0 on end of stream
auto read_once(int fd, std::span<char> buffer, std::error_code& error) -> size_t;
} // namespace launcher
