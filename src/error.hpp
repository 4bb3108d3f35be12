#pragma once
#include <system_error>

namespace launcher {
enum class Error : int {
    MissingScope = 1,
    NotFound,
    Canceled,
    DeadlineExceeded,
    IncompleteTransfer,
    NotStarted,
    AlreadyStarted,
    AbnormalExit,
};

auto launcher_category() -> const std::error_category&;
auto make_error_code(Error error) -> std::error_code;

// errno of the last failed system call
auto last_error() -> std::error_code;
} // namespace launcher

template <>
struct std::is_error_code_enum<launcher::Error> : std::true_type {};
