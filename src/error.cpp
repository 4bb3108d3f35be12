#include <cerrno>

#include "error.hpp"

namespace launcher {
namespace {
class Category : public std::error_category {
  public:
    auto name() const noexcept -> const char* override {
        return "launcher";
    }

    auto message(const int code) const -> std::string override {
        switch(Error(code)) {
        case Error::MissingScope:
            return "scope must be provided";
        case Error::NotFound:
            return "executable file not found in $PATH";
        case Error::Canceled:
            return "scope canceled";
        case Error::DeadlineExceeded:
            return "scope deadline exceeded";
        case Error::IncompleteTransfer:
            return "command did not receive all bytes sent to stdin";
        case Error::NotStarted:
            return "process not started";
        case Error::AlreadyStarted:
            return "process already started";
        case Error::AbnormalExit:
            return "process exited abnormally";
        }
        return "unknown launcher error";
    }

    // both ways a scope ends read as operation_canceled
    auto equivalent(const int code, const std::error_condition& condition) const noexcept -> bool override {
        switch(Error(code)) {
        case Error::Canceled:
        case Error::DeadlineExceeded:
            return condition == std::errc::operation_canceled;
        default:
            return default_error_condition(code) == condition;
        }
    }
};
} // namespace

auto launcher_category() -> const std::error_category& {
    static const auto category = Category();
    return category;
}

auto make_error_code(const Error error) -> std::error_code {
    return {int(error), launcher_category()};
}

auto last_error() -> std::error_code {
    return {errno, std::generic_category()};
}
} // namespace launcher
