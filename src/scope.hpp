#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <system_error>
#include <thread>

namespace launcher {
// Cancellable interval of validity. Once done, it stays done and keeps the reason.
class Scope {
  private:
    struct Private {};

    mutable std::mutex                                       mutex;
    mutable std::condition_variable_any                      cond;
    std::error_code                                          reason;
    std::stop_source                                         source;
    std::shared_ptr<Scope>                                   parent;
    std::optional<std::stop_callback<std::function<void()>>> parent_link;
    std::jthread                                             timer;

    auto finish(std::error_code why) -> void;

  public:
    // never done unless cancelled
    static auto background() -> std::shared_ptr<Scope>;
    // done when cancelled or when parent is done, with parent's reason
    // parent is required, nullptr yields nullptr
    static auto derive(std::shared_ptr<Scope> parent) -> std::shared_ptr<Scope>;
    // like derive, and done with Error::DeadlineExceeded after timeout
    static auto with_timeout(std::shared_ptr<Scope> parent, std::chrono::milliseconds timeout) -> std::shared_ptr<Scope>;

    auto cancel() -> void;
    // empty until done
    auto err() const -> std::error_code;
    auto done() const -> bool;
    auto wait() const -> std::error_code;
    auto wait_for(std::chrono::milliseconds timeout) const -> bool;
    auto get_token() const -> std::stop_token;

    explicit Scope(Private);
};
} // namespace launcher
