#include "error.hpp"
#include "macros/unwrap.hpp"
#include "scope.hpp"

namespace launcher {
auto Scope::finish(const std::error_code why) -> void {
    {
        const auto lock = std::lock_guard(mutex);
        if(reason) {
            return;
        }
        reason = why;
    }
    cond.notify_all();
    // runs registered callbacks on this thread, so no lock may be held here
    source.request_stop();
}

auto Scope::background() -> std::shared_ptr<Scope> {
    return std::make_shared<Scope>(Private{});
}

auto Scope::derive(std::shared_ptr<Scope> parent) -> std::shared_ptr<Scope> {
    ensure(parent, "parent scope is required");
    auto       scope = std::make_shared<Scope>(Private{});
    const auto self  = scope.get();
    const auto from  = parent.get();
    scope->parent    = std::move(parent);
    // fires immediately if the parent is already done
    scope->parent_link.emplace(from->get_token(), std::function<void()>([self, from]() {
                                   self->finish(from->err());
                               }));
    return scope;
}

auto Scope::with_timeout(std::shared_ptr<Scope> parent, const std::chrono::milliseconds timeout) -> std::shared_ptr<Scope> {
    ensure(parent, "parent scope is required");
    auto       scope = derive(std::move(parent));
    const auto self  = scope.get();
    scope->timer     = std::jthread([self, timeout](const std::stop_token stop) {
        auto       lock     = std::unique_lock(self->mutex);
        const auto finished = self->cond.wait_for(lock, stop, timeout, [self]() { return bool(self->reason); });
        if(finished || stop.stop_requested()) {
            return;
        }
        lock.unlock();
        self->finish(Error::DeadlineExceeded);
    });
    return scope;
}

auto Scope::cancel() -> void {
    finish(Error::Canceled);
}

auto Scope::err() const -> std::error_code {
    const auto lock = std::lock_guard(mutex);
    return reason;
}

auto Scope::done() const -> bool {
    return bool(err());
}

auto Scope::wait() const -> std::error_code {
    auto lock = std::unique_lock(mutex);
    cond.wait(lock, [this]() { return bool(reason); });
    return reason;
}

auto Scope::wait_for(const std::chrono::milliseconds timeout) const -> bool {
    auto lock = std::unique_lock(mutex);
    return cond.wait_for(lock, timeout, [this]() { return bool(reason); });
}

auto Scope::get_token() const -> std::stop_token {
    return source.get_token();
}

Scope::Scope(Private) {}
} // namespace launcher
