/// @file upstream_future.cpp
/// @brief UpstreamFuture / UpstreamPromise shared-state implementation.

#include "agw/service/upstream_future.hpp"

#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace agw::service {

namespace detail {

struct UpstreamCallState {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<UpstreamOutcome> outcome;
    std::vector<UpstreamFuture::Continuation> continuations;
    std::function<void()> cancelHook;
    bool cancelled = false;

    /// Store the outcome and run pending continuations outside the lock.
    /// The outcome is immutable once set.
    bool settle(UpstreamOutcome value, bool fromCancel) {
        std::vector<UpstreamFuture::Continuation> pending;
        {
            std::lock_guard lock(mutex);
            if (outcome.has_value()) {
                return false;
            }
            outcome.emplace(std::move(value));
            cancelled = fromCancel;
            pending.swap(continuations);
        }
        cv.notify_all();
        for (auto& continuation : pending) {
            continuation(*outcome);
        }
        return true;
    }
};

}  // namespace detail

// -- UpstreamFuture -----------------------------------------------------------

UpstreamFuture UpstreamFuture::completed(UpstreamResponse response) {
    UpstreamPromise promise;
    promise.complete(std::move(response));
    return promise.future();
}

UpstreamFuture UpstreamFuture::failed(UpstreamFailure failure) {
    UpstreamPromise promise;
    promise.fail(std::move(failure));
    return promise.future();
}

bool UpstreamFuture::isReady() const {
    if (!state_) {
        return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->outcome.has_value();
}

bool UpstreamFuture::waitFor(std::chrono::milliseconds timeout) const {
    if (!state_) {
        throw std::logic_error("waitFor() on an invalid UpstreamFuture");
    }
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->outcome.has_value(); });
}

void UpstreamFuture::wait() const {
    if (!state_) {
        throw std::logic_error("wait() on an invalid UpstreamFuture");
    }
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->outcome.has_value(); });
}

const UpstreamOutcome& UpstreamFuture::outcome() const {
    if (!state_) {
        throw std::logic_error("outcome() on an invalid UpstreamFuture");
    }
    std::lock_guard lock(state_->mutex);
    if (!state_->outcome.has_value()) {
        throw std::logic_error("outcome() on a pending UpstreamFuture");
    }
    return *state_->outcome;
}

void UpstreamFuture::whenComplete(Continuation continuation) const {
    if (!state_) {
        throw std::logic_error("whenComplete() on an invalid UpstreamFuture");
    }
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->outcome.has_value()) {
            state_->continuations.push_back(std::move(continuation));
            return;
        }
    }
    continuation(*state_->outcome);
}

bool UpstreamFuture::cancel(std::string reason) const {
    if (!state_) {
        return false;
    }
    bool settled = state_->settle(
        UpstreamOutcome::err(UpstreamFailure{UpstreamErrorKind::Cancelled, std::move(reason)}),
        true);
    if (!settled) {
        return false;
    }

    std::function<void()> hook;
    {
        std::lock_guard lock(state_->mutex);
        hook = std::move(state_->cancelHook);
    }
    if (hook) {
        hook();
    }
    return true;
}

// -- UpstreamPromise ----------------------------------------------------------

UpstreamPromise::UpstreamPromise()
    : state_(std::make_shared<detail::UpstreamCallState>()) {}

UpstreamFuture UpstreamPromise::future() const {
    return UpstreamFuture(state_);
}

bool UpstreamPromise::complete(UpstreamResponse response) const {
    return state_->settle(UpstreamOutcome::ok(std::move(response)), false);
}

bool UpstreamPromise::fail(UpstreamFailure failure) const {
    return state_->settle(UpstreamOutcome::err(std::move(failure)), false);
}

void UpstreamPromise::onCancel(std::function<void()> hook) const {
    {
        std::lock_guard lock(state_->mutex);
        if (!state_->cancelled) {
            state_->cancelHook = std::move(hook);
            return;
        }
    }
    hook();
}

}  // namespace agw::service
