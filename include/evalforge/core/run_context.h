#pragma once

#include <evalforge/core/types.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <stop_token>
#include <string>

namespace evalforge {

/**
 * @brief Cancellation and deadline carried through every collaborator call.
 *
 * A context is cheap to copy. Stage contexts derived with withTimeout() share the
 * stop token of their parent and never extend the parent's deadline.
 */
class RunContext {
public:
    using Clock = std::chrono::steady_clock;

    RunContext() = default;
    explicit RunContext(std::stop_token token, std::optional<Clock::time_point> deadline = {})
        : token_(std::move(token)), deadline_(deadline) {}

    static RunContext background() { return RunContext{}; }

    bool cancelled() const noexcept { return token_.stop_requested(); }

    bool expired() const noexcept { return deadline_ && Clock::now() >= *deadline_; }

    const std::stop_token& stopToken() const noexcept { return token_; }
    std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

    // Time left before the deadline, or nullopt when unbounded.
    std::optional<std::chrono::milliseconds> remaining() const {
        if (!deadline_)
            return std::nullopt;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
        return std::max(left, std::chrono::milliseconds{0});
    }

    RunContext withTimeout(std::chrono::milliseconds timeout) const {
        if (timeout.count() <= 0)
            return *this;
        auto next = Clock::now() + timeout;
        if (deadline_)
            next = std::min(next, *deadline_);
        return RunContext{token_, next};
    }

    // Returns OperationCancelled or Timeout when the run must stop.
    Result<void> checkpoint(const std::string& where) const {
        if (cancelled())
            return Error{ErrorCode::OperationCancelled, where + ": cancelled"};
        if (expired())
            return Error{ErrorCode::Timeout, where + ": deadline exceeded"};
        return {};
    }

private:
    std::stop_token token_{};
    std::optional<Clock::time_point> deadline_{};
};

} // namespace evalforge
