/**
 * Call context
 *
 * Carries a deadline and a cancellation flag down a chain of calls.
 * Contexts form a tree: a child sees its own cancellation and deadline
 * plus everything inherited from its ancestors, so cancelling a parent
 * cancels every derived context, while a child can never outlive its
 * parent's deadline.
 */
#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace dockbox::util {

enum class ContextError {
    NONE,
    CANCELLED,
    DEADLINE_EXCEEDED
};

const char* context_error_to_string(ContextError err);

class CallContext {
public:
    using Clock = std::chrono::steady_clock;

    // Root context: no deadline, never cancelled unless derived with_cancel()
    static CallContext background();

    // Child with its own cancel flag
    CallContext with_cancel() const;

    // Child whose deadline is now + timeout, capped by this context's deadline
    CallContext with_timeout(std::chrono::milliseconds timeout) const;

    // Cancel this context and everything derived from it
    void cancel() const;

    // Why the context is done, NONE while it is still live
    ContextError error() const;
    bool done() const { return error() != ContextError::NONE; }

    // Effective deadline (earliest along the chain), if any
    std::optional<Clock::time_point> deadline() const;

    // Time left before the deadline; nullopt when there is none
    std::optional<std::chrono::milliseconds> remaining() const;

private:
    struct State {
        std::shared_ptr<const State> parent;
        std::optional<Clock::time_point> deadline;
        mutable std::atomic<bool> cancelled{false};
    };

    explicit CallContext(std::shared_ptr<const State> state)
        : state_(std::move(state)) {}

    std::shared_ptr<const State> state_;
};

} // namespace dockbox::util
