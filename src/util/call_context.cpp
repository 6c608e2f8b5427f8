#include "util/call_context.hpp"
#include <algorithm>

namespace dockbox::util {

const char* context_error_to_string(ContextError err) {
    switch (err) {
        case ContextError::NONE:              return "none";
        case ContextError::CANCELLED:         return "context canceled";
        case ContextError::DEADLINE_EXCEEDED: return "context deadline exceeded";
        default: return "unknown";
    }
}

CallContext CallContext::background() {
    return CallContext(std::make_shared<State>());
}

CallContext CallContext::with_cancel() const {
    auto child = std::make_shared<State>();
    child->parent = state_;
    return CallContext(std::move(child));
}

CallContext CallContext::with_timeout(std::chrono::milliseconds timeout) const {
    auto child = std::make_shared<State>();
    child->parent = state_;

    auto candidate = Clock::now() + timeout;
    auto inherited = deadline();
    child->deadline = inherited ? std::min(*inherited, candidate) : candidate;
    return CallContext(std::move(child));
}

void CallContext::cancel() const {
    state_->cancelled.store(true);
}

ContextError CallContext::error() const {
    auto now = Clock::now();
    bool expired = false;

    // Cancellation anywhere along the chain wins over an expired deadline
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->cancelled.load()) {
            return ContextError::CANCELLED;
        }
        if (s->deadline && now >= *s->deadline) {
            expired = true;
        }
    }
    return expired ? ContextError::DEADLINE_EXCEEDED : ContextError::NONE;
}

std::optional<CallContext::Clock::time_point> CallContext::deadline() const {
    std::optional<Clock::time_point> earliest;
    for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline && (!earliest || *s->deadline < *earliest)) {
            earliest = s->deadline;
        }
    }
    return earliest;
}

std::optional<std::chrono::milliseconds> CallContext::remaining() const {
    auto d = deadline();
    if (!d) {
        return std::nullopt;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*d - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

} // namespace dockbox::util
