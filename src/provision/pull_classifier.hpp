/**
 * Image pull failure classification
 *
 * A pull can fail at two levels: the transport (the call itself, or
 * reading its streamed body) and the payload (the engine reports success
 * over HTTP but embeds an error in the progress stream). Each level has
 * its own pure classifier. At the transport level an expired budget is
 * checked before any error text, because a timed-out transfer can carry
 * misleading text.
 */
#pragma once
#include <string>
#include <optional>
#include "provision/types.hpp"
#include "util/call_context.hpp"

namespace dockbox::provision {

enum class PullStage {
    CALL,    // Starting the pull request
    DRAIN    // Reading the streamed response
};

struct PullFailure {
    ProvisionErrorKind kind = ProvisionErrorKind::PULL_FAILED;
    std::string message;
};

// "not found", "404" or "manifest unknown" anywhere in `text`
bool contains_not_found_signal(const std::string& text);

// "error" or "Error" anywhere in `text`
bool contains_error_marker(const std::string& text);

// Classify a failed pull call or drain. `context_error` is the state of the
// pull-scoped context at the time of the failure.
PullFailure classify_transport_failure(PullStage stage,
                                       util::ContextError context_error,
                                       const std::string& error_text,
                                       const std::string& image);

// Inspect the fully drained pull output; nullopt means the pull succeeded
std::optional<PullFailure> classify_pull_payload(const std::string& payload,
                                                 const std::string& image);

} // namespace dockbox::provision
