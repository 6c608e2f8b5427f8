#include "provision/pull_classifier.hpp"
#include <fmt/format.h>

namespace dockbox::provision {

static PullFailure not_found_failure(const std::string& image) {
    return {ProvisionErrorKind::IMAGE_NOT_FOUND,
            fmt::format("docker image {} not found in registry. "
                        "Please check that the image name and tag are correct", image)};
}

bool contains_not_found_signal(const std::string& text) {
    return text.find("not found") != std::string::npos ||
           text.find("404") != std::string::npos ||
           text.find("manifest unknown") != std::string::npos;
}

bool contains_error_marker(const std::string& text) {
    return text.find("error") != std::string::npos ||
           text.find("Error") != std::string::npos;
}

PullFailure classify_transport_failure(PullStage stage,
                                       util::ContextError context_error,
                                       const std::string& error_text,
                                       const std::string& image) {
    if (context_error == util::ContextError::DEADLINE_EXCEEDED) {
        if (stage == PullStage::CALL) {
            return {ProvisionErrorKind::PULL_TIMEOUT,
                    fmt::format("timeout while trying to pull Docker image {} - this usually means "
                                "the image doesn't exist in the registry or the registry is unreachable",
                                image)};
        }
        return {ProvisionErrorKind::PULL_TIMEOUT,
                fmt::format("timeout while downloading Docker image {}", image)};
    }

    if (stage == PullStage::DRAIN) {
        return {ProvisionErrorKind::PULL_FAILED,
                fmt::format("failed to read pull response for image {}: {}", image, error_text)};
    }

    if (contains_not_found_signal(error_text)) {
        return not_found_failure(image);
    }
    return {ProvisionErrorKind::PULL_FAILED,
            fmt::format("failed to pull Docker image {}: {}", image, error_text)};
}

std::optional<PullFailure> classify_pull_payload(const std::string& payload,
                                                 const std::string& image) {
    if (contains_not_found_signal(payload)) {
        return not_found_failure(image);
    }
    if (contains_error_marker(payload)) {
        return PullFailure{ProvisionErrorKind::PULL_FAILED,
                           fmt::format("failed to pull Docker image {}: {}", image, payload)};
    }
    return std::nullopt;
}

} // namespace dockbox::provision
