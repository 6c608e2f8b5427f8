#pragma once
#include <string>
#include <optional>

namespace dockbox::provision {

// Failure classes a provisioning attempt can end in
enum class ProvisionErrorKind {
    NONE,
    INVALID_REQUEST,    // Inbound payload could not be decoded
    CONNECTION,         // No engine transport connected and answered ping
    PULL_TIMEOUT,       // Pull call or drain ran past its budget
    IMAGE_NOT_FOUND,    // Registry says the image or tag does not exist
    PULL_FAILED,        // Any other pull failure
    CONTAINER_CREATE,
    CONTAINER_START
};

inline const char* provision_error_kind_to_string(ProvisionErrorKind kind) {
    switch (kind) {
        case ProvisionErrorKind::NONE:             return "NONE";
        case ProvisionErrorKind::INVALID_REQUEST:  return "INVALID_REQUEST";
        case ProvisionErrorKind::CONNECTION:       return "CONNECTION";
        case ProvisionErrorKind::PULL_TIMEOUT:     return "PULL_TIMEOUT";
        case ProvisionErrorKind::IMAGE_NOT_FOUND:  return "IMAGE_NOT_FOUND";
        case ProvisionErrorKind::PULL_FAILED:      return "PULL_FAILED";
        case ProvisionErrorKind::CONTAINER_CREATE: return "CONTAINER_CREATE";
        case ProvisionErrorKind::CONTAINER_START:  return "CONTAINER_START";
        default: return "UNKNOWN";
    }
}

// Lifecycle of one provisioning attempt
enum class ProvisionState {
    INIT,
    CONNECTING,
    CONNECTED,
    CONN_FAILED,
    CHECKING_IMAGE,
    PRESENT,
    PULLING,
    PULLED,
    PULL_FAILED,
    CREATING,
    CREATED,
    CREATE_FAILED,
    STARTING,
    RUNNING,
    START_FAILED
};

inline const char* provision_state_to_string(ProvisionState state) {
    switch (state) {
        case ProvisionState::INIT:           return "INIT";
        case ProvisionState::CONNECTING:     return "CONNECTING";
        case ProvisionState::CONNECTED:      return "CONNECTED";
        case ProvisionState::CONN_FAILED:    return "CONN_FAILED";
        case ProvisionState::CHECKING_IMAGE: return "CHECKING_IMAGE";
        case ProvisionState::PRESENT:        return "PRESENT";
        case ProvisionState::PULLING:        return "PULLING";
        case ProvisionState::PULLED:         return "PULLED";
        case ProvisionState::PULL_FAILED:    return "PULL_FAILED";
        case ProvisionState::CREATING:       return "CREATING";
        case ProvisionState::CREATED:        return "CREATED";
        case ProvisionState::CREATE_FAILED:  return "CREATE_FAILED";
        case ProvisionState::STARTING:       return "STARTING";
        case ProvisionState::RUNNING:        return "RUNNING";
        case ProvisionState::START_FAILED:   return "START_FAILED";
        default: return "UNKNOWN";
    }
}

struct ProvisionRequest {
    std::optional<std::string> image;   // Absent or empty selects the default image
};

struct ProvisionResult {
    bool success = false;
    std::string container_id;           // Set only on success
    std::string image;                  // Image the attempt resolved to
    ProvisionErrorKind error_kind = ProvisionErrorKind::NONE;
    std::string error;                  // Set only on failure
    ProvisionState final_state = ProvisionState::INIT;

    // "container_id: <id>" or "Error: <message>"
    std::string to_text() const {
        if (success) {
            return "container_id: " + container_id;
        }
        return "Error: " + error;
    }
};

} // namespace dockbox::provision
