#include "provision/provisioner.hpp"
#include "provision/pull_classifier.hpp"
#include "util/env.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace dockbox::provision {

ProvisionerConfig ProvisionerConfig::from_env() {
    ProvisionerConfig config;
    config.remove_on_start_failure = util::get_env_flag("DOCKBOX_REMOVE_ON_START_FAILURE", false);
    return config;
}

// ============================================================================
// EnvironmentProvisioner Implementation
// ============================================================================

EnvironmentProvisioner::EnvironmentProvisioner(engine::ConnectionResolver& resolver,
                                               const ProvisionerConfig& config)
    : resolver_(resolver)
    , config_(config) {}

void EnvironmentProvisioner::set_event_callback(ProvisionEventCallback callback) {
    event_callback_ = std::move(callback);
}

std::string EnvironmentProvisioner::resolve_image(const ProvisionRequest& request) const {
    if (request.image && !request.image->empty()) {
        return *request.image;
    }
    return config_.default_image;
}

engine::ContainerSpec EnvironmentProvisioner::container_spec(const std::string& image) const {
    engine::ContainerSpec spec;
    spec.image = image;
    spec.working_dir = config_.working_dir;
    spec.tty = true;
    spec.open_stdin = true;
    // Keep stdin open across attaches for multi-step sessions
    spec.stdin_once = false;
    return spec;
}

void EnvironmentProvisioner::set_state(ProvisionResult& result, ProvisionState state) {
    spdlog::debug("Provision [{}]: {} -> {}", result.image,
        provision_state_to_string(result.final_state), provision_state_to_string(state));
    result.final_state = state;
    if (event_callback_) {
        event_callback_(result.image, state);
    }
}

ProvisionResult& EnvironmentProvisioner::fail(ProvisionResult& result, ProvisionState state,
                                              ProvisionErrorKind kind, const std::string& message) {
    result.success = false;
    result.container_id.clear();
    result.error_kind = kind;
    result.error = message;
    set_state(result, state);
    spdlog::error("Provisioning {} failed ({}): {}", result.image,
        provision_error_kind_to_string(kind), message);
    return result;
}

ProvisionResult EnvironmentProvisioner::provision(const ProvisionRequest& request,
                                                  const util::CallContext& ctx) {
    ProvisionResult result;
    result.image = resolve_image(request);

    set_state(result, ProvisionState::CONNECTING);
    engine::ResolveResult connection = resolver_.resolve(ctx);
    if (!connection.success()) {
        return fail(result, ProvisionState::CONN_FAILED, ProvisionErrorKind::CONNECTION,
            "failed to create Docker client: " + connection.error);
    }
    // Released when this attempt returns, whatever the outcome
    std::unique_ptr<engine::EngineClient> client = std::move(connection.client);
    set_state(result, ProvisionState::CONNECTED);

    if (!ensure_image(*client, result.image, ctx, result)) {
        return result;
    }

    set_state(result, ProvisionState::CREATING);
    engine::CreateResponse created = client->create_container(
        container_spec(result.image), engine::HostConfig{}, "", ctx);
    if (!created.success) {
        return fail(result, ProvisionState::CREATE_FAILED, ProvisionErrorKind::CONTAINER_CREATE,
            "failed to create container: " + created.error);
    }
    for (const auto& warning : created.warnings) {
        spdlog::warn("Container {}: {}", created.id, warning);
    }
    set_state(result, ProvisionState::CREATED);

    set_state(result, ProvisionState::STARTING);
    engine::EngineResponse started = client->start_container(created.id, ctx);
    if (!started.success) {
        if (config_.remove_on_start_failure) {
            engine::EngineResponse removed = client->remove_container(created.id, true, ctx);
            if (removed.success) {
                spdlog::info("Removed container {} after failed start", created.id);
            } else {
                spdlog::warn("Could not remove container {} after failed start: {}",
                    created.id, removed.error);
            }
        } else {
            spdlog::warn("Container {} was created but not started; it is left in place", created.id);
        }
        return fail(result, ProvisionState::START_FAILED, ProvisionErrorKind::CONTAINER_START,
            "failed to start container: " + started.error);
    }

    result.success = true;
    result.container_id = created.id;
    set_state(result, ProvisionState::RUNNING);
    spdlog::info("Container {} running ({})", created.id, result.image);
    return result;
}

bool EnvironmentProvisioner::ensure_image(engine::EngineClient& client,
                                          const std::string& image,
                                          const util::CallContext& ctx,
                                          ProvisionResult& result) {
    set_state(result, ProvisionState::CHECKING_IMAGE);

    // Any inspect failure means "not here", whatever the reason
    engine::EngineResponse inspected = client.inspect_image(image, ctx);
    if (inspected.success) {
        spdlog::info("Docker image {} found locally", image);
        set_state(result, ProvisionState::PRESENT);
        return true;
    }

    spdlog::info("Docker image {} not found locally, pulling from registry...", image);
    set_state(result, ProvisionState::PULLING);
    if (!pull_image(client, image, ctx, result)) {
        return false;
    }

    spdlog::info("Successfully pulled Docker image {}", image);
    set_state(result, ProvisionState::PULLED);
    return true;
}

bool EnvironmentProvisioner::pull_image(engine::EngineClient& client,
                                        const std::string& image,
                                        const util::CallContext& ctx,
                                        ProvisionResult& result) {
    util::CallContext pull_ctx = ctx.with_timeout(config_.pull_timeout);

    engine::PullResponse pulled = client.pull_image(image, pull_ctx);
    if (!pulled.success) {
        PullFailure failure = classify_transport_failure(
            PullStage::CALL, pull_ctx.error(), pulled.error, image);
        fail(result, ProvisionState::PULL_FAILED, failure.kind, failure.message);
        return false;
    }

    std::unique_ptr<engine::PullStream> stream = std::move(pulled.stream);
    engine::DrainResult drained = engine::drain_stream(*stream);
    stream->close();

    if (!drained.success) {
        PullFailure failure = classify_transport_failure(
            PullStage::DRAIN, pull_ctx.error(), drained.error, image);
        fail(result, ProvisionState::PULL_FAILED, failure.kind, failure.message);
        return false;
    }

    auto failure = classify_pull_payload(drained.text, image);
    if (failure) {
        fail(result, ProvisionState::PULL_FAILED, failure->kind, failure->message);
        return false;
    }
    return true;
}

// ============================================================================
// Wire helpers
// ============================================================================

ProvisionRequest request_from_json(const json& j) {
    ProvisionRequest request;
    if (j.is_object() && j.contains("image") && j["image"].is_string()) {
        request.image = j["image"].get<std::string>();
    }
    return request;
}

json result_to_json(const ProvisionResult& result) {
    json j;
    j["success"] = result.success;
    j["text"] = result.to_text();
    j["image"] = result.image;
    j["state"] = provision_state_to_string(result.final_state);
    if (result.success) {
        j["container_id"] = result.container_id;
    } else {
        j["error"] = result.error;
        j["error_kind"] = provision_error_kind_to_string(result.error_kind);
    }
    return j;
}

} // namespace dockbox::provision
