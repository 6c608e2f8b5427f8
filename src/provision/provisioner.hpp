/**
 * dockbox Environment Provisioner
 *
 * Turns a ProvisionRequest into a running container:
 * connect (via ConnectionResolver) -> inspect image -> pull if absent ->
 * create -> start. Every failure is terminal for the attempt and comes
 * back as a classified ProvisionResult; nothing is retried and nothing
 * escapes as an exception.
 */
#pragma once
#include <string>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include "provision/types.hpp"
#include "engine/connection_resolver.hpp"
#include "util/call_context.hpp"

namespace dockbox::provision {

// Slim Debian image with a shell and Python, enough to run arbitrary code
constexpr const char* DEFAULT_IMAGE = "python:3.12-slim-bookworm";
constexpr const char* DEFAULT_WORKING_DIR = "/app";

struct ProvisionerConfig {
    std::string default_image = DEFAULT_IMAGE;
    std::string working_dir = DEFAULT_WORKING_DIR;
    std::chrono::milliseconds pull_timeout = std::chrono::minutes(5);

    // Best-effort forced removal of a container whose start failed
    bool remove_on_start_failure = false;

    // Reads DOCKBOX_REMOVE_ON_START_FAILURE; the rest stay fixed
    static ProvisionerConfig from_env();
};

// Called on every state transition of an attempt
using ProvisionEventCallback = std::function<void(const std::string& image, ProvisionState state)>;

class EnvironmentProvisioner {
public:
    EnvironmentProvisioner(engine::ConnectionResolver& resolver, const ProvisionerConfig& config);

    // Non-copyable
    EnvironmentProvisioner(const EnvironmentProvisioner&) = delete;
    EnvironmentProvisioner& operator=(const EnvironmentProvisioner&) = delete;

    ProvisionResult provision(const ProvisionRequest& request, const util::CallContext& ctx);

    // Image a request resolves to
    std::string resolve_image(const ProvisionRequest& request) const;

    // Container configuration used for `image`
    engine::ContainerSpec container_spec(const std::string& image) const;

    void set_event_callback(ProvisionEventCallback callback);

    const ProvisionerConfig& config() const { return config_; }

private:
    engine::ConnectionResolver& resolver_;
    ProvisionerConfig config_;
    ProvisionEventCallback event_callback_;

    // Inspect, then pull if absent. Fills `result` and returns false on failure.
    bool ensure_image(engine::EngineClient& client, const std::string& image,
                      const util::CallContext& ctx, ProvisionResult& result);

    bool pull_image(engine::EngineClient& client, const std::string& image,
                    const util::CallContext& ctx, ProvisionResult& result);

    void set_state(ProvisionResult& result, ProvisionState state);
    ProvisionResult& fail(ProvisionResult& result, ProvisionState state,
                          ProvisionErrorKind kind, const std::string& message);
};

// Decode an INIT_ENV payload. A missing or non-string "image" counts as absent.
ProvisionRequest request_from_json(const nlohmann::json& j);

// Encode a result for the wire: success flag, text, id or error kind
nlohmann::json result_to_json(const ProvisionResult& result);

} // namespace dockbox::provision
