/**
 * Docker Engine API client over libcurl
 *
 * Talks HTTP to the engine through a Unix socket (CURLOPT_UNIX_SOCKET_PATH)
 * or TCP, optionally with TLS. One easy handle is kept per client so
 * request/response calls reuse the connection; image pulls get their own
 * handle driven through the multi interface so the body can be read
 * incrementally.
 */
#pragma once
#include <map>
#include <string>
#include <curl/curl.h>
#include "engine/engine_client.hpp"
#include "engine/docker_host.hpp"

namespace dockbox::engine {

class HttpEngineClient : public EngineClient {
public:
    // Takes ownership of `curl`
    HttpEngineClient(const EngineEndpoint& endpoint, CURL* curl);
    ~HttpEngineClient() override;

    // Non-copyable
    HttpEngineClient(const HttpEngineClient&) = delete;
    HttpEngineClient& operator=(const HttpEngineClient&) = delete;

    EngineResponse ping(const util::CallContext& ctx) override;
    EngineResponse inspect_image(const std::string& image,
                                 const util::CallContext& ctx) override;
    PullResponse pull_image(const std::string& image,
                            const util::CallContext& ctx) override;
    CreateResponse create_container(const ContainerSpec& spec,
                                    const HostConfig& host_config,
                                    const std::string& name,
                                    const util::CallContext& ctx) override;
    EngineResponse start_container(const std::string& id,
                                   const util::CallContext& ctx) override;
    EngineResponse remove_container(const std::string& id, bool force,
                                    const util::CallContext& ctx) override;

    std::string host() const override { return endpoint_.host; }
    void close() override;

    // API version requests are sent with (after negotiation, if enabled)
    const std::string& api_version() const { return api_version_; }

private:
    EngineEndpoint endpoint_;
    std::string api_version_;
    CURL* curl_ = nullptr;
    bool closed_ = false;

    std::string url_for(const std::string& path, bool versioned = true) const;
    std::string escape(const std::string& value) const;

    EngineResponse perform(const std::string& method,
                           const std::string& path,
                           const std::string* json_body,
                           const util::CallContext& ctx,
                           bool versioned = true,
                           std::map<std::string, std::string>* headers_out = nullptr);
};

// Applies socket and TLS options shared by every request
void apply_transport_options(CURL* curl, const EngineEndpoint& endpoint);

// Bounds a blocking request by the context's remaining time
void apply_context_timeout(CURL* curl, const util::CallContext& ctx);

// "Error response from daemon: <message>" from an engine error body
std::string daemon_error_message(long http_status, const std::string& body);

class HttpEngineConnector : public EngineConnector {
public:
    ConnectResult connect_from_env() override;
    ConnectResult connect_to_host(const std::string& host) override;

private:
    ConnectResult connect(const EngineEndpoint& endpoint);
};

} // namespace dockbox::engine
