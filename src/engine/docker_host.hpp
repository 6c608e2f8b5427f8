/**
 * Docker endpoint configuration
 *
 * Parses DOCKER_HOST style addresses and gathers the environment settings
 * the Docker CLI honours (DOCKER_HOST, DOCKER_API_VERSION, DOCKER_CERT_PATH,
 * DOCKER_TLS_VERIFY).
 */
#pragma once
#include <string>
#include <optional>

namespace dockbox::engine {

constexpr const char* DEFAULT_DOCKER_HOST = "unix:///var/run/docker.sock";
constexpr const char* DEFAULT_API_VERSION = "1.45";
// Version assumed when a daemon's ping response carries no Api-Version header
constexpr const char* FALLBACK_API_VERSION = "1.24";

enum class EndpointScheme {
    UNIX,
    TCP
};

struct TlsSettings {
    std::string ca_file;
    std::string cert_file;
    std::string key_file;
    bool verify_peer = false;
};

struct EngineEndpoint {
    EndpointScheme scheme = EndpointScheme::UNIX;
    std::string socket_path;     // UNIX only
    std::string authority;       // TCP only, "host:port"
    std::optional<TlsSettings> tls;

    std::string api_version = DEFAULT_API_VERSION;
    bool negotiate_version = true;

    // Address as given, for logs and error messages
    std::string host;

    // Base URL requests are issued against (without the version prefix)
    std::string base_url() const;
};

// Parse "unix:///path", "tcp://host:port", "http://..." or "https://...".
// Returns nullopt and fills `error` for unsupported or malformed addresses.
std::optional<EngineEndpoint> parse_engine_host(const std::string& host, std::string& error);

// Endpoint described by the environment, falling back to the default socket
std::optional<EngineEndpoint> endpoint_from_env(std::string& error);

// Compare "major.minor" API versions: <0, 0, >0 like strcmp
int compare_api_versions(const std::string& a, const std::string& b);

// Split an image reference into the repository and the tag/digest the
// pull endpoint expects. Untagged references pull "latest".
struct ImageReference {
    std::string repository;
    std::string tag;
};

ImageReference split_image_reference(const std::string& image);

} // namespace dockbox::engine
