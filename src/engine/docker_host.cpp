#include "engine/docker_host.hpp"
#include "util/env.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace dockbox::engine {

std::string EngineEndpoint::base_url() const {
    if (scheme == EndpointScheme::UNIX) {
        // Host part is ignored by the daemon when talking over a socket
        return "http://localhost";
    }
    return std::string(tls ? "https://" : "http://") + authority;
}

std::optional<EngineEndpoint> parse_engine_host(const std::string& host, std::string& error) {
    size_t sep = host.find("://");
    if (sep == std::string::npos) {
        error = "unable to parse docker host `" + host + "`";
        return std::nullopt;
    }

    std::string proto = host.substr(0, sep);
    std::string addr = host.substr(sep + 3);

    EngineEndpoint endpoint;
    endpoint.host = host;

    if (proto == "unix") {
        if (addr.empty() || addr[0] != '/') {
            error = "invalid unix socket path in docker host `" + host + "`";
            return std::nullopt;
        }
        endpoint.scheme = EndpointScheme::UNIX;
        endpoint.socket_path = addr;
        return endpoint;
    }

    if (proto == "tcp" || proto == "http" || proto == "https") {
        // Drop any path component; the API lives at the root
        size_t slash = addr.find('/');
        if (slash != std::string::npos) {
            addr = addr.substr(0, slash);
        }
        if (addr.empty()) {
            error = "missing address in docker host `" + host + "`";
            return std::nullopt;
        }
        endpoint.scheme = EndpointScheme::TCP;
        endpoint.authority = addr;
        if (proto == "https") {
            endpoint.tls = TlsSettings{};
        }
        return endpoint;
    }

    error = "protocol not available for docker host `" + host + "`";
    return std::nullopt;
}

std::optional<EngineEndpoint> endpoint_from_env(std::string& error) {
    std::string host = util::get_env_or("DOCKER_HOST", DEFAULT_DOCKER_HOST);
    auto endpoint = parse_engine_host(host, error);
    if (!endpoint) {
        return std::nullopt;
    }

    auto cert_path = util::get_env("DOCKER_CERT_PATH");
    if (cert_path && !cert_path->empty()) {
        TlsSettings tls;
        tls.ca_file = *cert_path + "/ca.pem";
        tls.cert_file = *cert_path + "/cert.pem";
        tls.key_file = *cert_path + "/key.pem";
        tls.verify_peer = !util::get_env_or("DOCKER_TLS_VERIFY", "").empty();
        endpoint->tls = tls;
    }

    auto version = util::get_env("DOCKER_API_VERSION");
    if (version && !version->empty()) {
        // A pinned version disables negotiation
        endpoint->api_version = *version;
        endpoint->negotiate_version = false;
    }

    spdlog::debug("Docker endpoint from environment: {} (api {}{})",
        endpoint->host, endpoint->api_version,
        endpoint->negotiate_version ? ", negotiated" : ", pinned");
    return endpoint;
}

int compare_api_versions(const std::string& a, const std::string& b) {
    auto parse = [](const std::string& v, size_t& pos) -> long {
        if (pos >= v.size()) return 0;
        size_t dot = v.find('.', pos);
        std::string part = v.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        pos = (dot == std::string::npos) ? v.size() : dot + 1;
        return std::strtol(part.c_str(), nullptr, 10);
    };

    size_t pa = 0;
    size_t pb = 0;
    while (pa < a.size() || pb < b.size()) {
        long x = parse(a, pa);
        long y = parse(b, pb);
        if (x != y) {
            return x < y ? -1 : 1;
        }
    }
    return 0;
}

ImageReference split_image_reference(const std::string& image) {
    ImageReference ref;

    size_t at = image.find('@');
    if (at != std::string::npos) {
        ref.repository = image.substr(0, at);
        ref.tag = image.substr(at + 1);
        return ref;
    }

    // A colon after the last slash is a tag; before it, a registry port
    size_t last_slash = image.rfind('/');
    size_t colon = image.rfind(':');
    if (colon != std::string::npos &&
        (last_slash == std::string::npos || colon > last_slash)) {
        ref.repository = image.substr(0, colon);
        ref.tag = image.substr(colon + 1);
    } else {
        ref.repository = image;
    }

    if (ref.tag.empty()) {
        ref.tag = "latest";
    }
    return ref;
}

} // namespace dockbox::engine
