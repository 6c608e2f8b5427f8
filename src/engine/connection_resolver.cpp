#include "engine/connection_resolver.hpp"
#include "util/env.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <filesystem>

namespace dockbox::engine {

std::string TransportCandidate::describe() const {
    if (kind == TransportKind::ENVIRONMENT) {
        return "environment";
    }
    return "unix://" + socket_path;
}

std::vector<TransportCandidate> default_candidates(const std::optional<std::string>& home_dir) {
    std::vector<TransportCandidate> candidates;
    candidates.push_back(TransportCandidate::environment());
    candidates.push_back(TransportCandidate::socket(SYSTEM_DOCKER_SOCKET));

    if (home_dir && !home_dir->empty()) {
        std::filesystem::path home(*home_dir);
        candidates.push_back(TransportCandidate::socket((home / ".rd" / "docker.sock").string()));
        candidates.push_back(TransportCandidate::socket((home / ".docker" / "run" / "docker.sock").string()));
        candidates.push_back(TransportCandidate::socket((home / ".colima" / "default" / "docker.sock").string()));
    }
    return candidates;
}

ConnectionResolver::ConnectionResolver(EngineConnector& connector, PathExists path_exists)
    : connector_(connector)
    , path_exists_(std::move(path_exists)) {
    if (!path_exists_) {
        path_exists_ = [](const std::string& path) {
            std::error_code ec;
            return std::filesystem::exists(path, ec);
        };
    }
}

ResolveResult ConnectionResolver::resolve(const util::CallContext& ctx) {
    return resolve(default_candidates(util::current_home_dir()), ctx);
}

ResolveResult ConnectionResolver::resolve(const std::vector<TransportCandidate>& candidates,
                                          const util::CallContext& ctx) {
    ResolveResult result;
    for (const auto& candidate : candidates) {
        if (candidate.kind == TransportKind::SOCKET) {
            result.attempted_paths.push_back(candidate.socket_path);
        }
    }

    for (const auto& candidate : candidates) {
        ConnectResult connected;

        if (candidate.kind == TransportKind::ENVIRONMENT) {
            spdlog::debug("Trying Docker connection from environment");
            connected = connector_.connect_from_env();
        } else {
            if (!path_exists_(candidate.socket_path)) {
                spdlog::debug("Skipping {}: socket does not exist", candidate.socket_path);
                continue;
            }
            spdlog::debug("Trying Docker socket {}", candidate.socket_path);
            connected = connector_.connect_to_host(candidate.describe());
        }

        if (!connected.client) {
            spdlog::warn("Docker connection via {} failed: {}", candidate.describe(), connected.error);
            continue;
        }

        if (validate(connected.client, candidate, ctx)) {
            result.host = connected.client->host();
            result.client = std::move(connected.client);
            spdlog::info("Connected to Docker daemon at {}", result.host);
            return result;
        }
    }

    result.error = fmt::format(
        "could not connect to Docker daemon. Tried standard connection and socket paths: [{}]",
        fmt::join(result.attempted_paths, " "));
    return result;
}

bool ConnectionResolver::validate(std::unique_ptr<EngineClient>& client,
                                  const TransportCandidate& candidate,
                                  const util::CallContext& ctx) {
    EngineResponse pong = client->ping(ctx);
    if (pong.success) {
        return true;
    }

    spdlog::warn("Docker daemon via {} did not answer ping: {}", candidate.describe(), pong.error);
    client->close();
    client.reset();
    return false;
}

} // namespace dockbox::engine
