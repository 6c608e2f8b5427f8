/**
 * Connection resolver
 *
 * Finds a working engine connection by walking an ordered list of
 * candidate transports: the environment-derived default first, then
 * well-known socket paths. Each candidate is connected and pinged; the
 * first one that answers wins and no later candidate is touched.
 * Socket paths that do not exist on disk are skipped without a connect.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include "engine/engine_client.hpp"
#include "util/call_context.hpp"

namespace dockbox::engine {

enum class TransportKind {
    ENVIRONMENT,   // DOCKER_HOST and friends
    SOCKET         // Explicit Unix socket path
};

struct TransportCandidate {
    TransportKind kind = TransportKind::ENVIRONMENT;
    std::string socket_path;   // SOCKET only

    static TransportCandidate environment() { return {TransportKind::ENVIRONMENT, ""}; }
    static TransportCandidate socket(const std::string& path) { return {TransportKind::SOCKET, path}; }

    std::string describe() const;
};

constexpr const char* SYSTEM_DOCKER_SOCKET = "/var/run/docker.sock";

// Default candidate chain. Home-relative sockets (Rancher Desktop, Docker
// Desktop, Colima) are only included when `home_dir` is known.
std::vector<TransportCandidate> default_candidates(const std::optional<std::string>& home_dir);

struct ResolveResult {
    std::unique_ptr<EngineClient> client;        // null on failure
    std::string host;                            // Address of the winning candidate
    std::vector<std::string> attempted_paths;    // Every socket candidate, in order
    std::string error;

    bool success() const { return client != nullptr; }
};

class ConnectionResolver {
public:
    using PathExists = std::function<bool(const std::string&)>;

    // `path_exists` defaults to a filesystem existence check
    explicit ConnectionResolver(EngineConnector& connector, PathExists path_exists = {});

    // Walk the default chain for the current user
    ResolveResult resolve(const util::CallContext& ctx);

    // Walk an explicit chain
    ResolveResult resolve(const std::vector<TransportCandidate>& candidates,
                          const util::CallContext& ctx);

private:
    EngineConnector& connector_;
    PathExists path_exists_;

    // Ping a freshly connected client; closes and drops it on failure
    bool validate(std::unique_ptr<EngineClient>& client,
                  const TransportCandidate& candidate,
                  const util::CallContext& ctx);
};

} // namespace dockbox::engine
