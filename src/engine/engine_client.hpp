/**
 * dockbox engine interface
 *
 * The minimal container-engine surface the provisioner needs: liveness,
 * image inspect/pull, container create/start/remove. Operations report
 * failures through result structs; nothing here throws.
 *
 * An EngineClient is exclusively owned by whoever connected it. close()
 * releases the transport and is safe to call more than once; destructors
 * of implementations call it.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include "util/call_context.hpp"

namespace dockbox::engine {

// Result of a request/response engine call
struct EngineResponse {
    bool success = false;
    long http_status = 0;      // 0 when no HTTP response was received
    std::string body;
    std::string error;         // Human-readable failure, empty on success
};

// Container configuration (the subset of the engine's create body we set)
struct ContainerSpec {
    std::string image;
    std::string working_dir;
    bool tty = false;
    bool open_stdin = false;
    bool stdin_once = false;
};

// Host configuration; empty by default (no limits, mounts or networking)
struct HostConfig {
};

struct CreateResponse {
    bool success = false;
    std::string id;
    std::vector<std::string> warnings;
    std::string error;
};

// Outcome of reading one step of a streamed response
enum class StreamStatus {
    DATA,      // `chunk` holds more bytes
    END,       // stream finished cleanly
    FAILED     // transport error or cancelled; see `error`
};

// Streamed response body of an image pull
class PullStream {
public:
    virtual ~PullStream() = default;

    virtual StreamStatus read(std::string& chunk, std::string& error) = 0;

    // Abort the transfer if still running and release the transport
    virtual void close() = 0;
};

struct PullResponse {
    bool success = false;
    std::unique_ptr<PullStream> stream;   // Set only on success
    std::string error;
};

class EngineClient {
public:
    virtual ~EngineClient() = default;

    virtual EngineResponse ping(const util::CallContext& ctx) = 0;
    virtual EngineResponse inspect_image(const std::string& image,
                                         const util::CallContext& ctx) = 0;

    // Starts the pull and returns once the engine answered with headers.
    // The transfer keeps running inside the returned stream, bound to `ctx`.
    virtual PullResponse pull_image(const std::string& image,
                                    const util::CallContext& ctx) = 0;

    // `name` empty lets the engine assign one
    virtual CreateResponse create_container(const ContainerSpec& spec,
                                            const HostConfig& host_config,
                                            const std::string& name,
                                            const util::CallContext& ctx) = 0;
    virtual EngineResponse start_container(const std::string& id,
                                           const util::CallContext& ctx) = 0;
    virtual EngineResponse remove_container(const std::string& id, bool force,
                                            const util::CallContext& ctx) = 0;

    // Transport address this client talks to, for diagnostics
    virtual std::string host() const = 0;

    virtual void close() = 0;
};

struct ConnectResult {
    std::unique_ptr<EngineClient> client;   // null on failure
    std::string error;
};

// Builds engine clients for a transport. Construction only validates the
// address; reachability is checked by the caller with ping().
class EngineConnector {
public:
    virtual ~EngineConnector() = default;

    // Transport described by the process environment (DOCKER_HOST and friends)
    virtual ConnectResult connect_from_env() = 0;

    // Explicit host address such as "unix:///var/run/docker.sock"
    virtual ConnectResult connect_to_host(const std::string& host) = 0;
};

// Read a pull stream to completion. On success `text` holds everything
// read; on failure it holds what was read before the error.
struct DrainResult {
    bool success = false;
    std::string text;
    std::string error;
};

DrainResult drain_stream(PullStream& stream);

} // namespace dockbox::engine
