/**
 * dockbox Daemon
 *
 * Owns the subsystems and runs the event loop:
 * - Reactor (epoll event loop)
 * - SocketServer (Unix domain socket IPC)
 * - ConnectionResolver + EnvironmentProvisioner (container provisioning)
 * - AuditLogger (provisioning history)
 *
 * Requests are handled on the loop thread, one at a time. An INIT_ENV
 * that has to pull an image holds the loop for as long as the pull runs
 * (up to the pull timeout, five minutes by default); other clients,
 * NOOP pings included, are not answered until it finishes.
 */
#pragma once
#include <string>
#include <memory>
#include <atomic>
#include <cstdint>
#include "daemon/reactor.hpp"
#include "daemon/audit_log.hpp"
#include "ipc/socket_server.hpp"
#include "engine/connection_resolver.hpp"
#include "provision/provisioner.hpp"
#include "util/call_context.hpp"

namespace dockbox::daemon {

struct DaemonConfig {
    std::string socket_path = "/tmp/dockbox.sock";
    provision::ProvisionerConfig provisioner;
    AuditConfig audit;

    // DOCKBOX_SOCKET plus the provisioner's environment settings
    static DaemonConfig from_env();
};

class Daemon {
public:
    using Config = DaemonConfig;

    // `connector` defaults to the libcurl Docker Engine connector
    explicit Daemon(const Config& config,
                    std::unique_ptr<engine::EngineConnector> connector = nullptr);
    ~Daemon();

    // Non-copyable
    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // Bind the socket and install signal handlers
    bool init();

    // Run the loop (blocks until shutdown)
    void run();

    // Stop the loop and cancel in-flight provisioning
    void shutdown();

    AuditLogger& audit() { return *audit_logger_; }

    // Dispatch one request; used by the socket server
    ipc::Message handle_message(const ipc::Message& msg);

private:
    Config config_;
    std::atomic<bool> running_{false};
    util::CallContext root_ctx_;

    std::unique_ptr<Reactor> reactor_;
    std::unique_ptr<ipc::SocketServer> socket_server_;
    std::unique_ptr<engine::EngineConnector> connector_;
    std::unique_ptr<engine::ConnectionResolver> resolver_;
    std::unique_ptr<provision::EnvironmentProvisioner> provisioner_;
    std::unique_ptr<AuditLogger> audit_logger_;

    // Client whose request is being provisioned, for audit attribution
    uint32_t active_client_id_ = 0;

    // Event handlers
    void on_server_event(int fd, uint32_t events);
    void on_client_event(int fd, uint32_t events);
    void update_client_events(int fd);
    void drop_client(int fd);

    // Operation handlers
    ipc::Message handle_init_env(const ipc::Message& msg);
    ipc::Message handle_get_audit_log(const ipc::Message& msg);
    ipc::Message handle_set_audit_config(const ipc::Message& msg);
};

} // namespace dockbox::daemon
