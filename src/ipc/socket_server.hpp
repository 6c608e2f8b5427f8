/**
 * dockbox Socket Server
 *
 * Non-blocking Unix domain socket server. Reads framed messages from each
 * client, hands complete ones to the message handler and queues the
 * responses for writing. Driven by the daemon's reactor.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <cstdint>
#include <sys/types.h>
#include "ipc/protocol.hpp"

namespace dockbox::ipc {

using MessageHandler = std::function<Message(const Message&)>;

// Per-client buffers and identity
struct ClientConnection {
    int fd;
    uint32_t client_id;
    pid_t peer_pid = -1;
    uid_t peer_uid = static_cast<uid_t>(-1);
    std::vector<uint8_t> recv_buffer;
    std::vector<uint8_t> send_buffer;
    bool want_write = false;

    ClientConnection(int fd_, uint32_t id)
        : fd(fd_), client_id(id) {}
};

class SocketServer {
public:
    // `socket_mode` is applied to the socket file after bind
    explicit SocketServer(const std::string& socket_path, mode_t socket_mode = 0600);
    ~SocketServer();

    // Non-copyable
    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Bind and listen; false on failure (already logged)
    bool init();

    void set_handler(MessageHandler handler);

    // Accept one pending connection; -1 when none is waiting
    int accept_connection();

    // Read and dispatch; false when the client should be dropped
    bool handle_client(int client_fd);

    // Write queued responses; false when the client should be dropped
    bool flush_client(int client_fd);

    bool client_wants_write(int client_fd) const;
    void remove_client(int client_fd);

    void stop();

    int get_server_fd() const { return server_fd_; }
    size_t client_count() const { return clients_.size(); }

private:
    std::string socket_path_;
    mode_t socket_mode_;
    int server_fd_ = -1;
    uint32_t next_client_id_ = 1;
    MessageHandler handler_;
    std::unordered_map<int, std::unique_ptr<ClientConnection>> clients_;

    // Dispatch every complete message in the receive buffer.
    // False on a framing error.
    bool process_messages(ClientConnection& client);

    // Remove a stale socket file, refusing to touch anything else
    bool remove_stale_socket();
};

} // namespace dockbox::ipc
