#include "ipc/socket_server.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace dockbox::ipc {

// Receive buffers beyond this are a misbehaving client
constexpr size_t MAX_RECV_BUFFER = HEADER_SIZE + MAX_PAYLOAD_SIZE;

static bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

SocketServer::SocketServer(const std::string& socket_path, mode_t socket_mode)
    : socket_path_(socket_path)
    , socket_mode_(socket_mode) {}

SocketServer::~SocketServer() {
    stop();
}

bool SocketServer::remove_stale_socket() {
    struct stat st;
    if (lstat(socket_path_.c_str(), &st) < 0) {
        return errno == ENOENT;
    }
    if (!S_ISSOCK(st.st_mode)) {
        spdlog::error("Refusing to replace {}: not a socket", socket_path_);
        return false;
    }
    if (unlink(socket_path_.c_str()) < 0) {
        spdlog::error("Failed to remove stale socket {}: {}", socket_path_, strerror(errno));
        return false;
    }
    return true;
}

bool SocketServer::init() {
    struct sockaddr_un addr;
    if (socket_path_.size() >= sizeof(addr.sun_path)) {
        spdlog::error("Socket path too long: {}", socket_path_);
        return false;
    }

    if (!remove_stale_socket()) {
        return false;
    }

    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    if (!set_nonblocking(server_fd_)) {
        spdlog::error("Failed to set non-blocking: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind socket: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    // Whoever can talk to us can start containers
    if (chmod(socket_path_.c_str(), socket_mode_) < 0) {
        spdlog::warn("Failed to set mode {:o} on {}: {}", socket_mode_, socket_path_, strerror(errno));
    }

    if (listen(server_fd_, 16) < 0) {
        spdlog::error("Failed to listen: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    spdlog::info("Socket server listening on {}", socket_path_);
    return true;
}

void SocketServer::set_handler(MessageHandler handler) {
    handler_ = std::move(handler);
}

int SocketServer::accept_connection() {
    int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
    if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::error("Failed to accept: {}", strerror(errno));
        }
        return -1;
    }

    auto client = std::make_unique<ClientConnection>(client_fd, next_client_id_++);

    struct ucred cred;
    socklen_t cred_len = sizeof(cred);
    if (getsockopt(client_fd, SOL_SOCKET, SO_PEERCRED, &cred, &cred_len) == 0) {
        client->peer_pid = cred.pid;
        client->peer_uid = cred.uid;
    }

    spdlog::info("Client {} connected (fd={}, pid={}, uid={})",
        client->client_id, client_fd, client->peer_pid, client->peer_uid);
    clients_[client_fd] = std::move(client);
    return client_fd;
}

bool SocketServer::handle_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }

    auto& client = *it->second;
    uint8_t buffer[4096];

    while (true) {
        ssize_t n = read(client_fd, buffer, sizeof(buffer));
        if (n > 0) {
            client.recv_buffer.insert(client.recv_buffer.end(), buffer, buffer + n);
            if (client.recv_buffer.size() > MAX_RECV_BUFFER) {
                spdlog::warn("Client {} exceeded receive buffer, dropping", client.client_id);
                return false;
            }
        } else if (n == 0) {
            spdlog::info("Client {} disconnected (fd={})", client.client_id, client_fd);
            return false;
        } else {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("Read error for client {}: {}", client.client_id, strerror(errno));
            return false;
        }
    }

    return process_messages(client);
}

bool SocketServer::process_messages(ClientConnection& client) {
    while (client.recv_buffer.size() >= HEADER_SIZE) {
        auto msg_size = Message::get_message_size(
            client.recv_buffer.data(),
            client.recv_buffer.size()
        );

        // A full header that does not validate can never become valid
        if (!msg_size) {
            spdlog::warn("Invalid message header from client {}, dropping", client.client_id);
            return false;
        }

        if (client.recv_buffer.size() < *msg_size) {
            break;
        }

        auto msg = Message::deserialize(client.recv_buffer.data(), *msg_size);
        client.recv_buffer.erase(
            client.recv_buffer.begin(),
            client.recv_buffer.begin() + *msg_size
        );
        if (!msg) {
            spdlog::warn("Malformed message from client {}", client.client_id);
            continue;
        }

        spdlog::debug("Client {} -> {} ({}B payload)",
            client.client_id, opcode_to_string(msg->opcode), msg->payload.size());

        if (!handler_) {
            continue;
        }

        // The daemon decides the id, whatever the client sent
        msg->client_id = client.client_id;
        Message response = handler_(*msg);
        response.client_id = client.client_id;

        auto serialized = response.serialize();
        client.send_buffer.insert(client.send_buffer.end(), serialized.begin(), serialized.end());
        client.want_write = true;

        spdlog::debug("Client {} <- {} ({}B payload)",
            client.client_id, opcode_to_string(response.opcode), response.payload.size());
    }
    return true;
}

bool SocketServer::flush_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }

    auto& client = *it->second;
    size_t written = 0;

    while (written < client.send_buffer.size()) {
        ssize_t n = send(client_fd,
            client.send_buffer.data() + written,
            client.send_buffer.size() - written,
            MSG_NOSIGNAL);

        if (n > 0) {
            written += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        } else {
            spdlog::error("Write error for client {}: {}", client.client_id, strerror(errno));
            return false;
        }
    }

    client.send_buffer.erase(client.send_buffer.begin(), client.send_buffer.begin() + written);
    client.want_write = !client.send_buffer.empty();
    return true;
}

bool SocketServer::client_wants_write(int client_fd) const {
    auto it = clients_.find(client_fd);
    if (it == clients_.end()) {
        return false;
    }
    return it->second->want_write;
}

void SocketServer::remove_client(int client_fd) {
    auto it = clients_.find(client_fd);
    if (it != clients_.end()) {
        close(client_fd);
        clients_.erase(it);
    }
}

void SocketServer::stop() {
    for (auto& [fd, client] : clients_) {
        close(fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(socket_path_.c_str());
        spdlog::info("Socket server stopped");
    }
}

} // namespace dockbox::ipc
