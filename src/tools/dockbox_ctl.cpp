/**
 * dockbox-ctl
 *
 * Command-line client for the dockbox daemon.
 *
 *   dockbox-ctl [--socket PATH] init-env [IMAGE]
 *   dockbox-ctl [--socket PATH] audit [CATEGORY]
 *   dockbox-ctl [--socket PATH] ping
 */
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <vector>
#include "ipc/payload.hpp"
#include "ipc/protocol.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"

using json = nlohmann::json;
using dockbox::ipc::Message;
using dockbox::ipc::Opcode;

namespace {

void print_usage() {
    fmt::print(stderr,
        "usage: dockbox-ctl [--socket PATH] <command> [args]\n"
        "\n"
        "commands:\n"
        "  init-env [IMAGE]     provision a sandbox container\n"
        "  audit [CATEGORY]     print audit log entries (ENGINE, IMAGE, CONTAINER, REQUEST)\n"
        "  ping                 check the daemon is answering\n");
}

class DaemonConnection {
public:
    explicit DaemonConnection(std::string socket_path)
        : socket_path_(std::move(socket_path)) {}

    ~DaemonConnection() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    DaemonConnection(const DaemonConnection&) = delete;
    DaemonConnection& operator=(const DaemonConnection&) = delete;

    bool connect_to_daemon() {
        struct sockaddr_un addr;
        if (socket_path_.size() >= sizeof(addr.sun_path)) {
            spdlog::error("Socket path too long: {}", socket_path_);
            return false;
        }

        fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd_ < 0) {
            spdlog::error("Failed to create socket: {}", strerror(errno));
            return false;
        }

        memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

        if (connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            spdlog::error("Cannot connect to dockbox daemon at {}: {}", socket_path_, strerror(errno));
            return false;
        }
        return true;
    }

    std::optional<Message> call(const Message& request) {
        auto data = request.serialize();
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                spdlog::error("Send failed: {}", strerror(errno));
                return std::nullopt;
            }
            sent += static_cast<size_t>(n);
        }

        std::vector<uint8_t> buffer;
        uint8_t chunk[4096];
        while (true) {
            auto total = Message::get_message_size(buffer.data(), buffer.size());
            if (total && buffer.size() >= *total) {
                return Message::deserialize(buffer.data(), *total);
            }
            if (!total && buffer.size() >= dockbox::ipc::HEADER_SIZE) {
                spdlog::error("Invalid response header from daemon");
                return std::nullopt;
            }

            ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
            if (n == 0) {
                spdlog::error("Daemon closed the connection");
                return std::nullopt;
            }
            if (n < 0) {
                if (errno == EINTR) continue;
                spdlog::error("Receive failed: {}", strerror(errno));
                return std::nullopt;
            }
            buffer.insert(buffer.end(), chunk, chunk + n);
        }
    }

private:
    std::string socket_path_;
    int fd_ = -1;
};

std::optional<json> parse_response(const Message& response) {
    try {
        return json::parse(response.payload_str());
    } catch (const json::exception& e) {
        spdlog::error("Unparsable response from daemon: {}", e.what());
        return std::nullopt;
    }
}

int run_init_env(DaemonConnection& conn, const std::optional<std::string>& image) {
    json request = json::object();
    if (image) {
        request["image"] = *image;
    }

    std::string error;
    auto payload = dockbox::ipc::try_dump_payload(request, error);
    if (!payload) {
        fmt::print(stderr, "Error: IMAGE is not valid UTF-8 ({})\n", error);
        return 2;
    }

    auto response = conn.call(Message(0, Opcode::INIT_ENV, *payload));
    if (!response) {
        return 1;
    }
    auto body = parse_response(*response);
    if (!body) {
        return 1;
    }

    fmt::print("{}\n", body->value("text", ""));
    return body->value("success", false) ? 0 : 1;
}

int run_audit(DaemonConnection& conn, const std::optional<std::string>& category) {
    json request = json::object();
    if (category) {
        request["category"] = *category;
    }
    request["limit"] = 1000;

    std::string error;
    auto payload = dockbox::ipc::try_dump_payload(request, error);
    if (!payload) {
        fmt::print(stderr, "Error: CATEGORY is not valid UTF-8 ({})\n", error);
        return 2;
    }

    auto response = conn.call(Message(0, Opcode::GET_AUDIT_LOG, *payload));
    if (!response) {
        return 1;
    }
    auto body = parse_response(*response);
    if (!body) {
        return 1;
    }
    if (!body->value("success", false)) {
        fmt::print(stderr, "Error: {}\n", body->value("error", "unknown error"));
        return 1;
    }

    for (const auto& entry : (*body)["entries"]) {
        fmt::print("{}\n", dockbox::ipc::dump_payload(entry));
    }
    return 0;
}

int run_ping(DaemonConnection& conn) {
    auto response = conn.call(Message(0, Opcode::NOOP, "ping"));
    if (!response || response->payload_str() != "ping") {
        fmt::print(stderr, "no answer\n");
        return 1;
    }
    fmt::print("ok\n");
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    dockbox::util::load_dotenv();
    dockbox::util::init_logger(dockbox::util::log_level_from_string(
        dockbox::util::get_env_or("DOCKBOX_LOG_LEVEL", "warn"), spdlog::level::warn));

    std::string socket_path = dockbox::util::get_env_or("DOCKBOX_SOCKET", "/tmp/dockbox.sock");
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--socket") {
            if (i + 1 >= argc) {
                print_usage();
                return 2;
            }
            socket_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage();
        return 2;
    }

    const std::string& command = args[0];
    std::optional<std::string> operand;
    if (args.size() > 1) {
        operand = args[1];
    }

    if (command != "init-env" && command != "audit" && command != "ping") {
        print_usage();
        return 2;
    }

    DaemonConnection conn(socket_path);
    if (!conn.connect_to_daemon()) {
        return 1;
    }

    if (command == "init-env") {
        return run_init_env(conn, operand);
    }
    if (command == "audit") {
        return run_audit(conn, operand);
    }
    return run_ping(conn);
}
