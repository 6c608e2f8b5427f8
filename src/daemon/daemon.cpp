#include "daemon/daemon.hpp"
#include "engine/http_engine_client.hpp"
#include "ipc/payload.hpp"
#include "util/env.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sys/epoll.h>
#include <csignal>
#include <stdexcept>

using json = nlohmann::json;

namespace dockbox::daemon {

// Global daemon pointer for signal handling
static Daemon* g_daemon = nullptr;

static void signal_handler(int) {
    if (g_daemon) {
        g_daemon->shutdown();
    }
}

DaemonConfig DaemonConfig::from_env() {
    DaemonConfig config;
    config.socket_path = util::get_env_or("DOCKBOX_SOCKET", config.socket_path);
    config.provisioner = provision::ProvisionerConfig::from_env();
    return config;
}

Daemon::Daemon(const Config& config, std::unique_ptr<engine::EngineConnector> connector)
    : config_(config)
    , root_ctx_(util::CallContext::background().with_cancel())
    , reactor_(std::make_unique<Reactor>())
    , socket_server_(std::make_unique<ipc::SocketServer>(config.socket_path))
    , connector_(std::move(connector))
    , audit_logger_(std::make_unique<AuditLogger>(config.audit))
{
    if (!connector_) {
        connector_ = std::make_unique<engine::HttpEngineConnector>();
    }
    resolver_ = std::make_unique<engine::ConnectionResolver>(*connector_);
    provisioner_ = std::make_unique<provision::EnvironmentProvisioner>(*resolver_, config_.provisioner);

    provisioner_->set_event_callback(
        [this](const std::string& image, provision::ProvisionState state) {
            audit_logger_->log_transition(active_client_id_, image, state);
        });
}

Daemon::~Daemon() {
    if (g_daemon == this) {
        g_daemon = nullptr;
    }
}

bool Daemon::init() {
    spdlog::info("Initializing dockbox daemon...");

    if (!reactor_->init()) {
        spdlog::error("Failed to initialize reactor");
        return false;
    }

    socket_server_->set_handler([this](const ipc::Message& msg) {
        return handle_message(msg);
    });

    if (!socket_server_->init()) {
        spdlog::error("Failed to initialize socket server");
        return false;
    }

    int server_fd = socket_server_->get_server_fd();
    if (!reactor_->add(server_fd, EPOLLIN, [this](int fd, uint32_t events) {
            on_server_event(fd, events);
        })) {
        return false;
    }

    g_daemon = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    spdlog::info("Default image: {}", config_.provisioner.default_image);
    spdlog::info("Remove containers on failed start: {}",
        config_.provisioner.remove_on_start_failure ? "yes" : "no");
    return true;
}

void Daemon::run() {
    running_ = true;
    spdlog::info("dockbox daemon listening on {}", config_.socket_path);

    while (running_) {
        int n = reactor_->poll(100);
        if (n < 0) {
            spdlog::error("Reactor error, exiting");
            break;
        }
    }

    spdlog::info("Daemon shutting down...");
    socket_server_->stop();
    spdlog::info("Daemon stopped");
}

void Daemon::shutdown() {
    running_ = false;
    // Aborts any pull or engine call still in flight
    root_ctx_.cancel();
}

void Daemon::on_server_event(int, uint32_t events) {
    if (!(events & EPOLLIN)) {
        return;
    }

    while (true) {
        int client_fd = socket_server_->accept_connection();
        if (client_fd < 0) {
            break;
        }

        if (!reactor_->add(client_fd, EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR,
                [this](int cfd, uint32_t ev) { on_client_event(cfd, ev); })) {
            socket_server_->remove_client(client_fd);
        }
    }
}

void Daemon::on_client_event(int fd, uint32_t events) {
    if (events & EPOLLIN) {
        if (!socket_server_->handle_client(fd)) {
            drop_client(fd);
            return;
        }
    }

    if (events & (EPOLLHUP | EPOLLERR)) {
        drop_client(fd);
        return;
    }

    if (events & EPOLLOUT) {
        if (!socket_server_->flush_client(fd)) {
            drop_client(fd);
            return;
        }
    }

    update_client_events(fd);
}

void Daemon::update_client_events(int fd) {
    uint32_t events = EPOLLIN | EPOLLRDHUP | EPOLLHUP | EPOLLERR;
    if (socket_server_->client_wants_write(fd)) {
        events |= EPOLLOUT;
    }
    reactor_->modify(fd, events);
}

void Daemon::drop_client(int fd) {
    reactor_->remove(fd);
    socket_server_->remove_client(fd);
}

ipc::Message Daemon::handle_message(const ipc::Message& msg) {
    switch (msg.opcode) {
        case ipc::Opcode::NOOP:
            return ipc::Message(msg.client_id, ipc::Opcode::NOOP, msg.payload);

        case ipc::Opcode::INIT_ENV:
            return handle_init_env(msg);

        case ipc::Opcode::GET_AUDIT_LOG:
            return handle_get_audit_log(msg);

        case ipc::Opcode::SET_AUDIT_CONFIG:
            return handle_set_audit_config(msg);

        case ipc::Opcode::EXIT:
            spdlog::info("Client {} requested exit", msg.client_id);
            return ipc::Message(msg.client_id, ipc::Opcode::EXIT, "goodbye");

        default: {
            spdlog::warn("Client {} sent unknown opcode 0x{:02x}",
                msg.client_id, static_cast<unsigned>(msg.opcode));
            json response;
            response["success"] = false;
            response["error"] = "unknown operation";
            return ipc::Message(msg.client_id, msg.opcode, ipc::dump_payload(response));
        }
    }
}

// ============================================================================
// Provisioning
// ============================================================================

ipc::Message Daemon::handle_init_env(const ipc::Message& msg) {
    provision::ProvisionRequest request;
    std::string payload = msg.payload_str();

    if (!payload.empty()) {
        try {
            request = provision::request_from_json(json::parse(payload));
        } catch (const json::exception& e) {
            spdlog::warn("Client {} sent invalid INIT_ENV payload: {}", msg.client_id, e.what());

            provision::ProvisionResult invalid;
            invalid.error_kind = provision::ProvisionErrorKind::INVALID_REQUEST;
            invalid.error = std::string("invalid request: ") + e.what();

            json details;
            details["error"] = invalid.error;
            audit_logger_->log(AuditCategory::REQUEST, "INIT_ENV", msg.client_id, details, false);
            return ipc::Message(msg.client_id, ipc::Opcode::INIT_ENV,
                ipc::dump_payload(provision::result_to_json(invalid)));
        }
    }

    active_client_id_ = msg.client_id;
    provision::ProvisionResult result = provisioner_->provision(request, root_ctx_);
    active_client_id_ = 0;

    json details;
    details["image"] = result.image;
    if (result.success) {
        details["container_id"] = result.container_id;
    } else {
        details["error_kind"] = provision::provision_error_kind_to_string(result.error_kind);
        details["error"] = result.error;
    }
    audit_logger_->log(AuditCategory::REQUEST, "INIT_ENV", msg.client_id, details, result.success);

    return ipc::Message(msg.client_id, ipc::Opcode::INIT_ENV,
        ipc::dump_payload(provision::result_to_json(result)));
}

// ============================================================================
// Audit
// ============================================================================

ipc::Message Daemon::handle_get_audit_log(const ipc::Message& msg) {
    json request = json::object();
    std::string payload = msg.payload_str();
    if (!payload.empty()) {
        try {
            request = json::parse(payload);
        } catch (const json::exception& e) {
            spdlog::debug("Ignoring unparsable audit query: {}", e.what());
        }
    }
    if (!request.is_object()) {
        request = json::object();
    }

    json response;
    try {
        std::optional<AuditCategory> category;
        std::string category_str = request.value("category", "");
        if (!category_str.empty()) {
            category = audit_category_from_string(category_str);
            if (!category) {
                response["success"] = false;
                response["error"] = "unknown category: " + category_str;
                return ipc::Message(msg.client_id, ipc::Opcode::GET_AUDIT_LOG, ipc::dump_payload(response));
            }
        }

        std::optional<uint32_t> client_filter;
        uint32_t client_id = request.value("client_id", 0u);
        if (client_id > 0) {
            client_filter = client_id;
        }
        uint64_t since_id = request.value("since_id", static_cast<uint64_t>(0));
        size_t limit = request.value("limit", static_cast<size_t>(100));

        auto entries = audit_logger_->get_entries(category, client_filter, since_id, limit);

        response["success"] = true;
        response["count"] = entries.size();
        response["total"] = audit_logger_->entry_count();
        // Pass back as since_id to poll for newer entries
        response["last_id"] = audit_logger_->last_entry_id();
        response["entries"] = json::array();
        for (const auto& entry : entries) {
            response["entries"].push_back(entry.to_json());
        }
    } catch (const json::exception& e) {
        response = json::object();
        response["success"] = false;
        response["error"] = std::string("invalid request: ") + e.what();
    }
    return ipc::Message(msg.client_id, ipc::Opcode::GET_AUDIT_LOG, ipc::dump_payload(response));
}

ipc::Message Daemon::handle_set_audit_config(const ipc::Message& msg) {
    json response;
    try {
        json request = json::parse(msg.payload_str());
        if (!request.is_object()) {
            throw std::invalid_argument("payload must be an object");
        }

        AuditConfig config = audit_logger_->get_config();
        if (request.contains("max_entries")) {
            config.max_entries = request["max_entries"].get<size_t>();
        }
        if (request.contains("log_engine")) {
            config.log_engine = request["log_engine"].get<bool>();
        }
        if (request.contains("log_image")) {
            config.log_image = request["log_image"].get<bool>();
        }
        if (request.contains("log_container")) {
            config.log_container = request["log_container"].get<bool>();
        }
        if (request.contains("log_requests")) {
            config.log_requests = request["log_requests"].get<bool>();
        }
        audit_logger_->set_config(config);

        json details;
        details["new_config"] = request;
        audit_logger_->log(AuditCategory::REQUEST, "SET_AUDIT_CONFIG", msg.client_id, details, true);

        response["success"] = true;
        response["config"] = {
            {"max_entries", config.max_entries},
            {"log_engine", config.log_engine},
            {"log_image", config.log_image},
            {"log_container", config.log_container},
            {"log_requests", config.log_requests}
        };
    } catch (const std::exception& e) {
        response = json::object();
        response["success"] = false;
        response["error"] = std::string("invalid request: ") + e.what();
    }
    return ipc::Message(msg.client_id, ipc::Opcode::SET_AUDIT_CONFIG, ipc::dump_payload(response));
}

} // namespace dockbox::daemon
