#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <curl/curl.h>
#include "daemon/daemon.hpp"
#include "util/env.hpp"
#include "util/logger.hpp"

static void print_banner() {
    fmt::print(fmt::emphasis::bold | fg(fmt::terminal_color::cyan),
        "\n    dockbox  ·  sandbox container provisioner\n\n");
}

static void print_status_box(const dockbox::daemon::DaemonConfig& config) {
    auto row = [](const std::string& label, const std::string& value, fmt::terminal_color color) {
        fmt::print("    │  {:<12}", label);
        fmt::print(fg(color), "{:<44}", value);
        fmt::print("│\n");
    };

    fmt::print("    ┌──────────────────────────────────────────────────────────┐\n");
    row("Socket", config.socket_path, fmt::terminal_color::yellow);
    row("Image", config.provisioner.default_image, fmt::terminal_color::magenta);
    row("Docker", dockbox::util::get_env_or("DOCKER_HOST", "auto-detect"), fmt::terminal_color::green);
    fmt::print("    └──────────────────────────────────────────────────────────┘\n\n");
}

int main(int argc, char** argv) {
    dockbox::util::load_dotenv();
    dockbox::util::init_logger(dockbox::util::log_level_from_string(
        dockbox::util::get_env_or("DOCKBOX_LOG_LEVEL", "info")));

    dockbox::daemon::Daemon::Config config = dockbox::daemon::DaemonConfig::from_env();
    if (argc > 1) {
        config.socket_path = argv[1];
    }

    print_banner();
    print_status_box(config);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        spdlog::critical("Failed to initialize libcurl");
        return 1;
    }

    int status = 0;
    {
        dockbox::daemon::Daemon daemon(config);
        if (daemon.init()) {
            daemon.run();
        } else {
            fmt::print(fg(fmt::terminal_color::red), "\n    ✗  Failed to initialize daemon\n\n");
            status = 1;
        }
    }

    curl_global_cleanup();
    return status;
}
