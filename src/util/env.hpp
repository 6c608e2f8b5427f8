/**
 * Environment configuration helpers
 *
 * dockbox is configured through environment variables (DOCKER_HOST,
 * DOCKBOX_SOCKET, ...). A .env file next to the working directory or the
 * executable can supply defaults; variables already set always win.
 */
#pragma once
#include <string>
#include <optional>

namespace dockbox::util {

// Load KEY=VALUE pairs from the first .env file found (once per process)
void load_dotenv();

// Value of an environment variable, nullopt when unset
std::optional<std::string> get_env(const std::string& name);

// Value of an environment variable, or `fallback` when unset or empty
std::string get_env_or(const std::string& name, const std::string& fallback);

// "1", "true", "yes", "on" (any case) are true; anything else is false
bool get_env_flag(const std::string& name, bool fallback = false);

// Home directory of the current user, from the passwd entry then $HOME
std::optional<std::string> current_home_dir();

} // namespace dockbox::util
