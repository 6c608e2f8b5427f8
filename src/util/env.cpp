#include "util/env.hpp"
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <climits>
#include <unistd.h>
#include <pwd.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <vector>

namespace dockbox::util {

// Trim whitespace from both ends
static std::string trim(const std::string& s, const char* ws = " \t\r\n") {
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

void load_dotenv() {
    static bool loaded = false;
    if (loaded) return;
    loaded = true;

    std::vector<std::filesystem::path> search_paths;
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        search_paths.push_back(cwd / ".env");
    }

    // Also check relative to executable
    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = std::filesystem::path(exe_path).parent_path();
        search_paths.push_back(exe_dir / ".env");
        search_paths.push_back(exe_dir.parent_path() / ".env");
    }

    for (const auto& env_path : search_paths) {
        if (!std::filesystem::exists(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);

            // Skip comments
            if (line.empty() || line[0] == '#') continue;

            size_t eq_pos = line.find('=');
            if (eq_pos == std::string::npos) continue;

            std::string key = trim(line.substr(0, eq_pos), " \t");
            std::string value = trim(line.substr(eq_pos + 1));

            // Remove surrounding quotes
            if (value.size() >= 2) {
                if ((value.front() == '"' && value.back() == '"') ||
                    (value.front() == '\'' && value.back() == '\'')) {
                    value = value.substr(1, value.size() - 2);
                }
            }

            // Only set if not already in environment
            if (!key.empty() && !value.empty() && std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
            }
        }
        spdlog::debug("Loaded environment from {}", env_path.string());
        break;
    }
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string get_env_or(const std::string& name, const std::string& fallback) {
    auto value = get_env(name);
    if (!value || value->empty()) {
        return fallback;
    }
    return *value;
}

bool get_env_flag(const std::string& name, bool fallback) {
    auto value = get_env(name);
    if (!value || value->empty()) {
        return fallback;
    }

    std::string lower = trim(*value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

std::optional<std::string> current_home_dir() {
    long bufsize = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufsize <= 0) {
        bufsize = 16384;
    }

    std::vector<char> buffer(static_cast<size_t>(bufsize));
    struct passwd pwd;
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 &&
        result != nullptr && result->pw_dir != nullptr && result->pw_dir[0] != '\0') {
        return std::string(result->pw_dir);
    }

    auto home = get_env("HOME");
    if (home && !home->empty()) {
        return home;
    }

    spdlog::debug("Could not determine home directory for uid {}", getuid());
    return std::nullopt;
}

} // namespace dockbox::util
