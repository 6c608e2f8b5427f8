#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace dockbox::util {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("dockbox");
    if (!console) {
        console = spdlog::stdout_color_mt("dockbox");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

spdlog::level::level_enum log_level_from_string(const std::string& name,
                                                spdlog::level::level_enum fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warning") lower = "warn";

    // spdlog maps unknown names to "off", which is never what a typo means here
    auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        return fallback;
    }
    return level;
}

} // namespace dockbox::util
