#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace dockbox::util {

// Install the colour console logger as spdlog's default
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

// Parse a level name ("debug", "warn", ...); unknown names give `fallback`
spdlog::level::level_enum log_level_from_string(const std::string& name,
                                                spdlog::level::level_enum fallback = spdlog::level::info);

} // namespace dockbox::util
