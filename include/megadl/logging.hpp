#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace megadl {

// Shared "megadl" logger writing colored, timestamped lines to stdout.
std::shared_ptr<spdlog::logger> logger();

// Rebuilds the shared logger; a log file, when given, receives every line too.
void configureLogging(spdlog::level::level_enum level,
                      const std::optional<std::filesystem::path>& log_file = std::nullopt);

// Level named by MEGADL_LOG_LEVEL, if set to something spdlog understands.
std::optional<spdlog::level::level_enum> logLevelFromEnv();

std::optional<std::string> envValue(const char* name);

} // namespace megadl
