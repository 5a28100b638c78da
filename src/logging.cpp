#include "megadl/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace megadl {

namespace {

constexpr const char* kLoggerName = "megadl";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S] [%^%l%$] %v";

std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& loggerSlot() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> buildLogger(spdlog::level::level_enum level,
                                            const std::optional<std::filesystem::path>& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (log_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
    }

    auto instance = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    instance->set_pattern(kPattern);
    instance->set_level(level);
    instance->flush_on(spdlog::level::warn);
    return instance;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(loggerMutex());
    auto& slot = loggerSlot();
    if (!slot) {
        slot = buildLogger(logLevelFromEnv().value_or(spdlog::level::info), std::nullopt);
    }
    return slot;
}

void configureLogging(spdlog::level::level_enum level,
                      const std::optional<std::filesystem::path>& log_file) {
    auto instance = buildLogger(level, log_file);
    std::lock_guard<std::mutex> lock(loggerMutex());
    loggerSlot() = std::move(instance);
}

std::optional<spdlog::level::level_enum> logLevelFromEnv() {
    const auto raw = envValue("MEGADL_LOG_LEVEL");
    if (!raw) {
        return std::nullopt;
    }

    std::string name = *raw;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

std::optional<std::string> envValue(const char* name) {
    const char* raw = name ? std::getenv(name) : nullptr;
    if (!raw || !*raw) {
        return std::nullopt;
    }
    return std::string(raw);
}

} // namespace megadl
