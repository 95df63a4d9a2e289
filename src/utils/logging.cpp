#include "utils/logging.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include "utils/common.hpp"

namespace sandbar::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_log_mutex;

}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    const auto lowered = ToLower(text);
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(static_cast<int>(config.min_level));
}

LogLevel MinLogLevel() {
    return static_cast<LogLevel>(g_min_level.load());
}

bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= g_min_level.load();
}

void Log(LogLevel level, std::string_view tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << tag << "] ";
    if (level == LogLevel::kWarn || level == LogLevel::kError) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace sandbar::utils
