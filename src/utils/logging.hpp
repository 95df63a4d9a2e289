#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace sandbar::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(std::string_view text);

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
LogLevel MinLogLevel();
bool ShouldLog(LogLevel level);

// Writes "[tag] message" to stderr; warnings and errors carry their level.
void Log(LogLevel level, std::string_view tag, const std::string& message);

// Usage: LogLine(LogLevel::kInfo, "runner") << "started " << id;
class LogLine {
public:
    LogLine(LogLevel level, std::string_view tag) : level_(level), tag_(tag) {}
    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;
    ~LogLine() {
        if (ShouldLog(level_)) {
            Log(level_, tag_, stream_.str());
        }
    }

    template <typename T>
    LogLine& operator<<(const T& value) {
        if (ShouldLog(level_)) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    std::string_view tag_;
    std::ostringstream stream_;
};

}  // namespace sandbar::utils
