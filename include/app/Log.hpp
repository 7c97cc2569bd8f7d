#pragma once
#include "app/Config.hpp"
#include <sstream>
#include <string>
#include <utility>

enum class LogLevel { Debug = 0, Info, Warning, Error, Critical };

// Throws std::runtime_error on an unknown level name.
LogLevel parse_log_level(const std::string& name);

/**
 * Process-wide log sinks. Lines look like
 *   2025-01-01 12:00:00 - Servo - INFO - Set servo base speed to 0.50
 *
 * Until configure() is called everything at INFO and above goes to the console.
 * Throws std::runtime_error if the log file cannot be opened.
 */
void configure_logging(const LoggingConfig& cfg);
void write_log(LogLevel level, const std::string& tag, const std::string& message);
bool log_enabled(LogLevel level);

// Collects one line and emits it on destruction: logInfo("Servo") << "Started";
class LogLine {
public:
    LogLine(LogLevel level, std::string tag) : level_(level), tag_(std::move(tag)) {}
    ~LogLine() {
        if (log_enabled(level_)) write_log(level_, tag_, ss_.str());
    }
    LogLine(const LogLine&) = delete;
    LogLine& operator=(const LogLine&) = delete;

    template <typename T>
    LogLine& operator<<(const T& value) {
        ss_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string tag_;
    std::ostringstream ss_;
};

inline LogLine logDebug(const std::string& tag) { return LogLine(LogLevel::Debug, tag); }
inline LogLine logInfo(const std::string& tag) { return LogLine(LogLevel::Info, tag); }
inline LogLine logWarn(const std::string& tag) { return LogLine(LogLevel::Warning, tag); }
inline LogLine logError(const std::string& tag) { return LogLine(LogLevel::Error, tag); }
inline LogLine logCritical(const std::string& tag) { return LogLine(LogLevel::Critical, tag); }
