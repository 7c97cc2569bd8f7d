#include "app/Log.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace {

struct Sinks {
    std::mutex mtx;
    LogLevel threshold = LogLevel::Info;
    bool console = true;
    bool fileEnabled = false;
    std::string filePath;
    std::size_t maxBytes = 0;
    int backups = 0;
    std::ofstream file;
};

Sinks& sinks() {
    static Sinks s;
    return s;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "INFO";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

// Caller holds s.mtx.
void rotate_if_needed(Sinks& s) {
    if (!s.file.is_open() || s.maxBytes == 0) return;
    if (static_cast<std::size_t>(s.file.tellp()) < s.maxBytes) return;

    namespace fs = std::filesystem;
    s.file.close();
    std::error_code ec;
    for (int i = s.backups - 1; i >= 1; --i) {
        fs::path from = s.filePath + "." + std::to_string(i);
        if (fs::exists(from, ec)) {
            fs::rename(from, s.filePath + "." + std::to_string(i + 1), ec);
        }
    }
    fs::rename(s.filePath, s.filePath + ".1", ec);
    s.file.open(s.filePath, std::ios::app);
}

}  // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "DEBUG") return LogLevel::Debug;
    if (name == "INFO") return LogLevel::Info;
    if (name == "WARNING") return LogLevel::Warning;
    if (name == "ERROR") return LogLevel::Error;
    if (name == "CRITICAL") return LogLevel::Critical;
    throw std::runtime_error("Unknown log level: " + name);
}

void configure_logging(const LoggingConfig& cfg) {
    auto& s = sinks();
    std::lock_guard<std::mutex> lk(s.mtx);
    s.threshold = parse_log_level(cfg.level);
    s.console = cfg.console_enabled;
    s.fileEnabled = cfg.file_enabled;
    s.filePath = cfg.file_path;
    s.maxBytes = cfg.max_file_size;
    s.backups = cfg.backup_count;

    if (s.file.is_open()) s.file.close();
    if (!s.fileEnabled) return;

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path parent = fs::path(s.filePath).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    s.file.open(s.filePath, std::ios::app);
    if (!s.file) {
        throw std::runtime_error("Failed to open log file " + s.filePath);
    }
}

bool log_enabled(LogLevel level) {
    auto& s = sinks();
    std::lock_guard<std::mutex> lk(s.mtx);
    return level >= s.threshold;
}

void write_log(LogLevel level, const std::string& tag, const std::string& message) {
    auto& s = sinks();
    const std::string line = timestamp() + " - " + tag + " - " + level_name(level) + " - " + message;

    std::lock_guard<std::mutex> lk(s.mtx);
    if (s.console) {
        if (level >= LogLevel::Warning) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
    }
    if (s.file.is_open()) {
        s.file << line << "\n";
        s.file.flush();
        rotate_if_needed(s);
    }
}
