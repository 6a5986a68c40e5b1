#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace interview_coach {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

// "[LEVEL] 2024-05-01 14:03:22.123: message"
std::string format_line(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << "[" << level_tag(level) << "] "
        << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << millis.count()
        << ": " << message;
    return oss.str();
}

std::mutex g_sink_mutex;

} // namespace

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file) : min_level_(min_level) {
        if (!output_file.empty()) {
            file_.open(output_file, std::ios::app);
            if (!file_.is_open()) {
                std::cerr << "Warning: cannot open log file " << output_file << ", logging to console only\n";
            }
        }
    }

    bool enabled(LogLevel level) const {
        return level >= min_level_.load();
    }

    void write(LogLevel level, const std::string& message) {
        if (!enabled(level)) return;
        std::string line = format_line(level, message);

        std::lock_guard<std::mutex> lock(write_mutex_);
        std::cerr << line << '\n';
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
        }
    }

    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_.load(); }

private:
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
    std::ofstream file_;
};

std::shared_ptr<Logger::Impl> Logger::sink_;

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::shared_ptr<Logger::Impl> Logger::sink() {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    return sink_;
}

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    auto fresh = std::make_shared<Impl>(min_level, output_file);
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    sink_ = std::move(fresh);
}

void Logger::shutdown() {
    std::shared_ptr<Impl> old;
    {
        std::lock_guard<std::mutex> lock(g_sink_mutex);
        old.swap(sink_);
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (auto current = sink()) {
        current->write(level, message);
    } else if (level >= LogLevel::WARN) {
        std::cerr << message << '\n';
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::set_level(LogLevel level) {
    if (auto current = sink()) {
        current->set_level(level);
    }
}

LogLevel Logger::get_level() {
    if (auto current = sink()) {
        return current->level();
    }
    return LogLevel::WARN;
}

bool Logger::enabled(LogLevel level) {
    if (auto current = sink()) {
        return current->enabled(level);
    }
    return level >= LogLevel::WARN;
}

} // namespace interview_coach
