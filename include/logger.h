#pragma once

#include <memory>
#include <string>

namespace interview_coach {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse a level name ("debug", "info", "warn", "error"); unknown names map to INFO
 */
LogLevel parse_log_level(const std::string& name);

/**
 * @brief Process-wide logger
 *
 * Console output goes to stderr so it never interleaves with the interview
 * on stdout; an optional file sink receives the same lines. Workers that
 * outlive their caller (timed-out provider calls) may still log, including
 * across shutdown(): each call holds its own reference to the sink.
 */
class Logger {
public:
    /**
     * @brief Install the sink
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path, opened in append mode (empty = console only)
     *
     * Replaces any previous sink.
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "");

    /**
     * @brief Drop the sink; later messages go to stderr unformatted
     */
    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

    /// True if a message at this level would be written
    static bool enabled(LogLevel level);

private:
    class Impl;
    static std::shared_ptr<Impl> sink_;

    static std::shared_ptr<Impl> sink();
    static void log(LogLevel level, const std::string& message);
};

// Convenience macros
#define LOG_DEBUG(msg) interview_coach::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + (msg))
#define LOG_INFO(msg) interview_coach::Logger::info(msg)
#define LOG_WARN(msg) interview_coach::Logger::warn(msg)
#define LOG_ERROR(msg) interview_coach::Logger::error(msg)

// Per-agent logging
#define LOG_ROUTER(msg) interview_coach::Logger::debug(std::string("[Router] ") + (msg))
#define LOG_SKEPTIC(msg) interview_coach::Logger::debug(std::string("[Skeptic] ") + (msg))
#define LOG_EMPATH(msg) interview_coach::Logger::debug(std::string("[Empath] ") + (msg))
#define LOG_PLANNER(msg) interview_coach::Logger::info(std::string("[Planner] ") + (msg))
#define LOG_VOICE(msg) interview_coach::Logger::debug(std::string("[Voice] ") + (msg))
#define LOG_REPORTER(msg) interview_coach::Logger::info(std::string("[Reporter] ") + (msg))
#define LOG_LLM(msg) interview_coach::Logger::debug(std::string("[LLM] ") + (msg))
#define LOG_ENGINE(msg) interview_coach::Logger::info(std::string("[Engine] ") + (msg))

// Per-stage turn timing; the message is only built when DEBUG is on
#define LOG_TRACE(turn_id, stage, data) \
    do { \
        if (interview_coach::Logger::enabled(interview_coach::LogLevel::DEBUG)) { \
            interview_coach::Logger::debug(std::string("[trace] turn_id=") + std::to_string(turn_id) + \
                                           " stage=" + (stage) + " " + (data)); \
        } \
    } while (0)

} // namespace interview_coach
