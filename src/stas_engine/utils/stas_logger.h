/**
 * @file stas_logger.h
 * @brief Defines the logging framework for the nvme-stas engine.
 * @details This file provides a simple, thread-safe logging mechanism that queues log
 *          messages produced anywhere in the engine and allows them to be drained by a
 *          single consumer (see `LogPump`). It includes log levels, a log entry
 *          structure, and macros for easy logging.
 */
#ifndef STAS_LOGGER_H
#define STAS_LOGGER_H

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>

namespace nvmestas {
namespace engine {
namespace logging {

/**
 * @enum LogLevel
 * @brief Defines the severity levels for log messages.
 */
enum class LogLevel {
    DEBUG,   ///< Detailed information, typically of interest only when diagnosing problems.
    INFO,    ///< Confirmation that things are working as expected.
    WARNING, ///< An indication that something unexpected happened, or a potential problem.
    ERR      ///< A serious problem, preventing the program from performing a function.
};

/** @brief Global atomic variable to hold the current log level. */
extern std::atomic<LogLevel> current_log_level;

/**
 * @struct LogEntry
 * @brief Represents a single log message.
 */
struct LogEntry {
    LogLevel level;         ///< The severity level of the log message.
    std::string message;    ///< The log message content.
    std::string filename;   ///< The source file where the log was generated.
    int line_number;        ///< The line number in the source file.
};

/**
 * @brief Retrieves the currently buffered log entries.
 * @details Blocks until messages are available or a timeout occurs, then returns up
 *          to 100 entries and removes them from the queue.
 * @param timeout_ms The maximum time to wait in milliseconds.
 * @return A vector of `LogEntry` objects.
 */
std::vector<LogEntry> retrieve_log_entries(int timeout_ms = 100);

/**
 * @brief Signals the logger to prepare for shutdown.
 * @details This will unblock any threads waiting on `retrieve_log_entries`.
 */
void shutdown_stas_logger();

/**
 * @brief Re-arms the logger after `shutdown_stas_logger()` and drops any queued entries.
 */
void reset_stas_logger();

/**
 * @brief Sets the global log level.
 * @param level The new log level to set. Messages below this level will be ignored.
 */
void set_stas_log_level(LogLevel level);

/** @brief Returns the global log level. */
LogLevel get_stas_log_level();

/** @brief Returns the printable name of a level ("DEBUG", "INFO", "WARNING", "ERROR"). */
const char* log_level_name(LogLevel level);

/**
 * @brief Dispatches a log message to the internal queue.
 * @details This function handles printf-style formatting and captures file/line info.
 * @param level The log level.
 * @param file The source file name (`__FILE__`).
 * @param line The source line number (`__LINE__`).
 * @param format The printf-style format string.
 * @param ... Arguments for the format string.
 */
void log_message(LogLevel level, const char* file, int line, const char* format, ...)
    __attribute__((format(printf, 4, 5)));

/**
 * @brief Helper function to extract the base filename from a full path.
 * @param path The full path to the file.
 * @return A pointer to the base filename within the path string.
 */
const char* get_base_filename(const char* path);

} // namespace logging
} // namespace engine
} // namespace nvmestas

/**
 * @def LOG_STAS_BASE
 * @brief A base macro for logging. Not intended for direct use.
 */
#define LOG_STAS_BASE(level, fmt, ...) \
    nvmestas::engine::logging::log_message( \
        level, \
        nvmestas::engine::logging::get_base_filename(__FILE__), \
        __LINE__, \
        fmt, \
        ##__VA_ARGS__)

/** @def LOG_STAS_DEBUG(fmt, ...) @brief Logs a message at the DEBUG level. */
#define LOG_STAS_DEBUG(fmt, ...)   LOG_STAS_BASE(nvmestas::engine::logging::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
/** @def LOG_STAS_INFO(fmt, ...) @brief Logs a message at the INFO level. */
#define LOG_STAS_INFO(fmt, ...)    LOG_STAS_BASE(nvmestas::engine::logging::LogLevel::INFO, fmt, ##__VA_ARGS__)
/** @def LOG_STAS_WARNING(fmt, ...) @brief Logs a message at the WARNING level. */
#define LOG_STAS_WARNING(fmt, ...) LOG_STAS_BASE(nvmestas::engine::logging::LogLevel::WARNING, fmt, ##__VA_ARGS__)
/** @def LOG_STAS_ERROR(fmt, ...) @brief Logs a message at the ERROR level. */
#define LOG_STAS_ERROR(fmt, ...)   LOG_STAS_BASE(nvmestas::engine::logging::LogLevel::ERR, fmt, ##__VA_ARGS__)

#endif // STAS_LOGGER_H
