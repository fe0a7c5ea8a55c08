/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade shared by every pipeline stage.
 */

#ifndef VETSCAN_LOGGER_HPP
#define VETSCAN_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace vetscan {

/**
 * @brief Global entry point for logging.
 *
 * Messages below the global threshold are dropped before any sink sees
 * them, so Debug messages from hot loops (per image, per page) cost a
 * single comparison when debugging is off.
 */
class Logger {
public:
    /**
     * @brief Install a sink. The Logger takes ownership.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all installed sinks.
     */
    static void clear_sinks();

    /**
     * @brief Set the global threshold. Default: LogLevel::Debug (everything
     * reaches the sinks, which may filter further).
     */
    static void set_min_level(LogLevel level);

    /**
     * @brief Log a message to all sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "vetscan").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "vetscan");

    static const char* level_to_string(LogLevel level);

    /**
     * @brief Parse a level name, case-insensitively. Accepts "WARN" and
     * "WARNING". Unknown names map to LogLevel::Error.
     */
    static LogLevel string_to_level(std::string_view level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
    static LogLevel min_level_;
};

} // namespace vetscan

#endif // VETSCAN_LOGGER_HPP
