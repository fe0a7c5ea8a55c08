#ifndef VETSCAN_LOG_SINK_HPP
#define VETSCAN_LOG_SINK_HPP

#include <string_view>

namespace vetscan {

/**
 * @brief Severity levels for log messages, ordered from least to most severe.
 */
enum class LogLevel {
    Debug,   ///< Per-object detail (skipped images, retries, chunk timings)
    Info,    ///< Pipeline progress for a document
    Warning, ///< Recovered problems (undecodable image, failed image write)
    Error,   ///< Failures that abort a document
    None     ///< Threshold value only: silences a sink
};

/**
 * @brief Destination for log messages.
 *
 * Implementations decide how messages are delivered (console, file,
 * observer bridge). Logger fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Deliver one message.
     * @param level Severity of the message.
     * @param message The message text.
     * @param tag Component that emitted it (e.g. "image_extractor").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace vetscan

#endif // VETSCAN_LOG_SINK_HPP
