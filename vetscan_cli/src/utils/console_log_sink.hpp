#ifndef VETSCAN_CONSOLE_LOG_SINK_HPP
#define VETSCAN_CONSOLE_LOG_SINK_HPP

#include "../../../libvetscan/include/log_sink.hpp"
#include "../../../libvetscan/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>
#include <string>

class ConsoleLogSink final : public vetscan::ILogSink {
public:
    vetscan::LogLevel log_level = vetscan::LogLevel::Error;

    void log(const vetscan::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level || log_level == vetscan::LogLevel::None) return;

        const char* color = level >= vetscan::LogLevel::Error   ? RED
                          : level == vetscan::LogLevel::Warning ? YELLOW
                          : level == vetscan::LogLevel::Debug   ? GRAY
                                                                : RESET;
        std::lock_guard lock(mtx_);
        std::cerr << color << "[" << vetscan::Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message << RESET << "\n";
    }

private:
    std::mutex mtx_;
};

#endif // VETSCAN_CONSOLE_LOG_SINK_HPP
