#include "../../include/logger.hpp"
#include <algorithm>
#include <cctype>

namespace vetscan {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;
LogLevel Logger::min_level_ = LogLevel::Debug;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard lock(mtx_);
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::set_min_level(const LogLevel level) {
    std::lock_guard lock(mtx_);
    min_level_ = level;
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    std::lock_guard lock(mtx_);
    if (level < min_level_ || level == LogLevel::None) return;
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

const char* Logger::level_to_string(const LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::None:    return "NONE";
    }
    return "";
}

LogLevel Logger::string_to_level(const std::string_view level) {
    std::string upper(level);
    std::ranges::transform(upper, upper.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "NONE") return LogLevel::None;
    return LogLevel::Error;
}

} // namespace vetscan
