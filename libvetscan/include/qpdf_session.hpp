#ifndef VETSCAN_QPDF_SESSION_HPP
#define VETSCAN_QPDF_SESSION_HPP

#include "logger.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <cstdint>
#include <memory>
#include <ostream>
#include <span>
#include <sstream>
#include <string>

namespace vetscan {

/**
 * @brief streambuf that forwards complete lines to Logger.
 *
 * qpdf reports recoverable damage (broken xref, bad stream lengths) on its
 * warning stream; we keep those messages instead of printing them.
 */
class LoggerStreamBuf final : public std::stringbuf {
public:
    LoggerStreamBuf(const LogLevel level, std::string tag) : level_(level), tag_(std::move(tag)) {}
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }

protected:
    int sync() override {
        std::string s = str();
        std::size_t start = 0;
        while (start < s.size()) {
            auto end = s.find('\n', start);
            if (end == std::string::npos) end = s.size();
            if (end > start) Logger::log(level_, std::string_view(s).substr(start, end - start), tag_);
            start = end + 1;
        }
        str("");
        return 0;
    }

private:
    LogLevel level_;
    std::string tag_;
};

/**
 * @brief One QPDF instance with its logger plumbing.
 *
 * The streams are declared before the QPDF object so they outlive it.
 * Instances are not thread-safe; create one per task.
 */
class QpdfSession {
public:
    /// @brief Empty session, e.g. as the destination of page copies.
    explicit QpdfSession(const std::string& tag)
        : info_buf_(LogLevel::Debug, tag), warn_buf_(LogLevel::Warning, tag),
          info_os_(&info_buf_), warn_os_(&warn_buf_) {
        auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&info_os_, &warn_os_);
        pdf_.setLogger(qlogger);
    }

    /**
     * @brief Parse an in-memory document. The bytes must outlive the session.
     * @throws QPDFExc / std::runtime_error when qpdf cannot open the file.
     */
    QpdfSession(const std::span<const std::uint8_t> bytes, const char* description, const std::string& tag)
        : QpdfSession(tag) {
        pdf_.processMemoryFile(description,
                               reinterpret_cast<const char*>(bytes.data()),
                               bytes.size());
    }

    QpdfSession(const QpdfSession&) = delete;
    QpdfSession& operator=(const QpdfSession&) = delete;

    ~QpdfSession() {
        info_os_.flush();
        warn_os_.flush();
    }

    [[nodiscard]] QPDF& pdf() noexcept { return pdf_; }

private:
    LoggerStreamBuf info_buf_;
    LoggerStreamBuf warn_buf_;
    std::ostream info_os_;
    std::ostream warn_os_;
    QPDF pdf_;
};

} // namespace vetscan

#endif // VETSCAN_QPDF_SESSION_HPP
