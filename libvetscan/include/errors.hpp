/**
 * @file errors.hpp
 * @brief Exception taxonomy of the document pipeline.
 */

#ifndef VETSCAN_ERRORS_HPP
#define VETSCAN_ERRORS_HPP

#include "pipeline_state.hpp"
#include <stdexcept>
#include <string>
#include <string_view>

namespace vetscan {

/**
 * @brief Category of a ProcessingError.
 */
enum class ErrorKind {
    InvalidDocument, ///< Bad signature, wrong type, zero pages, oversized, unparsable
    OcrTransient,    ///< Timeout or transient OCR failure; retryable
    OcrFatal,        ///< OCR failed for good (retries exhausted or non-retryable)
    Reassembly,      ///< OCR pages have gaps, overlaps or duplicates
    ImageDecode,     ///< One embedded image could not be decoded
    StorageWrite,    ///< One image could not be written to the image store
    Cancelled        ///< Processing was stopped by the caller
};

constexpr std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidDocument: return "InvalidDocumentError";
        case ErrorKind::OcrTransient:    return "OCRTransientError";
        case ErrorKind::OcrFatal:        return "OCRFatalError";
        case ErrorKind::Reassembly:      return "ReassemblyError";
        case ErrorKind::ImageDecode:     return "ImageDecodeError";
        case ErrorKind::StorageWrite:    return "StorageWriteError";
        case ErrorKind::Cancelled:       return "CancelledError";
    }
    return "ProcessingError";
}

/**
 * @brief Base class of every error raised by the pipeline.
 *
 * The orchestrator stamps the state it had reached when the error escaped
 * (see DocumentPipeline::process); errors raised below the orchestrator
 * carry PipelineState::Received until then.
 */
class ProcessingError : public std::runtime_error {
public:
    ProcessingError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] PipelineState state() const noexcept { return state_; }
    void set_state(const PipelineState state) noexcept { state_ = state; }

private:
    ErrorKind kind_;
    PipelineState state_{PipelineState::Received};
};

class InvalidDocumentError final : public ProcessingError {
public:
    explicit InvalidDocumentError(const std::string& message)
        : ProcessingError(ErrorKind::InvalidDocument, message) {}
};

class OcrTransientError final : public ProcessingError {
public:
    explicit OcrTransientError(const std::string& message)
        : ProcessingError(ErrorKind::OcrTransient, message) {}
};

class OcrFatalError final : public ProcessingError {
public:
    explicit OcrFatalError(const std::string& message)
        : ProcessingError(ErrorKind::OcrFatal, message) {}
};

class ReassemblyError final : public ProcessingError {
public:
    explicit ReassemblyError(const std::string& message)
        : ProcessingError(ErrorKind::Reassembly, message) {}
};

class ImageDecodeError final : public ProcessingError {
public:
    explicit ImageDecodeError(const std::string& message)
        : ProcessingError(ErrorKind::ImageDecode, message) {}
};

class StorageWriteError final : public ProcessingError {
public:
    explicit StorageWriteError(const std::string& message)
        : ProcessingError(ErrorKind::StorageWrite, message) {}
};

class CancelledError final : public ProcessingError {
public:
    explicit CancelledError(const std::string& message = "processing cancelled")
        : ProcessingError(ErrorKind::Cancelled, message) {}
};

} // namespace vetscan

#endif // VETSCAN_ERRORS_HPP
