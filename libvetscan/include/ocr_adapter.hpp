/**
 * @file ocr_adapter.hpp
 * @brief Boundary to the external OCR service.
 */

#ifndef VETSCAN_OCR_ADAPTER_HPP
#define VETSCAN_OCR_ADAPTER_HPP

#include "chunk_planner.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace vetscan {

/**
 * @brief Recognized text of one page.
 *
 * page_number is whatever the adapter reports until the reassembler has
 * applied the chunk offset; afterwards it is the 0-based global page.
 */
struct PageText {
    std::size_t page_number = 0;
    std::string text;

    bool operator==(const PageText&) const = default;
};

/**
 * @brief How an adapter numbers the pages it returns.
 */
enum class PageNumbering {
    ChunkLocal, ///< 0-based within the submitted chunk
    Absolute    ///< 0-based within the whole document
};

/**
 * @brief One OCR call.
 */
struct OcrRequest {
    std::span<const std::uint8_t> chunk_pdf; ///< Standalone PDF holding just the chunk's pages
    ChunkRange pages;                        ///< Where the chunk sits in the source document
    std::chrono::milliseconds timeout{0};    ///< Deadline for this call
};

/**
 * @brief Interface of an OCR backend.
 *
 * Implementations must be callable concurrently from several threads (one
 * call per chunk). They enforce request.timeout on their external call and
 * report it as OcrTransientError; other retryable failures also throw
 * OcrTransientError, permanent ones OcrFatalError. The stop token is
 * triggered when a sibling chunk failed or the caller cancelled.
 */
class IOcrAdapter {
public:
    virtual ~IOcrAdapter() = default;

    /// @return Human-readable name for logs (e.g. "pdftotext").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /// @return The numbering contract of extract_text()'s page numbers.
    [[nodiscard]] virtual PageNumbering numbering() const noexcept = 0;

    /**
     * @brief Recognize the text of every page of a chunk.
     * @return Pages in order, numbered according to numbering().
     */
    virtual std::vector<PageText> extract_text(const OcrRequest& request, std::stop_token stop) = 0;
};

} // namespace vetscan

#endif // VETSCAN_OCR_ADAPTER_HPP
