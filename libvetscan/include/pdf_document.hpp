/**
 * @file pdf_document.hpp
 * @brief Validated, immutable PDF input shared by every pipeline stage.
 */

#ifndef VETSCAN_PDF_DOCUMENT_HPP
#define VETSCAN_PDF_DOCUMENT_HPP

#include "chunk_planner.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace vetscan {

/**
 * @brief An input document that passed validation.
 *
 * @details Construction goes through load(), which rejects anything that
 * is not a parsable, non-empty PDF within the size limit. The bytes are held
 * by a shared immutable buffer, so copies of a PdfDocument are cheap and
 * concurrent tasks can read it without synchronization. qpdf objects are not
 * thread-safe; each task opens its own QpdfSession over these bytes.
 */
class PdfDocument {
public:
    /**
     * @brief Validate and adopt a document.
     * @param bytes Raw file content.
     * @param max_bytes Size limit.
     * @throws InvalidDocumentError for empty, oversized, non-PDF,
     * unparsable or page-less input.
     */
    static PdfDocument load(std::vector<std::uint8_t> bytes, std::size_t max_bytes);

    [[nodiscard]] std::size_t page_count() const noexcept { return page_count_; }
    [[nodiscard]] std::size_t byte_length() const noexcept { return bytes_->size(); }
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return *bytes_; }

    /**
     * @brief Copy a page range into a standalone PDF.
     *
     * Used to build the per-chunk payload of an OCR call. The output is
     * deterministic for identical input.
     *
     * @throws std::out_of_range if the range exceeds the document.
     * @throws std::runtime_error if qpdf fails to write the copy.
     */
    [[nodiscard]] std::vector<std::uint8_t> extract_pages(const ChunkRange& range) const;

private:
    PdfDocument(std::shared_ptr<const std::vector<std::uint8_t>> bytes, std::size_t page_count)
        : bytes_(std::move(bytes)), page_count_(page_count) {}

    std::shared_ptr<const std::vector<std::uint8_t>> bytes_;
    std::size_t page_count_ = 0;
};

} // namespace vetscan

#endif // VETSCAN_PDF_DOCUMENT_HPP
