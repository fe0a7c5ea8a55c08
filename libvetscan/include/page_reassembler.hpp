/**
 * @file page_reassembler.hpp
 * @brief Merges per-chunk OCR output into one page-ordered text.
 */

#ifndef VETSCAN_PAGE_REASSEMBLER_HPP
#define VETSCAN_PAGE_REASSEMBLER_HPP

#include "chunk_planner.hpp"
#include "ocr_adapter.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace vetscan {

/**
 * @brief Translation from adapter page numbers to global page numbers.
 *
 * Derived once per chunk from the adapter's numbering contract and applied
 * once, at ingestion; nothing downstream ever sees a chunk-local number.
 */
class PageOffset {
public:
    static PageOffset for_chunk(const ChunkRange& chunk, PageNumbering numbering) noexcept {
        return PageOffset(numbering == PageNumbering::ChunkLocal ? chunk.start_page : 0);
    }

    [[nodiscard]] std::size_t value() const noexcept { return offset_; }

    [[nodiscard]] PageText apply(PageText page) const {
        page.page_number += offset_;
        return page;
    }

private:
    explicit PageOffset(const std::size_t offset) noexcept : offset_(offset) {}
    std::size_t offset_;
};

/**
 * @brief The validated result of reassembly: pages 0..N-1, in order.
 */
class ReassembledText {
public:
    ReassembledText() = default;
    explicit ReassembledText(std::vector<PageText> pages);

    [[nodiscard]] const std::vector<PageText>& pages() const noexcept { return pages_; }
    [[nodiscard]] std::size_t page_count() const noexcept { return pages_.size(); }

    /**
     * @brief All pages concatenated in page order, one newline between
     * pages (a page that already ends with a newline gets no second one).
     */
    [[nodiscard]] const std::string& full_text() const noexcept { return full_text_; }

private:
    std::vector<PageText> pages_;
    std::string full_text_;
};

/**
 * @brief Collects chunk results and validates them into a ReassembledText.
 *
 * Not thread-safe: chunk tasks return their pages and the orchestrator
 * ingests them after the join. Ingestion order is irrelevant.
 */
class PageReassembler {
public:
    /// @param page_count N, the page count of the source document.
    explicit PageReassembler(std::size_t page_count) : page_count_(page_count) {}

    /**
     * @brief Adopt the pages returned for one chunk.
     * @throws ReassemblyError if a page, once offset, lies outside the chunk
     * (an overlap with a neighbouring chunk).
     */
    void ingest(const ChunkRange& chunk, PageNumbering numbering, std::vector<PageText> pages);

    /**
     * @brief Validate and produce the page-ordered text.
     * @throws ReassemblyError if the page count differs from N, or if page
     * numbers are not exactly 0..N-1 (gap or duplicate).
     */
    [[nodiscard]] ReassembledText finish() &&;

private:
    std::size_t page_count_;
    std::vector<PageText> pages_;
};

} // namespace vetscan

#endif // VETSCAN_PAGE_REASSEMBLER_HPP
