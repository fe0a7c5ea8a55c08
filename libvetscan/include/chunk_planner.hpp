#ifndef VETSCAN_CHUNK_PLANNER_HPP
#define VETSCAN_CHUNK_PLANNER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace vetscan {

/**
 * @brief Half-open page range `[start_page, end_page)` sent as one OCR call.
 */
struct ChunkRange {
    std::size_t start_page = 0;
    std::size_t end_page = 0;

    [[nodiscard]] std::size_t size() const noexcept { return end_page - start_page; }
    [[nodiscard]] bool contains(const std::size_t page) const noexcept {
        return page >= start_page && page < end_page;
    }
    [[nodiscard]] std::string to_string() const {
        return "[" + std::to_string(start_page) + "," + std::to_string(end_page) + ")";
    }

    bool operator==(const ChunkRange&) const = default;
};

using ChunkPlan = std::vector<ChunkRange>;

/**
 * @brief Partition `[0, page_count)` into contiguous chunks of at most
 * `max_pages_per_call` pages; only the last chunk may be shorter.
 *
 * A document that fits in one call goes through the same loop and yields a
 * single chunk `[0, page_count)`.
 *
 * @throws InvalidDocumentError if page_count is 0.
 * @throws std::invalid_argument if max_pages_per_call is 0.
 */
ChunkPlan plan_chunks(std::size_t page_count, std::size_t max_pages_per_call);

} // namespace vetscan

#endif // VETSCAN_CHUNK_PLANNER_HPP
