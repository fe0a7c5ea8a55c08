#include "../../include/chunk_planner.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace vetscan {

ChunkPlan plan_chunks(const std::size_t page_count, const std::size_t max_pages_per_call) {
    if (max_pages_per_call == 0) {
        throw std::invalid_argument("max_pages_per_call must be positive");
    }
    if (page_count == 0) {
        throw InvalidDocumentError("document has no pages");
    }

    ChunkPlan plan;
    plan.reserve((page_count + max_pages_per_call - 1) / max_pages_per_call);
    for (std::size_t start = 0; start < page_count; start += max_pages_per_call) {
        plan.push_back({start, std::min(start + max_pages_per_call, page_count)});
    }

    Logger::log(LogLevel::Debug,
                std::to_string(page_count) + " pages -> " + std::to_string(plan.size()) + " chunk(s)",
                "chunk_planner");
    return plan;
}

} // namespace vetscan
