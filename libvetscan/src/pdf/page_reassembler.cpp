#include "../../include/page_reassembler.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>

namespace vetscan {

ReassembledText::ReassembledText(std::vector<PageText> pages) : pages_(std::move(pages)) {
    for (std::size_t i = 0; i < pages_.size(); ++i) {
        if (i > 0 && !full_text_.empty() && full_text_.back() != '\n') {
            full_text_.push_back('\n');
        }
        full_text_ += pages_[i].text;
    }
}

void PageReassembler::ingest(const ChunkRange& chunk, const PageNumbering numbering, std::vector<PageText> pages) {
    const auto offset = PageOffset::for_chunk(chunk, numbering);
    pages_.reserve(pages_.size() + pages.size());
    for (auto& page : pages) {
        auto global = offset.apply(std::move(page));
        if (!chunk.contains(global.page_number)) {
            throw ReassemblyError("chunk " + chunk.to_string() + " returned page " +
                                  std::to_string(global.page_number) + " outside its range");
        }
        pages_.push_back(std::move(global));
    }
}

ReassembledText PageReassembler::finish() && {
    if (pages_.size() != page_count_) {
        throw ReassemblyError("expected " + std::to_string(page_count_) + " pages, OCR returned " +
                              std::to_string(pages_.size()));
    }

    std::ranges::sort(pages_, {}, &PageText::page_number);
    for (std::size_t i = 0; i < pages_.size(); ++i) {
        if (pages_[i].page_number == i) continue;
        if (i > 0 && pages_[i].page_number == pages_[i - 1].page_number) {
            throw ReassemblyError("duplicate page " + std::to_string(pages_[i].page_number));
        }
        throw ReassemblyError("missing page " + std::to_string(i));
    }

    Logger::log(LogLevel::Debug, "Reassembled " + std::to_string(pages_.size()) + " pages", "reassembler");
    return ReassembledText(std::move(pages_));
}

} // namespace vetscan
