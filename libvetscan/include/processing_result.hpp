#ifndef VETSCAN_PROCESSING_RESULT_HPP
#define VETSCAN_PROCESSING_RESULT_HPP

#include "field_parser.hpp"
#include "image_types.hpp"
#include "ocr_adapter.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace vetscan {

/**
 * @brief Everything extracted from one document.
 *
 * Built once, at the end of a successful run; a failed run produces an
 * exception instead, never a partial result.
 */
struct ProcessingResult {
    std::string document_id;
    std::string filename;
    std::size_t total_pages = 0;
    std::vector<ExtractedImage> images;   ///< In (page, position on page) order
    ReportInfo report_info;
    double processing_time_seconds = 0.0;
    std::vector<PageText> pages;          ///< Recognized text, pages 0..N-1
};

} // namespace vetscan

#endif // VETSCAN_PROCESSING_RESULT_HPP
