#include "../../include/pipeline_config.hpp"
#include <stdexcept>

namespace vetscan {

void PipelineConfig::validate() const {
    if (max_pages_per_call == 0) {
        throw std::invalid_argument("max_pages_per_call must be positive");
    }
    if (!(ocr_timeout_seconds > 0.0)) {
        throw std::invalid_argument("ocr_timeout_seconds must be positive");
    }
    if (max_document_bytes == 0) {
        throw std::invalid_argument("max_document_bytes must be positive");
    }
    const auto& f = image_filter;
    if (!(f.max_image_repetition_fraction > 0.0 && f.max_image_repetition_fraction <= 1.0)) {
        throw std::invalid_argument("max_image_repetition_fraction must be in (0, 1]");
    }
    if (f.min_repeated_pages < 2) {
        // one page is every unique image
        throw std::invalid_argument("min_repeated_pages must be at least 2");
    }
    if (!(f.max_aspect_ratio >= 1.0)) {
        throw std::invalid_argument("max_aspect_ratio must be >= 1");
    }
    if (!(f.icon_square_tolerance >= 1.0)) {
        throw std::invalid_argument("icon_square_tolerance must be >= 1");
    }
}

} // namespace vetscan
