/**
 * @file pipeline_config.hpp
 * @brief Tunables of the document pipeline.
 */

#ifndef VETSCAN_PIPELINE_CONFIG_HPP
#define VETSCAN_PIPELINE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <string_view>

namespace vetscan {

/**
 * @brief What to do when the image store rejects one image.
 */
enum class StorageFailurePolicy {
    SkipImage,   ///< Drop that image, keep processing the document
    FailDocument ///< Abort the document with StorageWriteError
};

constexpr std::string_view to_string(const StorageFailurePolicy p) noexcept {
    return p == StorageFailurePolicy::SkipImage ? "skip" : "fail";
}

/**
 * @brief Thresholds of the image noise filter.
 *
 * Veterinary report templates differ in logo placement and size, so none of
 * these are constants. The repetition defaults come from calibration against
 * letterhead-heavy radiology reports: an image present on 30% of the pages
 * (and on at least two) is treated as template decoration.
 */
struct ImageFilterConfig {
    double max_image_repetition_fraction = 0.3;
    std::size_t min_repeated_pages = 2;

    std::size_t min_image_width = 400;
    std::size_t min_image_height = 300;
    std::size_t min_image_bytes = 20 * 1024;

    double max_aspect_ratio = 8.0;      ///< Longer/shorter side; above it the image is a strip
    double icon_square_tolerance = 1.15;///< Ratio up to which an image counts as square
    std::size_t icon_max_side = 256;    ///< Square images up to this side are icons
};

/**
 * @brief Options recognized by DocumentPipeline::process().
 */
struct PipelineConfig {
    std::size_t max_pages_per_call = 15;
    std::size_t min_image_area_px = 10000;
    unsigned ocr_retry_limit = 2;
    double ocr_timeout_seconds = 120.0;
    unsigned ocr_retry_backoff_ms = 500;
    std::size_t max_document_bytes = 20 * 1024 * 1024;
    StorageFailurePolicy storage_failure_policy = StorageFailurePolicy::SkipImage;
    ImageFilterConfig image_filter;

    /// @return The per-call OCR timeout.
    [[nodiscard]] std::chrono::milliseconds ocr_timeout() const {
        return std::chrono::milliseconds(static_cast<long long>(ocr_timeout_seconds * 1000.0));
    }

    /**
     * @brief Check the option values.
     * @throws std::invalid_argument naming the first offending option.
     */
    void validate() const;
};

} // namespace vetscan

#endif // VETSCAN_PIPELINE_CONFIG_HPP
