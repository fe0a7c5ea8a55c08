/**
 * @file image_filter.hpp
 * @brief Drops letterhead, logos, icons and strips from the extracted images.
 */

#ifndef VETSCAN_IMAGE_FILTER_HPP
#define VETSCAN_IMAGE_FILTER_HPP

#include "image_types.hpp"
#include "pipeline_config.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace vetscan {

/**
 * @brief Number of distinct pages on which an image must appear to count as
 * page furniture: max(min_repeated_pages, floor(total_pages * fraction)).
 *
 * For the defaults (2, 0.3): documents up to 9 pages use 2, 10 pages use 3,
 * 20 pages use 6.
 */
[[nodiscard]] std::size_t repetition_threshold(std::size_t total_pages, const ImageFilterConfig& config);

/**
 * @brief Geometry check for a single image.
 * @return Why the image is rejected, or std::nullopt if it passes.
 */
[[nodiscard]] std::optional<std::string> geometry_rejection(const RawImageCandidate& image,
                                                            const ImageFilterConfig& config);

/**
 * @brief Apply the repetition filter, then the geometry filter.
 *
 * Candidates are grouped by ImageSignature. A group present on at least
 * repetition_threshold() distinct pages is dropped entirely; any other group
 * keeps only its first occurrence. Survivors then go through
 * geometry_rejection().
 *
 * @param candidates All candidates of the document; order does not matter.
 * @param total_pages Page count of the document.
 * @return Survivors sorted by (page_number, index_on_page).
 */
[[nodiscard]] std::vector<RawImageCandidate> filter_images(std::vector<RawImageCandidate> candidates,
                                                           std::size_t total_pages,
                                                           const ImageFilterConfig& config);

} // namespace vetscan

#endif // VETSCAN_IMAGE_FILTER_HPP
