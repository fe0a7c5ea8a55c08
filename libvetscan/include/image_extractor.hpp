/**
 * @file image_extractor.hpp
 * @brief Finds the images a page draws, in drawing order.
 */

#ifndef VETSCAN_IMAGE_EXTRACTOR_HPP
#define VETSCAN_IMAGE_EXTRACTOR_HPP

#include "decoder_registry.hpp"
#include "image_types.hpp"
#include "pdf_document.hpp"
#include <cstddef>
#include <stop_token>
#include <string>
#include <vector>

namespace vetscan {

/**
 * @brief An image object that could not be decoded.
 */
struct SkippedImage {
    std::size_t index_on_page = 0;
    std::string reason;
};

/**
 * @brief Everything one page yielded.
 */
struct PageImages {
    std::size_t page_number = 0;
    std::vector<RawImageCandidate> candidates; ///< In content-stream order
    std::vector<SkippedImage> skipped;
};

/**
 * @brief Walks a page's content stream and decodes the image XObjects it
 * paints with `Do`, recursing into form XObjects.
 *
 * @details Every painted image gets the next index_on_page, whether or not
 * it survives, so indices stay stable across configurations. A malformed
 * image ends up in PageImages::skipped and the walk goes on. Images with a
 * pixel area below the configured minimum are dropped silently.
 *
 * extract_page() is const and opens its own QPDF instance, so pages may be
 * extracted concurrently from the same PdfDocument.
 */
class ImageExtractor {
public:
    ImageExtractor(const DecoderRegistry& registry, std::size_t min_image_area_px)
        : registry_(registry), min_image_area_px_(min_image_area_px) {}

    /**
     * @brief Extract the images of one page.
     * @param page_number 0-based page index.
     * @throws CancelledError if @p stop is triggered during the walk.
     * @throws std::out_of_range if the page does not exist.
     */
    [[nodiscard]] PageImages extract_page(const PdfDocument& document, std::size_t page_number,
                                          const std::stop_token& stop) const;

private:
    struct Walk;

    void walk(Walk& state, QPDFObjectHandle resources, const std::vector<std::string>& names) const;
    void take_image(Walk& state, QPDFObjectHandle image) const;

    const DecoderRegistry& registry_;
    std::size_t min_image_area_px_;
};

} // namespace vetscan

#endif // VETSCAN_IMAGE_EXTRACTOR_HPP
