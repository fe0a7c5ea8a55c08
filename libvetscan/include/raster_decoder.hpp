/**
 * @file raster_decoder.hpp
 * @brief Defines the fallback IImageDecoder: raw samples re-encoded as PNG.
 */

#ifndef VETSCAN_RASTER_DECODER_HPP
#define VETSCAN_RASTER_DECODER_HPP

#include "image_decoder.hpp"
#include <span>
#include <string_view>

namespace vetscan {

    /**
     * @brief Implements IImageDecoder for images qpdf can decode to samples.
     *
     * @details Covers /FlateDecode, /LZWDecode, /RunLengthDecode, the ASCII
     * filters and unfiltered streams. The samples are checked against
     * /Width, /Height, /BitsPerComponent and the colour space, then written
     * as PNG with libpng. PDF and PNG share the sample row layout (MSB
     * first, big-endian 16-bit), so rows go to libpng unchanged.
     *
     * Supported colour spaces: DeviceGray, CalGray, DeviceRGB, CalRGB,
     * ICCBased with N 1 or 3, and Indexed over any of those.
     */
    class RasterDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "RasterDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_filters() const noexcept override {
            return {};
        }

        /**
         * @brief Decode the samples and re-encode them as PNG.
         * @throws ImageDecodeError for unsupported filters or colour spaces,
         * inconsistent dictionaries and truncated sample data.
         */
        DecodedImage decode(QPDFObjectHandle& image) const override;
    };

} // namespace vetscan

#endif // VETSCAN_RASTER_DECODER_HPP
