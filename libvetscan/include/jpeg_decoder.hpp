/**
 * @file jpeg_decoder.hpp
 * @brief Defines the IImageDecoder implementation for /DCTDecode images.
 */

#ifndef VETSCAN_JPEG_DECODER_HPP
#define VETSCAN_JPEG_DECODER_HPP

#include "image_decoder.hpp"
#include <array>
#include <span>
#include <string_view>

namespace vetscan {

    /**
     * @brief Implements IImageDecoder for JPEG streams using libjpeg.
     *
     * @details The stream is kept byte for byte; libjpeg only reads the
     * header to learn the real dimensions. No pixel is decoded.
     */
    class JpegDecoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "JpegDecoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_filters() const noexcept override {
            static constexpr std::array<std::string_view, 1> kFilters = { "/DCTDecode" };
            return {kFilters.data(), kFilters.size()};
        }

        /**
         * @brief Copy the raw JPEG stream and read its header.
         * @throws ImageDecodeError if libjpeg rejects the header.
         */
        DecodedImage decode(QPDFObjectHandle& image) const override;
    };

} // namespace vetscan

#endif // VETSCAN_JPEG_DECODER_HPP
