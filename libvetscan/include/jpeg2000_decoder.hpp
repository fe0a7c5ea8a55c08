/**
 * @file jpeg2000_decoder.hpp
 * @brief Defines the IImageDecoder implementation for /JPXDecode images.
 */

#ifndef VETSCAN_JPEG2000_DECODER_HPP
#define VETSCAN_JPEG2000_DECODER_HPP

#include "image_decoder.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace vetscan {

    /**
     * @brief Read width and height of a JPEG 2000 stream.
     *
     * Accepts a JP2 file (dimensions from the `ihdr` box, or from the
     * embedded codestream) or a bare codestream (`SIZ` marker segment).
     * @return (width, height), or std::nullopt if the bytes are neither.
     */
    [[nodiscard]] std::optional<std::pair<std::size_t, std::size_t>>
    read_jpx_dimensions(std::span<const std::uint8_t> bytes);

    /**
     * @brief Implements IImageDecoder for JPEG 2000 streams.
     *
     * @details The stream is kept byte for byte; only the container headers
     * are parsed.
     */
    class Jpeg2000Decoder final : public IImageDecoder {
    public:
        [[nodiscard]] std::string_view get_name() const noexcept override {
            return "Jpeg2000Decoder";
        }

        [[nodiscard]] std::span<const std::string_view> get_supported_filters() const noexcept override {
            static constexpr std::array<std::string_view, 1> kFilters = { "/JPXDecode" };
            return {kFilters.data(), kFilters.size()};
        }

        DecodedImage decode(QPDFObjectHandle& image) const override;
    };

} // namespace vetscan

#endif // VETSCAN_JPEG2000_DECODER_HPP
