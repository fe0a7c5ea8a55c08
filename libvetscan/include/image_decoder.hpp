/**
 * @file image_decoder.hpp
 * @brief Interface for turning a PDF image XObject into storable bytes.
 */

#ifndef VETSCAN_IMAGE_DECODER_HPP
#define VETSCAN_IMAGE_DECODER_HPP

#include "image_types.hpp"
#include <qpdf/QPDFObjectHandle.hh>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace vetscan {

/**
 * @brief What a decoder produces for one image XObject.
 */
struct DecodedImage {
    std::size_t width = 0;
    std::size_t height = 0;
    ImageFormat format = ImageFormat::Png;
    std::vector<std::uint8_t> bytes;
};

/**
 * @brief Interface for an image decoder.
 *
 * Each implementation handles the stream filters it advertises. Decoders are
 * stateless and shared by every extraction task; the image handle passed to
 * decode() belongs to the calling task's own QPDF instance.
 */
class IImageDecoder {
public:
    virtual ~IImageDecoder() = default;

    /// @return Human-readable name of the decoder (e.g. "JpegDecoder").
    [[nodiscard]] virtual std::string_view get_name() const noexcept = 0;

    /**
     * @return Stream filters this decoder takes as the sole filter
     * (e.g. "/DCTDecode"). An empty list marks the fallback decoder.
     */
    [[nodiscard]] virtual std::span<const std::string_view, std::dynamic_extent>
    get_supported_filters() const noexcept = 0;

    /**
     * @brief Decode one image XObject.
     * @param image Stream object whose /Subtype is /Image.
     * @throws ImageDecodeError if the object is malformed or unsupported.
     */
    virtual DecodedImage decode(QPDFObjectHandle& image) const = 0;
};

} // namespace vetscan

#endif // VETSCAN_IMAGE_DECODER_HPP
