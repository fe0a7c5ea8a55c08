/**
 * @file decoder_registry.hpp
 * @brief Registry selecting the IImageDecoder for an image XObject.
 */

#ifndef VETSCAN_DECODER_REGISTRY_HPP
#define VETSCAN_DECODER_REGISTRY_HPP

#include "image_decoder.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace vetscan {

/**
 * @brief Registry of all available image decoders.
 *
 * @details Owns the concrete decoders. Lookup is by the image stream's
 * filter: a stream with a single filter some decoder advertises goes to that
 * decoder; every other stream goes to the fallback (raw samples through qpdf).
 */
class DecoderRegistry {
public:
    /**
     * @brief Construct and register the built-in decoders
     * (JpegDecoder, Jpeg2000Decoder, RasterDecoder).
     */
    DecoderRegistry();

    /**
     * @brief Find the decoder advertising a filter.
     * @param filter Filter name including the slash (e.g. "/DCTDecode").
     * @return Non-owning pointer, or nullptr when no decoder claims it.
     */
    [[nodiscard]] const IImageDecoder* find_by_filter(std::string_view filter) const;

    /**
     * @brief Select the decoder for an image stream.
     *
     * Filter chains always go to the fallback, which lets qpdf undo the
     * whole chain (a DCT stage included) before re-encoding.
     */
    [[nodiscard]] const IImageDecoder& select(QPDFObjectHandle& image) const;

    /// @return All registered decoders.
    [[nodiscard]] const std::vector<std::unique_ptr<IImageDecoder>>& all() const { return decoders_; }

private:
    std::vector<std::unique_ptr<IImageDecoder>> decoders_;
    const IImageDecoder* fallback_ = nullptr;
};

} // namespace vetscan

#endif // VETSCAN_DECODER_REGISTRY_HPP
