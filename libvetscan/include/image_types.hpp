/**
 * @file image_types.hpp
 * @brief Value types flowing through image extraction, filtering and storage.
 */

#ifndef VETSCAN_IMAGE_TYPES_HPP
#define VETSCAN_IMAGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vetscan {

/**
 * @brief Encoding of the bytes we keep for an image.
 */
enum class ImageFormat {
    Jpeg,     ///< DCT stream copied as-is
    Jpeg2000, ///< JPX stream copied as-is
    Png       ///< Raw samples re-encoded with libpng
};

constexpr std::string_view mime_type(const ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg:     return "image/jpeg";
        case ImageFormat::Jpeg2000: return "image/jp2";
        case ImageFormat::Png:      return "image/png";
    }
    return "application/octet-stream";
}

/// @return File extension (without the dot) for a MIME type; "bin" if unknown.
constexpr std::string_view extension_for_mime(const std::string_view mime) noexcept {
    if (mime == "image/jpeg") return "jpg";
    if (mime == "image/jp2") return "jp2";
    if (mime == "image/png") return "png";
    return "bin";
}

/**
 * @brief An image found on a page, decoded far enough to know its size.
 */
struct RawImageCandidate {
    std::size_t page_number = 0;   ///< 0-based global page
    std::size_t index_on_page = 0; ///< Position in the page's content stream order
    std::size_t width = 0;
    std::size_t height = 0;
    ImageFormat format = ImageFormat::Png;
    std::vector<std::uint8_t> bytes;

    [[nodiscard]] std::size_t area() const noexcept { return width * height; }
};

/**
 * @brief Content fingerprint; equal signatures mean duplicate images.
 */
struct ImageSignature {
    std::uint32_t crc32 = 0;
    std::uint32_t adler32 = 0;
    std::size_t length = 0;

    auto operator<=>(const ImageSignature&) const = default;
};

/// @brief Fingerprint a byte sequence with zlib's CRC-32 and Adler-32.
[[nodiscard]] ImageSignature signature_of(std::span<const std::uint8_t> bytes);

/**
 * @brief An image that made it into the result.
 */
struct ExtractedImage {
    std::size_t page_number = 0;
    std::size_t index_on_page = 0;
    std::size_t width = 0;
    std::size_t height = 0;
    std::string mime_type;
    std::size_t byte_size = 0;
    std::string storage_reference;

    bool operator==(const ExtractedImage&) const = default;
};

} // namespace vetscan

#endif // VETSCAN_IMAGE_TYPES_HPP
