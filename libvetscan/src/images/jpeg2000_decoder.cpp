#include "../../include/jpeg2000_decoder.hpp"
#include "../../include/errors.hpp"
#include <qpdf/Buffer.hh>
#include <algorithm>
#include <string>
#include <string_view>

namespace {

using Dimensions = std::pair<std::size_t, std::size_t>;

std::uint32_t be32(const std::span<const std::uint8_t> b, const std::size_t pos) {
    return (static_cast<std::uint32_t>(b[pos]) << 24) | (static_cast<std::uint32_t>(b[pos + 1]) << 16) |
           (static_cast<std::uint32_t>(b[pos + 2]) << 8) | static_cast<std::uint32_t>(b[pos + 3]);
}

std::uint64_t be64(const std::span<const std::uint8_t> b, const std::size_t pos) {
    return (static_cast<std::uint64_t>(be32(b, pos)) << 32) | be32(b, pos + 4);
}

bool box_type_is(const std::span<const std::uint8_t> b, const std::size_t pos, const std::string_view type) {
    return std::equal(type.begin(), type.end(), b.begin() + static_cast<std::ptrdiff_t>(pos),
                      [](const char a, const std::uint8_t c) { return static_cast<std::uint8_t>(a) == c; });
}

// SOC followed by SIZ: Lsiz Rsiz Xsiz Ysiz XOsiz YOsiz
std::optional<Dimensions> siz_dimensions(const std::span<const std::uint8_t> cs) {
    if (cs.size() < 24 || cs[0] != 0xFF || cs[1] != 0x4F || cs[2] != 0xFF || cs[3] != 0x51) {
        return std::nullopt;
    }
    const auto xsiz = be32(cs, 8);
    const auto ysiz = be32(cs, 12);
    const auto xosiz = be32(cs, 16);
    const auto yosiz = be32(cs, 20);
    if (xsiz <= xosiz || ysiz <= yosiz) return std::nullopt;
    return Dimensions{xsiz - xosiz, ysiz - yosiz};
}

std::optional<Dimensions> walk_boxes(const std::span<const std::uint8_t> b) {
    std::size_t pos = 0;
    while (pos + 8 <= b.size()) {
        std::uint64_t len = be32(b, pos);
        std::size_t header = 8;
        if (len == 1) {
            if (pos + 16 > b.size()) return std::nullopt;
            len = be64(b, pos + 8);
            header = 16;
        } else if (len == 0) {
            len = b.size() - pos;
        }
        if (len < header || len > b.size() - pos) return std::nullopt;

        const auto payload = b.subspan(pos + header, static_cast<std::size_t>(len) - header);
        if (box_type_is(b, pos + 4, "jp2h")) {
            if (auto dims = walk_boxes(payload)) return dims;
        } else if (box_type_is(b, pos + 4, "ihdr") && payload.size() >= 8) {
            const auto height = be32(payload, 0);
            const auto width = be32(payload, 4);
            if (width > 0 && height > 0) return Dimensions{width, height};
        } else if (box_type_is(b, pos + 4, "jp2c")) {
            return siz_dimensions(payload);
        }
        pos += static_cast<std::size_t>(len);
    }
    return std::nullopt;
}

} // namespace

namespace vetscan {

std::optional<std::pair<std::size_t, std::size_t>> read_jpx_dimensions(const std::span<const std::uint8_t> bytes) {
    // jp2 signature box: length 12, type "jP  "
    if (bytes.size() >= 12 && be32(bytes, 0) == 12 && box_type_is(bytes, 4, "jP  ")) {
        return walk_boxes(bytes);
    }
    return siz_dimensions(bytes);
}

DecodedImage Jpeg2000Decoder::decode(QPDFObjectHandle& image) const {
    std::shared_ptr<Buffer> raw;
    try {
        raw = image.getRawStreamData();
    } catch (const std::exception& e) {
        throw ImageDecodeError(std::string("cannot read JPX stream: ") + e.what());
    }
    if (!raw || raw->getSize() == 0) {
        throw ImageDecodeError("empty JPX stream");
    }

    const std::span<const std::uint8_t> bytes(raw->getBuffer(), raw->getSize());
    const auto dims = read_jpx_dimensions(bytes);
    if (!dims) {
        throw ImageDecodeError("JPX stream is neither a JP2 file nor a JPEG 2000 codestream");
    }

    DecodedImage out;
    out.width = dims->first;
    out.height = dims->second;
    out.format = ImageFormat::Jpeg2000;
    out.bytes.assign(bytes.begin(), bytes.end());
    return out;
}

} // namespace vetscan
