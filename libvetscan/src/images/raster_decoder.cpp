#include "../../include/raster_decoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <png.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using vetscan::ImageDecodeError;
using vetscan::Logger;
using vetscan::LogLevel;

/**
 * @brief libpng error handler that throws a C++ exception.
 */
void png_error_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
    throw std::runtime_error(msg);
}

void png_warning_fn(png_structp, const png_const_charp msg) {
    Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
}

void png_write_to_vector(const png_structp png, const png_bytep data, const png_size_t length) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
    out->insert(out->end(), data, data + length);
}

void png_flush_noop(png_structp) {}

/**
 * @brief RAII wrapper for libpng write structs (png_structp, png_infop).
 */
struct PngWrite {
    png_structp png = nullptr;
    png_infop info = nullptr;

    explicit PngWrite() = default;

    ~PngWrite() {
        if (png || info) png_destroy_write_struct(&png, &info);
    }
};

/**
 * @brief Resolved image colour space.
 */
struct ColourSpace {
    int components = 0;              ///< Samples per pixel in the stream
    std::vector<png_color> palette;  ///< Non-empty for /Indexed
};

int base_components(QPDFObjectHandle cs) {
    if (cs.isName()) {
        const auto name = cs.getName();
        if (name == "/DeviceGray" || name == "/CalGray") return 1;
        if (name == "/DeviceRGB" || name == "/CalRGB") return 3;
        throw ImageDecodeError("unsupported colour space " + name);
    }
    if (cs.isArray() && cs.getArrayNItems() >= 1 && cs.getArrayItem(0).isName()) {
        const auto family = cs.getArrayItem(0).getName();
        if (family == "/CalGray") return 1;
        if (family == "/CalRGB") return 3;
        if (family == "/ICCBased" && cs.getArrayNItems() >= 2 && cs.getArrayItem(1).isStream()) {
            auto n = cs.getArrayItem(1).getDict().getKey("/N");
            if (n.isInteger() && (n.getIntValue() == 1 || n.getIntValue() == 3)) {
                return static_cast<int>(n.getIntValue());
            }
            throw ImageDecodeError("unsupported ICCBased component count");
        }
        throw ImageDecodeError("unsupported colour space " + family);
    }
    throw ImageDecodeError("malformed /ColorSpace");
}

std::string lookup_bytes(QPDFObjectHandle lookup) {
    if (lookup.isString()) return lookup.getStringValue();
    if (lookup.isStream()) {
        try {
            const auto buf = lookup.getStreamData(qpdf_dl_generalized);
            return {reinterpret_cast<const char*>(buf->getBuffer()), buf->getSize()};
        } catch (const std::exception& e) {
            throw ImageDecodeError(std::string("cannot read /Indexed lookup stream: ") + e.what());
        }
    }
    throw ImageDecodeError("malformed /Indexed lookup table");
}

ColourSpace resolve_colour_space(QPDFObjectHandle cs) {
    ColourSpace out;
    if (cs.isArray() && cs.getArrayNItems() == 4 && cs.getArrayItem(0).isName() &&
        cs.getArrayItem(0).getName() == "/Indexed") {
        const int base = base_components(cs.getArrayItem(1));
        auto hival = cs.getArrayItem(2);
        if (!hival.isInteger() || hival.getIntValue() < 0 || hival.getIntValue() > 255) {
            throw ImageDecodeError("invalid /Indexed hival");
        }
        const auto entries = static_cast<std::size_t>(hival.getIntValue()) + 1;
        const auto table = lookup_bytes(cs.getArrayItem(3));
        if (table.size() < entries * static_cast<std::size_t>(base)) {
            throw ImageDecodeError("/Indexed lookup table is truncated");
        }
        out.palette.resize(entries);
        for (std::size_t i = 0; i < entries; ++i) {
            const auto* p = reinterpret_cast<const png_byte*>(table.data()) + i * static_cast<std::size_t>(base);
            out.palette[i] = base == 1 ? png_color{p[0], p[0], p[0]} : png_color{p[0], p[1], p[2]};
        }
        out.components = 1;
        return out;
    }
    out.components = base_components(cs);
    return out;
}

std::size_t positive_int(QPDFObjectHandle dict, const std::string& key) {
    auto value = dict.getKey(key);
    if (!value.isInteger() || value.getIntValue() <= 0) {
        throw ImageDecodeError("missing or invalid " + key);
    }
    return static_cast<std::size_t>(value.getIntValue());
}

/**
 * @brief Encode packed sample rows as PNG into memory.
 */
std::vector<std::uint8_t> encode_png(const std::uint8_t* samples, const std::size_t row_bytes,
                                     const png_uint_32 width, const png_uint_32 height,
                                     const int bit_depth, const int color_type,
                                     const std::vector<png_color>& palette) {
    std::vector<std::uint8_t> out;

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw std::runtime_error("png_create_info_struct failed");

    png_set_write_fn(wr.png, &out, png_write_to_vector, png_flush_noop);
    png_set_IHDR(wr.png, wr.info, width, height, bit_depth, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        png_set_PLTE(wr.png, wr.info, palette.data(), static_cast<int>(palette.size()));
    }

    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        // libpng only reads through these
        rows[y] = const_cast<png_bytep>(samples + static_cast<std::size_t>(y) * row_bytes);
    }

    png_write_info(wr.png, wr.info);
    png_write_image(wr.png, rows.data());
    png_write_end(wr.png, nullptr);
    return out;
}

} // namespace

namespace vetscan {

DecodedImage RasterDecoder::decode(QPDFObjectHandle& image) const {
    auto dict = image.getDict();
    if (dict.getKey("/ImageMask").isBool() && dict.getKey("/ImageMask").getBoolValue()) {
        throw ImageDecodeError("stencil masks are not extracted");
    }

    const std::size_t width = positive_int(dict, "/Width");
    const std::size_t height = positive_int(dict, "/Height");
    const auto cs = resolve_colour_space(dict.getKey("/ColorSpace"));

    std::shared_ptr<Buffer> data;
    try {
        // qpdf_dl_all also undoes a DCT stage inside a filter chain
        data = image.getStreamData(qpdf_dl_all);
    } catch (const std::exception& e) {
        throw ImageDecodeError(std::string("cannot decode image samples: ") + e.what());
    }

    // a DCT stage always yields 8-bit samples
    auto filter = dict.getKey("/Filter");
    bool dct = false;
    if (filter.isArray()) {
        for (auto f : filter.getArrayAsVector()) {
            if (f.isName() && f.getName() == "/DCTDecode") dct = true;
        }
    }
    const std::size_t bpc = dct ? 8 : positive_int(dict, "/BitsPerComponent");

    int color_type = 0;
    if (!cs.palette.empty()) {
        if (bpc != 1 && bpc != 2 && bpc != 4 && bpc != 8) {
            throw ImageDecodeError("unsupported bit depth " + std::to_string(bpc) + " for indexed image");
        }
        color_type = PNG_COLOR_TYPE_PALETTE;
    } else if (cs.components == 1) {
        if (bpc != 1 && bpc != 2 && bpc != 4 && bpc != 8 && bpc != 16) {
            throw ImageDecodeError("unsupported bit depth " + std::to_string(bpc) + " for gray image");
        }
        color_type = PNG_COLOR_TYPE_GRAY;
    } else {
        if (bpc != 8 && bpc != 16) {
            throw ImageDecodeError("unsupported bit depth " + std::to_string(bpc) + " for RGB image");
        }
        color_type = PNG_COLOR_TYPE_RGB;
    }

    const std::size_t row_bytes = (width * static_cast<std::size_t>(cs.components) * bpc + 7) / 8;
    if (data->getSize() < row_bytes * height) {
        throw ImageDecodeError("image data truncated: " + std::to_string(data->getSize()) + " of " +
                               std::to_string(row_bytes * height) + " bytes");
    }

    DecodedImage out;
    out.width = width;
    out.height = height;
    out.format = ImageFormat::Png;
    try {
        out.bytes = encode_png(data->getBuffer(), row_bytes,
                               static_cast<png_uint_32>(width), static_cast<png_uint_32>(height),
                               static_cast<int>(bpc), color_type, cs.palette);
    } catch (const std::exception& e) {
        throw ImageDecodeError(std::string("PNG encoding failed: ") + e.what());
    }
    return out;
}

} // namespace vetscan
