#include "../../include/jpeg_decoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <cstdio>
#include <jpeglib.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

using vetscan::Logger;
using vetscan::LogLevel;

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 * @param cinfo Pointer to the libjpeg error context.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    throw std::runtime_error(err->msg);
}

/**
 * @brief libjpeg warning sink; corrupt-data warnings end up in the log.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX]{};
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + buffer, "libjpeg");
}

} // namespace

namespace vetscan {

DecodedImage JpegDecoder::decode(QPDFObjectHandle& image) const {
    std::shared_ptr<Buffer> raw;
    try {
        raw = image.getRawStreamData();
    } catch (const std::exception& e) {
        throw ImageDecodeError(std::string("cannot read DCT stream: ") + e.what());
    }
    if (!raw || raw->getSize() == 0) {
        throw ImageDecodeError("empty DCT stream");
    }

    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};

    // error handlers must be set before any possible error
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    DecodedImage out;
    try {
        jpeg_create_decompress(&cinfo);
        jpeg_mem_src(&cinfo, raw->getBuffer(), static_cast<unsigned long>(raw->getSize()));

        if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
            throw std::runtime_error("Invalid JPEG header");
        }
        out.width = cinfo.image_width;
        out.height = cinfo.image_height;
        jpeg_destroy_decompress(&cinfo);
    } catch (const std::exception& e) {
        jpeg_destroy_decompress(&cinfo);
        throw ImageDecodeError(std::string("JPEG header unreadable: ") + e.what());
    }

    auto dict = image.getDict();
    if (dict.getKey("/Width").isInteger() &&
        dict.getKey("/Width").getIntValue() != static_cast<long long>(out.width)) {
        Logger::log(LogLevel::Debug,
                    "/Width " + std::to_string(dict.getKey("/Width").getIntValue()) +
                    " differs from JPEG header " + std::to_string(out.width),
                    "jpeg_decoder");
    }

    out.format = ImageFormat::Jpeg;
    out.bytes.assign(raw->getBuffer(), raw->getBuffer() + raw->getSize());
    return out;
}

} // namespace vetscan
