#include "../../include/decoder_registry.hpp"
#include "../../include/jpeg2000_decoder.hpp"
#include "../../include/jpeg_decoder.hpp"
#include "../../include/raster_decoder.hpp"
#include <string>

namespace vetscan {

DecoderRegistry::DecoderRegistry() {
    decoders_.push_back(std::make_unique<JpegDecoder>());
    decoders_.push_back(std::make_unique<Jpeg2000Decoder>());
    decoders_.push_back(std::make_unique<RasterDecoder>());

    for (const auto& dec_ptr : decoders_) {
        if (dec_ptr->get_supported_filters().empty()) {
            fallback_ = dec_ptr.get();
        }
    }
}

const IImageDecoder* DecoderRegistry::find_by_filter(const std::string_view filter) const {
    for (const auto& dec_ptr : decoders_) {
        for (const auto supported : dec_ptr->get_supported_filters()) {
            if (supported == filter) {
                return dec_ptr.get();
            }
        }
    }
    return nullptr;
}

const IImageDecoder& DecoderRegistry::select(QPDFObjectHandle& image) const {
    auto filter = image.getDict().getKey("/Filter");
    std::string sole;
    if (filter.isName()) {
        sole = filter.getName();
    } else if (filter.isArray() && filter.getArrayNItems() == 1 && filter.getArrayItem(0).isName()) {
        sole = filter.getArrayItem(0).getName();
    }
    if (!sole.empty()) {
        if (const auto* dec = find_by_filter(sole)) return *dec;
    }
    return *fallback_;
}

} // namespace vetscan
