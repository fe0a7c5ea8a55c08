#include "../../include/image_filter.hpp"
#include "../../include/logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace vetscan {

ImageSignature signature_of(const std::span<const std::uint8_t> bytes) {
    ImageSignature sig;
    sig.length = bytes.size();

    // zlib takes uInt lengths; feed large buffers in slices
    uLong crc = crc32(0L, Z_NULL, 0);
    uLong adler = adler32(0L, Z_NULL, 0);
    constexpr std::size_t kSlice = 1u << 30;
    for (std::size_t pos = 0; pos < bytes.size(); pos += kSlice) {
        const auto len = static_cast<uInt>(std::min(kSlice, bytes.size() - pos));
        crc = crc32(crc, bytes.data() + pos, len);
        adler = adler32(adler, bytes.data() + pos, len);
    }
    sig.crc32 = static_cast<std::uint32_t>(crc);
    sig.adler32 = static_cast<std::uint32_t>(adler);
    return sig;
}

std::size_t repetition_threshold(const std::size_t total_pages, const ImageFilterConfig& config) {
    const auto scaled = static_cast<std::size_t>(
        std::floor(static_cast<double>(total_pages) * config.max_image_repetition_fraction));
    return std::max(config.min_repeated_pages, scaled);
}

std::optional<std::string> geometry_rejection(const RawImageCandidate& image, const ImageFilterConfig& config) {
    if (image.width < config.min_image_width || image.height < config.min_image_height) {
        return "too small (" + std::to_string(image.width) + "x" + std::to_string(image.height) + ")";
    }
    if (image.bytes.size() < config.min_image_bytes) {
        return "file too small (" + std::to_string(image.bytes.size()) + " bytes)";
    }

    const auto long_side = static_cast<double>(std::max(image.width, image.height));
    const auto short_side = static_cast<double>(std::min(image.width, image.height));
    const double ratio = long_side / short_side;
    if (ratio > config.max_aspect_ratio) {
        return "strip (aspect ratio " + std::to_string(ratio) + ")";
    }
    if (ratio <= config.icon_square_tolerance &&
        std::max(image.width, image.height) <= config.icon_max_side) {
        return "icon";
    }
    return std::nullopt;
}

std::vector<RawImageCandidate> filter_images(std::vector<RawImageCandidate> candidates,
                                             const std::size_t total_pages,
                                             const ImageFilterConfig& config) {
    std::ranges::sort(candidates, [](const RawImageCandidate& a, const RawImageCandidate& b) {
        return a.page_number != b.page_number ? a.page_number < b.page_number
                                              : a.index_on_page < b.index_on_page;
    });

    const std::size_t threshold = repetition_threshold(total_pages, config);

    std::vector<ImageSignature> signatures;
    signatures.reserve(candidates.size());
    std::map<ImageSignature, std::set<std::size_t>> pages_by_signature;
    for (const auto& c : candidates) {
        signatures.push_back(signature_of(c.bytes));
        pages_by_signature[signatures.back()].insert(c.page_number);
    }

    std::vector<RawImageCandidate> kept;
    std::set<ImageSignature> seen;
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        auto& c = candidates[i];
        const auto& sig = signatures[i];
        const std::string where = "page " + std::to_string(c.page_number) + " image " + std::to_string(c.index_on_page);

        if (const auto pages = pages_by_signature[sig].size(); pages >= threshold) {
            Logger::log(LogLevel::Debug,
                        where + " repeats on " + std::to_string(pages) + " pages (threshold " +
                        std::to_string(threshold) + "), dropped",
                        "image_filter");
            continue;
        }
        if (!seen.insert(sig).second) {
            Logger::log(LogLevel::Debug, where + " duplicates an earlier image, dropped", "image_filter");
            continue;
        }
        if (const auto reason = geometry_rejection(c, config)) {
            Logger::log(LogLevel::Debug, where + " rejected: " + *reason, "image_filter");
            continue;
        }
        kept.push_back(std::move(c));
    }

    Logger::log(LogLevel::Debug,
                std::to_string(kept.size()) + " of " + std::to_string(candidates.size()) + " images kept",
                "image_filter");
    return kept;
}

} // namespace vetscan
