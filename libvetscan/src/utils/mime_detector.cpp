#ifndef _WIN32
#include <magic.h>
#endif
#include "../../include/mime_detector.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <string_view>

namespace {

#ifdef _WIN32
struct Signature {
    std::string_view magic;
    const char* mime;
};

constexpr std::array<Signature, 4> kSignatures{{
    {"%PDF-", "application/pdf"},
    {"\xFF\xD8\xFF", "image/jpeg"},
    {"\x89PNG\r\n\x1A\n", "image/png"},
    {std::string_view("\x00\x00\x00\x0CjP  ", 8), "image/jp2"},
}};
#endif

} // namespace

std::string vetscan::MimeDetector::detect(const std::span<const std::uint8_t> data)
{
#ifndef _WIN32
    const magic_t magic = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!magic) return {};
    if (magic_load(magic, nullptr) != 0)
    {
        Logger::log(LogLevel::Debug, std::string("libmagic database unavailable: ") + magic_error(magic), "libmagic");
        magic_close(magic);
        return {};
    }
    const char* mime = magic_buffer(magic, data.data(), data.size());
    std::string result = mime ? mime : "";
    magic_close(magic);
    return result;
#else
    for (const auto& sig : kSignatures)
    {
        if (data.size() >= sig.magic.size() &&
            std::equal(sig.magic.begin(), sig.magic.end(), data.begin(),
                       [](const char a, const std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; }))
        {
            return sig.mime;
        }
    }
    return "application/octet-stream";
#endif
}
