#ifndef VETSCAN_MIME_DETECTOR_HPP
#define VETSCAN_MIME_DETECTOR_HPP

#include <cstdint>
#include <span>
#include <string>

namespace vetscan {

/**
 * @brief Content-based MIME type detection for in-memory documents.
 */
class MimeDetector {
public:
    /**
     * @brief Detect the MIME type of a buffer.
     *
     * @return e.g. "application/pdf"; an empty string when the detection
     * backend is unavailable (no magic database), which callers must treat
     * as "unknown", not as a mismatch.
     *
     * @note On Linux/macOS this uses libmagic. On Windows it falls back to
     * a signature table covering the formats vetscan handles.
     */
    static std::string detect(std::span<const std::uint8_t> data);
};

} // namespace vetscan

#endif // VETSCAN_MIME_DETECTOR_HPP
