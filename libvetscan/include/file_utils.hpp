#ifndef VETSCAN_FILE_UTILS_HPP
#define VETSCAN_FILE_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vetscan {

    /**
     * @brief Read a whole file.
     * @throws std::runtime_error if the file cannot be opened or read.
     */
    std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path &path);

    /**
     * @brief Write a buffer to a file, replacing it.
     * @throws std::runtime_error on open or write failure.
     */
    void write_file_bytes(const std::filesystem::path &path, std::span<const std::uint8_t> data);

    /**
     * @brief Create a unique temporary directory named
     * "vetscan-{prefix}/{prefix}_{stem}_{random}".
     */
    std::filesystem::path make_temp_dir_for(std::string_view stem, const std::string &prefix);

    /**
     * @brief Recursively removes a directory and logs any errors.
     */
    void cleanup_temp_dir(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief Make an uploaded filename safe to store and display.
     *
     * Strips directory components (both separators), replaces every
     * character outside [A-Za-z0-9._-] with '_', truncates to 200
     * characters and falls back to "upload.pdf" when nothing is left.
     */
    std::string sanitize_filename(std::string_view filename);

} // namespace vetscan

#endif // VETSCAN_FILE_UTILS_HPP
