/**
 * @file image_store.hpp
 * @brief Where extracted images are persisted.
 */

#ifndef VETSCAN_IMAGE_STORE_HPP
#define VETSCAN_IMAGE_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace vetscan {

/**
 * @brief Interface of an image store.
 *
 * put() is called concurrently, once per kept image.
 */
class IImageStore {
public:
    virtual ~IImageStore() = default;

    /**
     * @brief Persist one image.
     * @param page_number 0-based page the image came from.
     * @param index Position of the image on its page.
     * @return Reference under which the image can be retrieved.
     * @throws StorageWriteError if the image could not be written.
     */
    virtual std::string put(std::span<const std::uint8_t> bytes,
                            const std::string& document_id,
                            std::size_t page_number,
                            std::size_t index,
                            std::string_view mime_type) = 0;
};

/**
 * @brief Stores images as files below a root directory.
 *
 * Layout: `<root>/<document_id>/page<P>_img<I>.<ext>` where P is the
 * 1-based page number. Returns `file://` URIs of absolute paths.
 */
class FilesystemImageStore final : public IImageStore {
public:
    explicit FilesystemImageStore(std::filesystem::path root) : root_(std::move(root)) {}

    std::string put(std::span<const std::uint8_t> bytes,
                    const std::string& document_id,
                    std::size_t page_number,
                    std::size_t index,
                    std::string_view mime_type) override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// @return Path put() writes to, relative to root().
    [[nodiscard]] static std::filesystem::path relative_path(const std::string& document_id,
                                                             std::size_t page_number,
                                                             std::size_t index,
                                                             std::string_view mime_type);

private:
    std::filesystem::path root_;
};

} // namespace vetscan

#endif // VETSCAN_IMAGE_STORE_HPP
