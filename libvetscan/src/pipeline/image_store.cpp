#include "../../include/image_store.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/image_types.hpp"
#include "../../include/logger.hpp"
#include <system_error>

namespace vetscan {

std::filesystem::path FilesystemImageStore::relative_path(const std::string& document_id,
                                                          const std::size_t page_number,
                                                          const std::size_t index,
                                                          const std::string_view mime_type) {
    std::string name = "page" + std::to_string(page_number + 1) + "_img" + std::to_string(index) + ".";
    name += extension_for_mime(mime_type);
    return std::filesystem::path(document_id) / name;
}

std::string FilesystemImageStore::put(const std::span<const std::uint8_t> bytes,
                                      const std::string& document_id,
                                      const std::size_t page_number,
                                      const std::size_t index,
                                      const std::string_view mime_type) {
    if (document_id.empty() || document_id.find_first_of("/\\") != std::string::npos || document_id == "..") {
        throw StorageWriteError("invalid document id for storage: '" + document_id + "'");
    }

    const auto target = root_ / relative_path(document_id, page_number, index, mime_type);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageWriteError("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    try {
        write_file_bytes(target, bytes);
    } catch (const std::exception& e) {
        throw StorageWriteError(std::string("cannot write image: ") + e.what());
    }

    const auto absolute = std::filesystem::absolute(target, ec);
    const auto uri = "file://" + (ec ? target : absolute).generic_string();
    Logger::log(LogLevel::Debug, "Stored " + std::to_string(bytes.size()) + " bytes at " + uri, "image_store");
    return uri;
}

} // namespace vetscan
