#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace vetscan {

    std::vector<std::uint8_t> read_file_bytes(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Cannot open file: " + path.string());
        }
        std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(in)),
                                       std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw std::runtime_error("Cannot read file: " + path.string());
        }
        return data;
    }

    void write_file_bytes(const std::filesystem::path& path, const std::span<const std::uint8_t> data) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Cannot open file for writing: " + path.string());
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("Write failed: " + path.string());
        }
    }

    std::filesystem::path make_temp_dir_for(const std::string_view stem, const std::string& prefix) {
        const auto base_tmp = std::filesystem::temp_directory_path() / ("vetscan-" + prefix);

        std::error_code ec;
        std::filesystem::create_directories(base_tmp, ec);

        const std::string dir_name = prefix + "_" + std::string(stem) + "_" + RandomUtils::random_suffix();
        auto dir = base_tmp / dir_name;

        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create temp dir: " + dir.string() + " (" + ec.message() + ")",
                "file_utils");
            throw std::runtime_error("Failed to create temp dir: " + dir.string());
        }
        return dir;
    }

    void cleanup_temp_dir(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
        } else {
            Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        }
    }

    std::string sanitize_filename(const std::string_view filename) {
        constexpr std::size_t kMaxLength = 200;

        std::string_view name = filename;
        if (const auto slash = name.find_last_of("/\\"); slash != std::string_view::npos) {
            name.remove_prefix(slash + 1);
        }

        std::string safe;
        safe.reserve(name.size());
        for (std::size_t i = 0; i < name.size(); ++i) {
            const auto c = static_cast<unsigned char>(name[i]);
            if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
                safe.push_back(static_cast<char>(c));
            } else if (c >= 0x80 && c < 0xC0) {
                // continuation byte: its code point already became '_'
            } else {
                safe.push_back('_');
            }
        }
        if (safe.size() > kMaxLength) safe.resize(kMaxLength);
        return safe.empty() ? "upload.pdf" : safe;
    }

} // namespace vetscan
