#include "file_scanner.hpp"
#include "../cli/cli_parser.hpp"
#include "../../../libvetscan/include/logger.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace fs = std::filesystem;
using vetscan::Logger;
using vetscan::LogLevel;

static bool is_junk(const fs::path& p) {
    auto name = p.filename().string();
    if (name.starts_with("._")) {
        return true;
    }
    std::transform(name.begin(), name.end(), name.begin(), ::tolower);
    return name == ".ds_store" || name == "desktop.ini";
}

static bool has_pdf_extension(const fs::path& p) {
    auto ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext == ".pdf";
}

std::vector<fs::path>
collect_input_files(const std::vector<fs::path>& inputs,
                    const Settings& settings) {
    std::vector<fs::path> result;

    const auto take = [&](const fs::path& p) {
        if (fs::is_regular_file(p) && !is_junk(p) && has_pdf_extension(p)) {
            result.push_back(p);
        }
    };

    for (const auto& in : inputs) {
        std::error_code ec;
        if (!fs::exists(in, ec)) {
            Logger::log(LogLevel::Error, "Input not found: " + in.string(), "scanner");
            continue;
        }
        if (fs::is_directory(in)) {
            if (settings.recursive) {
                for (auto& e : fs::recursive_directory_iterator(in, fs::directory_options::skip_permission_denied)) {
                    take(e.path());
                }
            } else {
                for (auto& e : fs::directory_iterator(in)) {
                    take(e.path());
                }
            }
        } else if (fs::is_regular_file(in)) {
            // explicit files are taken whatever their extension; validation happens later
            result.push_back(in);
        }
    }

    std::ranges::sort(result);
    result.erase(std::unique(result.begin(), result.end()), result.end());

    Logger::log(LogLevel::Info,
                "Scanner collected " + std::to_string(result.size()) + " files",
                "scanner");
    return result;
}
