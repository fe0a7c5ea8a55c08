#include "report_generator.hpp"
#include "../../../libvetscan/include/field_parser.hpp"
#include <iostream>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <regex>

#include <sys/ioctl.h>
#include <unistd.h>

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
}

static std::string strip_ansi(const std::string& s) {
    static const std::regex ansi_pattern("\033\\[[0-9;]*m");
    return std::regex_replace(s, ansi_pattern, "");
}

static std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

static std::string format_seconds(const double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds;
    return oss.str();
}

// multi-line block values are shown on one line in tables
static std::string one_line(std::string value) {
    std::ranges::replace(value, '\n', ' ');
    std::ranges::replace(value, '\r', ' ');
    return value;
}

void print_document_report(const vetscan::ProcessingResult& result) {
    const bool use_colors = is_stderr_a_tty();
    const char* bold = use_colors ? "\033[1m" : "";
    const char* dim = use_colors ? "\033[0;90m" : "";
    const char* reset = use_colors ? "\033[0m" : "";

    std::cerr << "\n" << bold << result.filename << reset
              << " (" << result.document_id << ", " << result.total_pages << " pages, "
              << format_seconds(result.processing_time_seconds) << " s)\n";

    size_t label_width = 0;
    for (const auto field : vetscan::kAllReportFields) {
        label_width = std::max(label_width, vetscan::to_string(field).size());
    }

    for (const auto field : vetscan::kAllReportFields) {
        const auto& value = result.report_info.get(field);
        std::cerr << "  " << std::left << std::setw(static_cast<int>(label_width + 2))
                  << std::string(vetscan::to_string(field)) + ":";
        if (!value) {
            std::cerr << dim << "-" << reset << "\n";
            continue;
        }
        // indent continuation lines under the value column
        std::string indented;
        for (const char c : *value) {
            indented.push_back(c);
            if (c == '\n') indented.append(label_width + 4, ' ');
        }
        std::cerr << indented << "\n";
    }

    if (result.images.empty()) {
        std::cerr << "  images: " << dim << "none" << reset << "\n";
        return;
    }
    std::cerr << "  images: " << result.images.size() << "\n";
    for (const auto& img : result.images) {
        std::cerr << "    page " << std::setw(4) << (img.page_number + 1)
                  << " #" << std::setw(3) << img.index_on_page
                  << " " << std::setw(12) << (std::to_string(img.width) + "x" + std::to_string(img.height))
                  << " " << std::setw(11) << img.mime_type
                  << " " << std::setw(8) << (img.byte_size / 1024) << " KB  "
                  << dim << img.storage_reference << reset << "\n";
    }
}

void print_console_report(const std::vector<Result>& results,
                          const unsigned num_threads,
                          const double total_seconds) {
    const unsigned term_width = get_terminal_width();
    const bool use_colors = is_stderr_a_tty();

    size_t max_id = 14;
    size_t max_pages = 7;
    size_t max_images = 8;
    size_t max_fields = 8;
    size_t max_time = 9;
    size_t max_result = 8;

    std::vector<std::string> outcomes;
    outcomes.reserve(results.size());
    for (const auto& r : results) {
        std::string outcome;
        if (!r.success) {
            outcome = use_colors ? "\033[1;31mFAIL\033[0m" : "FAIL";
        } else {
            outcome = use_colors ? "\033[1;32mOK\033[0m" : "OK";
        }
        max_time = std::max(max_time, format_seconds(r.seconds).size() + 1);
        outcomes.push_back(std::move(outcome));
    }

    unsigned fixed_cols_width = static_cast<unsigned>(max_id + max_pages + max_images + max_fields +
                                                      max_time + max_result);
    fixed_cols_width += 6;

    const unsigned file_col_width = term_width > fixed_cols_width + 25
                                ? std::min(60u, term_width - fixed_cols_width - 20)
                                : 20;

    auto truncate = [](const std::string& s, const size_t max_len) {
        return s.size() <= max_len ? s : s.substr(0, max_len - 3) + "...";
    };

    std::cerr << "\n"
              << std::left << std::setw(file_col_width) << "File"
              << std::setw(max_id)     << "Document"
              << std::setw(max_pages)  << "Pages"
              << std::setw(max_images) << "Images"
              << std::setw(max_fields) << "Fields"
              << std::setw(max_time)   << "Time(s)"
              << std::setw(max_result) << "Result"
              << "Error"
              << "\n";

    size_t ok = 0;
    size_t total_pages = 0;
    size_t total_images = 0;
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        const auto* p = r.processed ? &*r.processed : nullptr;
        if (r.success) ++ok;
        if (p) {
            total_pages += p->total_pages;
            total_images += p->images.size();
        }

        const auto& outcome = outcomes[i];
        // setw counts the escape codes too
        const size_t pad = max_result + (outcome.size() - strip_ansi(outcome).size());

        std::cerr << std::left << std::setw(file_col_width) << truncate(r.path.filename().string(), file_col_width - 1)
                  << std::setw(max_id)     << (p ? p->document_id : "-")
                  << std::setw(max_pages)  << (p ? std::to_string(p->total_pages) : "-")
                  << std::setw(max_images) << (p ? std::to_string(p->images.size()) : "-")
                  << std::setw(max_fields) << (p ? std::to_string(p->report_info.found_count()) : "-")
                  << std::setw(max_time)   << format_seconds(r.seconds)
                  << std::setw(pad)        << outcome
                  << (r.success ? "" : r.error_kind + ": " + one_line(r.error_msg))
                  << "\n";
    }

    std::cerr << "\nDocuments: " << ok << "/" << results.size() << " processed\n";
    std::cerr << "Pages: " << total_pages << ", images kept: " << total_images << "\n";
    std::cerr << "Total time: " << format_seconds(total_seconds)
              << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "File,Document,Pages,Images,Time(s),Result";
    for (const auto field : vetscan::kAllReportFields) {
        out << "," << vetscan::to_string(field);
    }
    out << ",Error\n";

    for (const auto& r : results) {
        const auto* p = r.processed ? &*r.processed : nullptr;
        out << csv_escape(r.path.filename().string()) << ","
            << csv_escape(p ? p->document_id : "") << ","
            << (p ? std::to_string(p->total_pages) : "") << ","
            << (p ? std::to_string(p->images.size()) : "") << ","
            << format_seconds(r.seconds) << ","
            << (r.success ? "OK" : "FAIL");
        for (const auto field : vetscan::kAllReportFields) {
            out << ",";
            if (p) {
                if (const auto& value = p->report_info.get(field)) out << csv_escape(*value);
            }
        }
        out << "," << csv_escape(r.success ? "" : r.error_kind + ": " + r.error_msg) << "\n";
    }

    out << "\n\nTotal amount of time\n";
    out << format_seconds(total_seconds) << " seconds\n";
    return static_cast<bool>(out);
}

bool export_page_text(const vetscan::ProcessingResult& result,
                      const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) return false;

    std::ofstream out(dir / (result.document_id + ".txt"), std::ios::binary);
    if (!out) return false;

    for (size_t i = 0; i < result.pages.size(); ++i) {
        if (i > 0) out << '\f';
        out << result.pages[i].text;
    }
    return static_cast<bool>(out);
}
