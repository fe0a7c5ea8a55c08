#ifndef VETSCAN_REPORT_GENERATOR_HPP
#define VETSCAN_REPORT_GENERATOR_HPP

#include "../../../libvetscan/include/processing_result.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Outcome of one input file, successful or not.
 */
struct Result {
    std::filesystem::path path;
    bool success = false;
    double seconds = 0.0;
    std::optional<vetscan::ProcessingResult> processed; ///< Set when success
    std::string error_kind;
    std::string error_msg;
};

unsigned get_terminal_width();

/**
 * @brief Print fields and stored images of one processed document.
 */
void print_document_report(const vetscan::ProcessingResult& result);

/**
 * @brief Print the summary table of all inputs.
 */
void print_console_report(const std::vector<Result>& results,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Write one row per input, with every report field as a column.
 * @return false if the file could not be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

/**
 * @brief Write the page texts of a document to dir/<document id>.txt, pages separated by form feeds.
 * @return false if the file could not be written.
 */
bool export_page_text(const vetscan::ProcessingResult& result,
                      const std::filesystem::path& dir);

#endif // VETSCAN_REPORT_GENERATOR_HPP
