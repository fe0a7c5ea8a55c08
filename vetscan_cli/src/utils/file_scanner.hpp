#ifndef VETSCAN_FILE_SCANNER_HPP
#define VETSCAN_FILE_SCANNER_HPP

#include <vector>
#include <filesystem>

struct Settings; // Forward declaration

/**
 * @brief Expand the command line inputs into the list of PDFs to process.
 *
 * Files are taken as given; directories contribute their *.pdf files,
 * recursively with --recursive. The result is sorted and free of duplicates.
 */
std::vector<std::filesystem::path>
collect_input_files(const std::vector<std::filesystem::path>& inputs,
                    const Settings& settings);

#endif // VETSCAN_FILE_SCANNER_HPP
