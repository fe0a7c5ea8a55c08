#ifndef VETSCAN_CLI_PARSER_HPP
#define VETSCAN_CLI_PARSER_HPP

#include <string>
#include <vector>
#include <filesystem>
#include "../../../libvetscan/include/pipeline_config.hpp"

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool recursive = false;
    bool quiet = false;
    bool scanned = false;

    unsigned num_threads = 1;
    std::string log_level = "INFO";
    std::filesystem::path log_file;
    std::filesystem::path images_dir = "extracted_images";
    std::filesystem::path report_path;
    std::filesystem::path text_dir;
    std::string ocr_command;

    vetscan::PipelineConfig pipeline;

    std::vector<std::filesystem::path> inputs;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // VETSCAN_CLI_PARSER_HPP
