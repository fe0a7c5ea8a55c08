#include "cli_parser.hpp"
#include "../../../libvetscan/include/command_ocr_adapter.hpp"
#include <CLI/CLI.hpp>
#include <thread>
#include <algorithm>
#include <map>
#include <stdexcept>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");
    app.set_config("--config", "", "Read options from an INI or TOML file; command line flags win.");

    // --- Flags (booleans) ---
    app.add_flag("-r,--recursive", settings.recursive,
                 "Recursively scan input folders for PDF files.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress, per-document report).");

    // --- Outputs ---
    app.add_option("-o,--images-dir", settings.images_dir,
                   "Directory extracted images are written to, one subfolder per document.")
                   ->default_val(settings.images_dir.string());

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    app.add_option("--text-dir", settings.text_dir,
                   "Write the recognized text of each document to DIR/<document id>.txt.");

    // calculate default thread count
    settings.num_threads = std::max(1U, std::thread::hardware_concurrency() / 2);
    app.add_option("--threads", settings.num_threads,
                   "Threads shared by OCR, image extraction and image writes.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    // --- OCR ---
    auto& cfg = settings.pipeline;
    app.add_option("--ocr-command", settings.ocr_command,
                   "OCR command line; {input} is the chunk PDF, {output} the text file\n"
                   "(without {output} the text is read from stdout).")
                   ->default_val(std::string(vetscan::CommandOcrAdapter::kDefaultCommand));

    // the default command reads existing text layers only
    app.add_flag("--scanned", settings.scanned,
                 "Inputs are scans without a text layer: OCR them with ocrmypdf\n"
                 "(ignored when --ocr-command is given).");

    app.add_option("--pages-per-call", cfg.max_pages_per_call,
                   "Maximum pages sent to a single OCR call.")
                   ->default_val(cfg.max_pages_per_call)
                   ->check(CLI::PositiveNumber);

    app.add_option("--ocr-timeout", cfg.ocr_timeout_seconds,
                   "Seconds allowed for a single OCR call.")
                   ->default_val(cfg.ocr_timeout_seconds)
                   ->check(CLI::PositiveNumber);

    app.add_option("--ocr-retries", cfg.ocr_retry_limit,
                   "Retries of a failed or timed out OCR call.")
                   ->default_val(cfg.ocr_retry_limit);

    app.add_option("--ocr-backoff-ms", cfg.ocr_retry_backoff_ms,
                   "Delay before the first retry; doubled for each further retry.")
                   ->default_val(cfg.ocr_retry_backoff_ms);

    app.add_option("--max-bytes", cfg.max_document_bytes,
                   "Largest accepted PDF, in bytes.")
                   ->default_val(cfg.max_document_bytes)
                   ->check(CLI::PositiveNumber);

    // --- Images ---
    auto& filter = cfg.image_filter;
    app.add_option("--min-image-area", cfg.min_image_area_px,
                   "Images with fewer pixels are ignored during extraction.")
                   ->default_val(cfg.min_image_area_px);

    app.add_option("--repetition-fraction", filter.max_image_repetition_fraction,
                   "An image on at least this fraction of the pages is letterhead.")
                   ->default_val(filter.max_image_repetition_fraction)
                   ->check(CLI::Range(0.0, 1.0));

    app.add_option("--min-repeated-pages", filter.min_repeated_pages,
                   "Never treat an image as letterhead below this page count.")
                   ->default_val(filter.min_repeated_pages);

    app.add_option("--min-image-width", filter.min_image_width,
                   "Narrower images are discarded.")
                   ->default_val(filter.min_image_width);

    app.add_option("--min-image-height", filter.min_image_height,
                   "Shorter images are discarded.")
                   ->default_val(filter.min_image_height);

    app.add_option("--min-image-bytes", filter.min_image_bytes,
                   "Smaller encoded images are discarded.")
                   ->default_val(filter.min_image_bytes);

    app.add_option("--max-aspect-ratio", filter.max_aspect_ratio,
                   "Images more elongated than this are discarded as strips.")
                   ->default_val(filter.max_aspect_ratio);

    app.add_option("--icon-tolerance", filter.icon_square_tolerance,
                   "Side ratio up to which an image counts as square.")
                   ->default_val(filter.icon_square_tolerance);

    app.add_option("--icon-max-side", filter.icon_max_side,
                   "Square images up to this side (pixels) are discarded as icons.")
                   ->default_val(filter.icon_max_side);

    // storage policy option with a map transformer
    app.add_option("--storage-policy", cfg.storage_failure_policy,
                   "On a failed image write: 'skip' the image (default) or 'fail' the document.")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, vetscan::StorageFailurePolicy>{
                {"skip", vetscan::StorageFailurePolicy::SkipImage},
                {"fail", vetscan::StorageFailurePolicy::FailDocument}
            }, CLI::ignore_case))
        ->default_str(std::string(vetscan::to_string(cfg.storage_failure_policy)));

    // --- Positional Arguments ---
    app.add_option("inputs", settings.inputs, "One or more PDF files or directories")
        ->required()
        ->check(CLI::ExistingPath);

    // --- Cross-validation logic ---
    app.callback([&settings, &app]() {
        if (settings.scanned && app.count("--ocr-command") == 0) {
            settings.ocr_command = std::string(vetscan::CommandOcrAdapter::kScannedCommand);
        }

        try {
            settings.pipeline.validate();
        } catch (const std::invalid_argument& e) {
            throw CLI::ValidationError(e.what());
        }

        if (!settings.text_dir.empty() && std::filesystem::exists(settings.text_dir) &&
            !std::filesystem::is_directory(settings.text_dir)) {
            throw CLI::ValidationError("--text-dir must be a directory.");
        }
    });
}
