#include <iostream>
#include <filesystem>
#include <csignal>
#include <clocale>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <thread>
#include <CLI/CLI.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "report/report_generator.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/file_scanner.hpp"
#include "../../libvetscan/include/vetscan.hpp"
#include "../../libvetscan/include/command_ocr_adapter.hpp"
#include "../../libvetscan/include/errors.hpp"
#include "../../libvetscan/include/image_store.hpp"
#include "../../libvetscan/include/logger.hpp"

using namespace vetscan;
namespace fs = std::filesystem;

static std::atomic<bool> interrupted{false};

// handle ctrl+c or termination signals
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
    }
}

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return; // ok
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Info, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    // no UTF-8 available
    Logger::log(LogLevel::Warning, "UTF-8 locale not available; accented report labels may print badly.",
                "LocaleInit");
}

// progress lines on stderr, quiet mode prints nothing
class ConsoleObserver final : public VetscanObserver {
public:
    ConsoleObserver(const size_t total, const bool quiet) : total_(total), quiet_(quiet) {}

    void onDocumentStart(const std::string& document_id, const std::string& filename) override {
        if (quiet_) return;
        ++started_;
        std::cerr << CYAN << "[" << started_ << "/" << total_ << "] " << filename
                  << " (" << document_id << ")" << RESET << std::endl;
    }

    void onChunkRetry(const std::string& document_id, const size_t start_page, const size_t end_page,
                      const unsigned attempt, const std::string& error) override {
        if (quiet_) return;
        std::cerr << YELLOW << "  [RETRY] pages " << (start_page + 1) << "-" << end_page
                  << " attempt " << (attempt + 1) << " failed: " << error << RESET << std::endl;
    }

    void onImageSkipped(const std::string& document_id, const size_t page_number, const size_t index_on_page,
                        const std::string& reason) override {
        if (quiet_) return;
        std::cerr << YELLOW << "  [SKIP] page " << (page_number + 1) << " image " << index_on_page
                  << ": " << reason << RESET << std::endl;
    }

    void onDocumentError(const std::string& document_id, const std::string& kind,
                         const std::string& error) override {
        std::cerr << RED << "  [FAIL] " << kind << ": " << error << RESET << std::endl;
    }

private:
    size_t total_;
    bool quiet_;
    std::atomic<size_t> started_{0};
};

int main(int argc, char* argv[]) {

    CLI::App app{"vetscan: Extract text, images and report fields from veterinary PDF reports."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        return app.exit(e);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, true);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }

    auto consoleSink = std::make_unique<ConsoleLogSink>();
    consoleSink->log_level = settings.quiet ? LogLevel::Error : Logger::string_to_level(settings.log_level);
    Logger::add_sink(std::move(consoleSink));

    init_utf8_locale();

    // collect input files
    const auto inputs = collect_input_files(settings.inputs, settings);
    if (inputs.empty()) {
        Logger::log(LogLevel::Error, "No PDF input files.", "main");
        return 1;
    }

    Vetscan vetscan;
    try {
        vetscan.config(settings.pipeline)
               .threads(settings.num_threads)
               .ocrAdapter(std::make_unique<CommandOcrAdapter>(settings.ocr_command))
               .imageStore(std::make_unique<FilesystemImageStore>(settings.images_dir));
    } catch (const std::invalid_argument& e) {
        std::cerr << RED << "Invalid configuration: " << e.what() << RESET << std::endl;
        return 1;
    }

    ConsoleObserver observer(inputs.size(), settings.quiet);
    vetscan.setObserver(&observer);

    // the signal handler only sets the flag; stopping takes locks
    std::jthread interrupt_watcher([&vetscan](const std::stop_token& st) {
        while (!st.stop_requested()) {
            if (interrupted.load()) {
                std::cerr << CYAN
                          << "\n[INTERRUPT] Stop detected. Waiting for threads to finish..."
                          << RESET << std::endl;
                vetscan.stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::vector<Result> results;
    results.reserve(inputs.size());
    const auto start_total = std::chrono::steady_clock::now();

    for (const auto& path : inputs) {
        if (interrupted.load()) {
            Logger::log(LogLevel::Warning, "Interrupted, skipping " + path.filename().string(), "main");
            continue;
        }

        Result r;
        r.path = path;
        const auto start = std::chrono::steady_clock::now();
        try {
            auto processed = vetscan.process(path);
            r.success = true;
            r.processed = std::move(processed);
        } catch (const ProcessingError& e) {
            r.error_kind = std::string(to_string(e.kind()));
            r.error_msg = e.what();
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, "Unexpected failure on " + path.string() + ": " + e.what(), "main");
            r.error_kind = "InternalError";
            r.error_msg = e.what();
        }
        r.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        if (r.success) {
            if (!settings.quiet) {
                print_document_report(*r.processed);
            }
            if (!settings.text_dir.empty() && !export_page_text(*r.processed, settings.text_dir)) {
                Logger::log(LogLevel::Error,
                            "Cannot write text of " + r.processed->document_id + " to " + settings.text_dir.string(),
                            "main");
            }
        }
        results.push_back(std::move(r));
    }

    interrupt_watcher.request_stop();
    vetscan.setObserver(nullptr);

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        print_console_report(results, settings.num_threads, total_seconds);
    }

    // export CSV if requested
    if (!settings.report_path.empty() && !export_csv_report(results, settings.report_path, total_seconds)) {
        Logger::log(LogLevel::Error, "Cannot write report to " + settings.report_path.string(), "main");
    }

    const bool all_ok = !interrupted.load() && results.size() == inputs.size() &&
                        std::ranges::all_of(results, [](const Result& r) { return r.success; });
    return all_ok ? 0 : 1;
}
