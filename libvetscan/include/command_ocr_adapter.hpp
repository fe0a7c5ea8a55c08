/**
 * @file command_ocr_adapter.hpp
 * @brief IOcrAdapter that runs an external text extraction command.
 */

#ifndef VETSCAN_COMMAND_OCR_ADAPTER_HPP
#define VETSCAN_COMMAND_OCR_ADAPTER_HPP

#include "ocr_adapter.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace vetscan {

/**
 * @brief Runs a command line per chunk and reads its text output.
 *
 * @details The chunk PDF is written to a private temp directory. In the
 * command template, `{input}` is replaced by the path of that file and
 * `{output}` by the path the command must write its text to; without an
 * `{output}` placeholder the command's stdout is captured instead. Pages are
 * separated by form feeds, as pdftotext and most OCR front ends emit them,
 * and numbered chunk-locally.
 *
 * The default command only reads the text layer a PDF already has, which
 * covers reports exported from practice software. Scanned reports carry no
 * text layer and come back as empty pages; process them with an OCR command
 * such as kScannedCommand (ocrmypdf with Tesseract behind it).
 *
 * A non-zero exit status or a timeout is reported as OcrTransientError; a
 * command that cannot be started is OcrFatalError.
 */
class CommandOcrAdapter final : public IOcrAdapter {
public:
    static constexpr std::string_view kDefaultCommand = "pdftotext -layout {input} {output}";
    /// @brief OCRs every page and writes only the text sidecar, one form feed per page.
    static constexpr std::string_view kScannedCommand =
        "ocrmypdf --force-ocr -l spa+eng --output-type none --sidecar {output} {input} -";

    /**
     * @param command Command template; double quotes group words.
     * @throws std::invalid_argument if the template is empty or lacks `{input}`.
     */
    explicit CommandOcrAdapter(const std::string& command = std::string(kDefaultCommand));

    [[nodiscard]] std::string_view get_name() const noexcept override { return name_; }
    [[nodiscard]] PageNumbering numbering() const noexcept override { return PageNumbering::ChunkLocal; }

    std::vector<PageText> extract_text(const OcrRequest& request, std::stop_token stop) override;

    /// @brief Split a command template into words, honouring double quotes.
    [[nodiscard]] static std::vector<std::string> tokenize(std::string_view command);

    /**
     * @brief Split text on form feeds into pages numbered from 0.
     *
     * A single form feed terminating the text closes the last page and does
     * not open another one.
     */
    [[nodiscard]] static std::vector<PageText> split_pages(std::string_view text);

private:
    std::vector<std::string> tokens_;
    std::string name_;
    bool writes_output_file_ = false;
};

} // namespace vetscan

#endif // VETSCAN_COMMAND_OCR_ADAPTER_HPP
