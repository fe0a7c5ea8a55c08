/**
 * @file vetscan.hpp
 * @brief Public API for the vetscan library.
 */

#ifndef VETSCAN_HPP
#define VETSCAN_HPP

#include "image_store.hpp"
#include "ocr_adapter.hpp"
#include "pipeline_config.hpp"
#include "processing_result.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace vetscan {

/**
 * @brief Interface for receiving progress and status events during processing.
 *
 * Callbacks may arrive from worker threads.
 */
struct VetscanObserver {
    virtual ~VetscanObserver() = default;

    virtual void onDocumentStart(const std::string& document_id, const std::string& filename) {}

    virtual void onStateChange(const std::string& document_id, const std::string& state) {}

    virtual void onChunkRetry(const std::string& document_id,
                              std::size_t start_page,
                              std::size_t end_page,
                              unsigned attempt,
                              const std::string& error) {}

    virtual void onImageSkipped(const std::string& document_id,
                                std::size_t page_number,
                                std::size_t index_on_page,
                                const std::string& reason) {}

    virtual void onDocumentFinish(const std::string& document_id,
                                  std::size_t total_pages,
                                  std::size_t images,
                                  double seconds) {}

    virtual void onDocumentError(const std::string& document_id,
                                 const std::string& kind,
                                 const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the vetscan library.
 *
 * @details Wraps the document pipeline into a simple, blocking API.
 * Uses PIMPL idiom to hide internal dependencies.
 */
class Vetscan {
public:
    Vetscan();
    ~Vetscan();

    Vetscan(const Vetscan&) = delete;
    Vetscan& operator=(const Vetscan&) = delete;
    Vetscan(Vetscan&&) noexcept;
    Vetscan& operator=(Vetscan&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Replace the pipeline configuration.
     * @throws std::invalid_argument if @p cfg is invalid.
     */
    Vetscan& config(const PipelineConfig& cfg);

    /**
     * @brief Set the number of worker threads to use.
     * Default: hardware concurrency / 2.
     */
    Vetscan& threads(unsigned val);

    /**
     * @brief Set the OCR backend.
     * Default: CommandOcrAdapter running pdftotext.
     */
    Vetscan& ocrAdapter(std::unique_ptr<IOcrAdapter> adapter);

    /**
     * @brief Set where extracted images are written.
     * Default: FilesystemImageStore under "extracted_images".
     */
    Vetscan& imageStore(std::unique_ptr<IImageStore> store);

    // --- Observability ---

    /**
     * @brief Sets the observer for progress events.
     * The caller retains ownership of the observer.
     */
    void setObserver(VetscanObserver* observer);

    // --- Execution ---

    /**
     * @brief Processes a PDF file under a fresh document id. Blocks until completion.
     * @throws ProcessingError on failure.
     */
    ProcessingResult process(const std::filesystem::path& path);

    /**
     * @brief Processes an in-memory PDF. An empty @p document_id gets a fresh one.
     * @throws ProcessingError on failure.
     */
    ProcessingResult process(const std::string& document_id,
                             const std::string& filename,
                             std::vector<std::uint8_t> bytes);

    // --- Control ---

    /**
     * @brief Cancels the document in progress. Thread-safe.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vetscan

#endif // VETSCAN_HPP
