/**
 * @file document_pipeline.hpp
 * @brief Defines the orchestrator that turns one PDF into a ProcessingResult.
 */

#ifndef VETSCAN_DOCUMENT_PIPELINE_HPP
#define VETSCAN_DOCUMENT_PIPELINE_HPP

#include "chunk_planner.hpp"
#include "clock.hpp"
#include "decoder_registry.hpp"
#include "event_bus.hpp"
#include "field_parser.hpp"
#include "image_store.hpp"
#include "image_types.hpp"
#include "ocr_adapter.hpp"
#include "pdf_document.hpp"
#include "pipeline_config.hpp"
#include "processing_result.hpp"
#include "thread_pool.hpp"
#include <cstdint>
#include <stop_token>
#include <string>
#include <vector>

namespace vetscan {

/**
 * @brief Runs the document state machine.
 *
 * @details States advance linearly:
 * Received, Validated, Chunked, OCRed, Reassembled, ImagesExtracted,
 * Parsed, Complete. Each transition is published as a PipelineStateEvent.
 *
 * After chunking, two task groups run on the shared ThreadPool at the same
 * time: one OCR task per chunk and one image extraction task per page. Each
 * task returns its own slice; the slices are merged after the join in page
 * order. An OCR failure cancels the image group. Kept images are written to
 * the image store by a third task group.
 *
 * A fatal error stops the machine where it is: the ProcessingError is
 * stamped with the current state, published as DocumentErrorEvent and
 * rethrown.
 *
 * One instance processes documents one at a time; request_stop() is final
 * for the instance.
 */
class DocumentPipeline {
public:
    /**
     * @param ocr OCR backend; called concurrently for different chunks.
     * @param store Image store; called concurrently for different images.
     * @param clock Time source for processing_time_seconds.
     * @param bus Receives progress events.
     * @param pool Workers for OCR, extraction and storage tasks.
     */
    DocumentPipeline(IOcrAdapter& ocr, IImageStore& store, const IClock& clock, EventBus& bus, ThreadPool& pool)
        : ocr_(ocr), store_(store), clock_(clock), bus_(bus), pool_(pool) {}

    /**
     * @brief Process one document.
     * @param document_id Identifier used in events and storage paths.
     * @param filename Display name, copied into the result.
     * @param bytes The PDF file.
     * @throws std::invalid_argument if @p config is invalid.
     * @throws ProcessingError (a subclass) if the document failed.
     */
    ProcessingResult process(const std::string& document_id,
                             const std::string& filename,
                             std::vector<std::uint8_t> bytes,
                             const PipelineConfig& config);

    /// @brief Cancel the running document. Thread-safe.
    void request_stop() noexcept { stop_.request_stop(); }

    [[nodiscard]] bool is_stopped() const noexcept { return stop_.stop_requested(); }

private:
    /// OCR of one chunk with retry and backoff.
    std::vector<PageText> ocr_chunk(const std::string& document_id, const PdfDocument& document,
                                    const ChunkRange& chunk, const PipelineConfig& config,
                                    const std::stop_token& stop);

    /// Store the kept images, applying the storage failure policy.
    std::vector<ExtractedImage> store_images(const std::string& document_id,
                                             const std::vector<RawImageCandidate>& kept,
                                             const PipelineConfig& config);

    IOcrAdapter& ocr_;
    IImageStore& store_;
    const IClock& clock_;
    EventBus& bus_;
    ThreadPool& pool_;
    DecoderRegistry decoders_;
    FieldParser parser_;
    std::stop_source stop_;
};

} // namespace vetscan

#endif // VETSCAN_DOCUMENT_PIPELINE_HPP
