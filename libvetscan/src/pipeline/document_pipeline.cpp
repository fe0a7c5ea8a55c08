#include "../../include/document_pipeline.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/image_extractor.hpp"
#include "../../include/image_filter.hpp"
#include "../../include/logger.hpp"
#include "../../include/page_reassembler.hpp"
#include "../../include/task_group.hpp"
#include <chrono>
#include <algorithm>
#include <condition_variable>
#include <iterator>
#include <mutex>
#include <optional>

namespace {

/**
 * @brief Sleep that returns early when stop is requested.
 * @return false if the sleep was interrupted.
 */
bool interruptible_sleep(const std::chrono::milliseconds duration, const std::stop_token& stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, duration, [] { return false; });
    return !stop.stop_requested();
}

} // namespace

namespace vetscan {

ProcessingResult DocumentPipeline::process(const std::string& document_id,
                                           const std::string& filename,
                                           std::vector<std::uint8_t> bytes,
                                           const PipelineConfig& config) {
    config.validate();

    const auto started = clock_.now();
    PipelineState state = PipelineState::Received;
    const auto advance = [&](const PipelineState next) {
        state = next;
        Logger::log(LogLevel::Debug, document_id + ": " + std::string(to_string(next)), "pipeline");
        bus_.publish(PipelineStateEvent{document_id, next});
    };

    Logger::log(LogLevel::Info, "Processing " + filename + " as " + document_id, "pipeline");
    bus_.publish(PipelineStateEvent{document_id, state});

    try {
        if (stop_.stop_requested()) throw CancelledError();

        const auto document = PdfDocument::load(std::move(bytes), config.max_document_bytes);
        advance(PipelineState::Validated);

        const auto plan = plan_chunks(document.page_count(), config.max_pages_per_call);
        advance(PipelineState::Chunked);

        const ImageExtractor extractor(decoders_, config.min_image_area_px);
        TaskGroup<std::vector<PageText>> ocr_group(pool_, stop_.get_token());
        TaskGroup<PageImages> image_group(pool_, stop_.get_token());

        for (const auto& chunk : plan) {
            ocr_group.spawn([&, chunk](const std::stop_token& st) {
                return ocr_chunk(document_id, document, chunk, config, st);
            });
        }
        for (std::size_t page = 0; page < document.page_count(); ++page) {
            image_group.spawn([&, page](const std::stop_token& st) {
                return extractor.extract_page(document, page, st);
            });
        }

        std::vector<std::vector<PageText>> chunk_pages;
        try {
            chunk_pages = ocr_group.join();
        } catch (...) {
            // no point in finishing the images of a document that failed
            image_group.cancel();
            throw;
        }
        advance(PipelineState::OCRed);

        PageReassembler reassembler(document.page_count());
        for (std::size_t i = 0; i < plan.size(); ++i) {
            reassembler.ingest(plan[i], ocr_.numbering(), std::move(chunk_pages[i]));
        }
        auto text = std::move(reassembler).finish();
        advance(PipelineState::Reassembled);

        // spawn order is page order
        std::vector<RawImageCandidate> candidates;
        for (auto& page : image_group.join()) {
            for (const auto& skipped : page.skipped) {
                bus_.publish(ImageSkippedEvent{document_id, page.page_number, skipped.index_on_page, skipped.reason});
            }
            std::move(page.candidates.begin(), page.candidates.end(), std::back_inserter(candidates));
        }
        const auto kept = filter_images(std::move(candidates), document.page_count(), config.image_filter);
        auto images = store_images(document_id, kept, config);
        advance(PipelineState::ImagesExtracted);

        auto info = parser_.parse(text.full_text());
        advance(PipelineState::Parsed);

        ProcessingResult result;
        result.document_id = document_id;
        result.filename = filename;
        result.total_pages = document.page_count();
        result.images = std::move(images);
        result.report_info = std::move(info);
        result.pages = text.pages();
        result.processing_time_seconds = std::chrono::duration<double>(clock_.now() - started).count();
        advance(PipelineState::Complete);

        Logger::log(LogLevel::Info,
                    document_id + ": " + std::to_string(result.total_pages) + " pages, " +
                    std::to_string(result.images.size()) + " images, " +
                    std::to_string(result.report_info.found_count()) + " fields",
                    "pipeline");
        bus_.publish(DocumentCompleteEvent{document_id, result.total_pages, result.images.size(),
                                           result.processing_time_seconds});
        return result;
    } catch (ProcessingError& e) {
        e.set_state(state);
        Logger::log(LogLevel::Error,
                    document_id + " failed in state " + std::string(to_string(state)) + ": " +
                    std::string(to_string(e.kind())) + ": " + e.what(),
                    "pipeline");
        bus_.publish(DocumentErrorEvent{document_id, e.kind(), state, e.what()});
        throw;
    }
}

std::vector<PageText> DocumentPipeline::ocr_chunk(const std::string& document_id, const PdfDocument& document,
                                                  const ChunkRange& chunk, const PipelineConfig& config,
                                                  const std::stop_token& stop) {
    std::vector<std::uint8_t> chunk_pdf;
    try {
        chunk_pdf = document.extract_pages(chunk);
    } catch (const std::exception& e) {
        throw OcrFatalError("cannot split pages " + chunk.to_string() + ": " + e.what());
    }

    const OcrRequest request{chunk_pdf, chunk, config.ocr_timeout()};
    auto backoff = std::chrono::milliseconds(config.ocr_retry_backoff_ms);

    for (unsigned attempt = 0;; ++attempt) {
        if (stop.stop_requested()) throw CancelledError();
        bus_.publish(ChunkOcrStartEvent{document_id, chunk, attempt});

        try {
            auto pages = ocr_.extract_text(request, stop);
            bus_.publish(ChunkOcrCompleteEvent{document_id, chunk, pages.size()});
            return pages;
        } catch (const OcrTransientError& e) {
            if (attempt >= config.ocr_retry_limit) {
                throw OcrFatalError("OCR of pages " + chunk.to_string() + " failed after " +
                                    std::to_string(attempt + 1) + " attempts: " + e.what());
            }
            Logger::log(LogLevel::Warning,
                        "OCR of pages " + chunk.to_string() + " failed (attempt " + std::to_string(attempt + 1) +
                        "), retrying in " + std::to_string(backoff.count()) + " ms: " + e.what(),
                        "pipeline");
            bus_.publish(ChunkOcrRetryEvent{document_id, chunk, attempt, e.what()});
        } catch (const ProcessingError&) {
            throw;
        } catch (const std::exception& e) {
            throw OcrFatalError(std::string(ocr_.get_name()) + " failed: " + e.what());
        }

        if (!interruptible_sleep(backoff, stop)) throw CancelledError();
        backoff *= 2;
    }
}

std::vector<ExtractedImage> DocumentPipeline::store_images(const std::string& document_id,
                                                           const std::vector<RawImageCandidate>& kept,
                                                           const PipelineConfig& config) {
    TaskGroup<std::optional<ExtractedImage>> group(pool_, stop_.get_token());

    for (const auto& candidate : kept) {
        group.spawn([&](const std::stop_token&) -> std::optional<ExtractedImage> {
            const auto mime = mime_type(candidate.format);
            std::string failure;
            try {
                ExtractedImage image;
                image.page_number = candidate.page_number;
                image.index_on_page = candidate.index_on_page;
                image.width = candidate.width;
                image.height = candidate.height;
                image.mime_type = std::string(mime);
                image.byte_size = candidate.bytes.size();
                image.storage_reference = store_.put(candidate.bytes, document_id, candidate.page_number,
                                                     candidate.index_on_page, mime);
                return image;
            } catch (const StorageWriteError& e) {
                failure = e.what();
            } catch (const ProcessingError&) {
                throw;
            } catch (const std::exception& e) {
                failure = e.what();
            }

            bus_.publish(ImageStoreErrorEvent{document_id, candidate.page_number, candidate.index_on_page, failure});
            if (config.storage_failure_policy == StorageFailurePolicy::FailDocument) {
                throw StorageWriteError("page " + std::to_string(candidate.page_number) + " image " +
                                        std::to_string(candidate.index_on_page) + ": " + failure);
            }
            Logger::log(LogLevel::Warning,
                        "Image on page " + std::to_string(candidate.page_number) + " not stored, skipped: " + failure,
                        "pipeline");
            return std::nullopt;
        });
    }

    std::vector<ExtractedImage> stored;
    for (auto& image : group.join()) {
        if (image) stored.push_back(std::move(*image));
    }
    return stored;
}

} // namespace vetscan
