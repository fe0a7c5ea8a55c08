#ifndef VETSCAN_EVENTS_HPP
#define VETSCAN_EVENTS_HPP

#include "chunk_planner.hpp"
#include "errors.hpp"
#include "pipeline_state.hpp"
#include <cstddef>
#include <string>

namespace vetscan {

/**
 * @brief Events published by DocumentPipeline on its EventBus.
 *
 * Plain data carriers. Chunk and image events are published from worker
 * threads; the others from the thread that called process().
 */

// --- State machine ---

/**
 * @brief Emitted on every state transition of a document.
 */
struct PipelineStateEvent {
    std::string document_id;
    PipelineState state;
};

// --- OCR axis ---

struct ChunkOcrStartEvent {
    std::string document_id;
    ChunkRange chunk;
    unsigned attempt = 0; ///< 0 for the first call
};

/**
 * @brief Emitted when a chunk call failed transiently and will be retried.
 */
struct ChunkOcrRetryEvent {
    std::string document_id;
    ChunkRange chunk;
    unsigned attempt = 0;      ///< Attempt that failed (0-based)
    std::string error_message;
};

struct ChunkOcrCompleteEvent {
    std::string document_id;
    ChunkRange chunk;
    std::size_t pages = 0;     ///< Pages returned by the adapter
};

// --- Image axis ---

/**
 * @brief Emitted when one embedded image object is dropped for being
 * undecodable. Filtered (noise) images are not reported individually.
 */
struct ImageSkippedEvent {
    std::string document_id;
    std::size_t page_number = 0;
    std::size_t index_on_page = 0;
    std::string reason;
};

struct ImageStoreErrorEvent {
    std::string document_id;
    std::size_t page_number = 0;
    std::size_t image_index = 0;
    std::string error_message;
};

// --- Document outcome ---

struct DocumentCompleteEvent {
    std::string document_id;
    std::size_t total_pages = 0;
    std::size_t images = 0;
    double seconds = 0.0;
};

struct DocumentErrorEvent {
    std::string document_id;
    ErrorKind kind;
    PipelineState state;       ///< State reached when the error escaped
    std::string error_message;
};

} // namespace vetscan

#endif // VETSCAN_EVENTS_HPP
