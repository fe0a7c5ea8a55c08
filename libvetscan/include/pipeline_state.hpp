#ifndef VETSCAN_PIPELINE_STATE_HPP
#define VETSCAN_PIPELINE_STATE_HPP

#include <string_view>

namespace vetscan {

/**
 * @brief States of the document pipeline, in the only order they can occur.
 *
 * The machine is linear: every state except Complete either advances to the
 * next one or terminates with a ProcessingError tagged with the state that
 * had been reached.
 */
enum class PipelineState {
    Received,
    Validated,
    Chunked,
    OCRed,
    Reassembled,
    ImagesExtracted,
    Parsed,
    Complete
};

constexpr std::string_view to_string(const PipelineState state) noexcept {
    switch (state) {
        case PipelineState::Received:        return "Received";
        case PipelineState::Validated:       return "Validated";
        case PipelineState::Chunked:         return "Chunked";
        case PipelineState::OCRed:           return "OCRed";
        case PipelineState::Reassembled:     return "Reassembled";
        case PipelineState::ImagesExtracted: return "ImagesExtracted";
        case PipelineState::Parsed:          return "Parsed";
        case PipelineState::Complete:        return "Complete";
    }
    return "Unknown";
}

} // namespace vetscan

#endif // VETSCAN_PIPELINE_STATE_HPP
