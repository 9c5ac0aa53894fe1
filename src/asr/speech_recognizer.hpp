#pragma once
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "asr/compute_backend.hpp"
#include "core/logging.hpp"

namespace asr {

struct TranscriptSegment {
    std::string text;
    int64_t t0_ms;  // start time in milliseconds
    int64_t t1_ms;  // end time in milliseconds
};

struct TranscriptResult {
    std::string text;       // segments joined with single spaces
    std::string language;   // detected or forced language code, empty if unknown
    std::vector<TranscriptSegment> segments;
};

// Thrown by transcribe() when the cancel check stopped inference.
class TranscriptionAborted : public std::runtime_error {
public:
    TranscriptionAborted() : std::runtime_error("Transcription aborted") {}
};

/**
 * @brief Abstract speech-to-text engine used by transcription jobs
 *
 * Implementations:
 * - WhisperBackend (whisper.cpp)
 */
class ISpeechRecognizer {
public:
    virtual ~ISpeechRecognizer() = default;

    /**
     * @brief Choose the compute device; must be called before load_model()
     * @return Label of the backend actually used ("CUDA", "CPU", ...)
     */
    virtual std::string select_backend(ComputeBackend requested, const core::LogFn& log) = 0;

    /**
     * @brief Load a pretrained model by name or path
     * @return true if the model is ready
     */
    virtual bool load_model(const std::string& model_name, const core::LogFn& log) = 0;

    /**
     * @brief Transcribe 16 kHz mono float PCM
     * @param language "auto" or a language code
     * @param cancelled Polled during inference
     * @throws TranscriptionAborted when cancelled, std::runtime_error on failure
     */
    virtual TranscriptResult transcribe(const std::vector<float>& pcm,
                                        const std::string& language,
                                        const std::function<bool()>& cancelled) = 0;
};

} // namespace asr
