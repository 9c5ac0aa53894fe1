#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "asr/speech_recognizer.hpp"

namespace asr {

class WhisperBackend : public ISpeechRecognizer {
public:
    explicit WhisperBackend(std::vector<std::filesystem::path> model_dirs = {});
    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    std::string select_backend(ComputeBackend requested, const core::LogFn& log) override;
    bool load_model(const std::string& model_name, const core::LogFn& log) override;
    TranscriptResult transcribe(const std::vector<float>& pcm,
                                const std::string& language,
                                const std::function<bool()>& cancelled) override;

    void set_threads(int n); // 0 = hardware concurrency

    // Devices registered with ggml (CPU, CUDA, Vulkan, ...).
    static std::vector<ComputeDevice> enumerate_devices();

private:
    struct State;
    std::unique_ptr<State> state_;
};
}
