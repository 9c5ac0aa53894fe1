// Copyright (c) 2025 Transcriber
// Production wiring of the transcription pipeline

#include "app/transcription_pipeline.hpp"
#include "asr/whisper_backend.hpp"
#include "audio/wav_reader.hpp"
#include "media/ytdlp_downloader.hpp"

namespace app {

PipelineServices default_pipeline_services(std::vector<std::filesystem::path> extra_model_dirs) {
    PipelineServices s;
    s.resolve_tools = [](const JobRequest& req, const core::LogFn& log) {
        return core::ensure_environment(req.ffmpeg_path, req.ytdlp_path, log);
    };
    s.make_downloader = [](const core::ToolPaths& tools) -> std::unique_ptr<media::IAudioDownloader> {
        return std::make_unique<media::YtDlpDownloader>(tools);
    };
    s.make_recognizer = [extra_model_dirs](const JobRequest& req) -> std::unique_ptr<asr::ISpeechRecognizer> {
        std::vector<std::filesystem::path> dirs;
        if (!req.models_dir.empty()) dirs.push_back(std::filesystem::u8path(req.models_dir));
        dirs.push_back("models");
        dirs.insert(dirs.end(), extra_model_dirs.begin(), extra_model_dirs.end());
        auto whisper = std::make_unique<asr::WhisperBackend>(std::move(dirs));
        whisper->set_threads(req.threads);
        return whisper;
    };
    s.load_audio = [](const std::filesystem::path& path, std::vector<float>& pcm) {
        return audio::load_pcm_f32_16k(path.u8string(), pcm);
    };
    s.now = [] { return std::chrono::system_clock::now(); };
    return s;
}

} // namespace app
