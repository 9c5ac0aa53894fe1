// Copyright (c) 2025 Transcriber
// Application API - single transcription job body
//
// Download -> model load -> transcribe -> Markdown, one video at a time.
// External tools, the model and the clock are reached through
// PipelineServices so tests can replace them.

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "asr/speech_recognizer.hpp"
#include "core/logging.hpp"
#include "core/tool_paths.hpp"
#include "media/audio_downloader.hpp"

namespace app {

/// One transcription job: a video or playlist URL and how to process it
struct JobRequest {
    std::string url;
    std::string language = "auto";                 ///< "auto" or a language code
    std::string model_name = "base";               ///< Whisper model: tiny, base, small, medium, large-v3
    std::string backend = "auto";                  ///< auto, cuda, gpu, cpu
    bool playlist = false;                         ///< Download every item of a playlist URL
    std::string ffmpeg_path;                       ///< Empty = PATH lookup
    std::string ytdlp_path;                        ///< Empty = PATH lookup
    std::string output_dir;                        ///< Empty = <cwd>/transcripts
    std::string data_dir;                          ///< Empty = <cwd>/data
    std::string models_dir;                        ///< Extra directory searched for ggml models
    int threads = 0;                               ///< 0 = hardware concurrency
};

/// Terminal state of a job
struct JobResult {
    enum class State {
        COMPLETED,
        CANCELLED,
        FAILED
    };

    State state = State::COMPLETED;
    std::string message;
    std::vector<std::filesystem::path> transcripts;  ///< Files written, in order
};

/// Events emitted while the job runs (all optional)
struct JobEvents {
    core::LogFn log;
    std::function<void(int current, int total)> progress;
    std::function<void(const std::string& name)> backend;
};

/// External collaborators of a job
struct PipelineServices {
    std::function<core::ToolPaths(const JobRequest&, const core::LogFn&)> resolve_tools;
    std::function<std::unique_ptr<media::IAudioDownloader>(const core::ToolPaths&)> make_downloader;
    std::function<std::unique_ptr<asr::ISpeechRecognizer>(const JobRequest&)> make_recognizer;
    std::function<bool(const std::filesystem::path&, std::vector<float>&)> load_audio;
    std::function<std::chrono::system_clock::time_point()> now;
};

/// yt-dlp, ffmpeg, whisper.cpp and the system clock.
/// @param extra_model_dirs Searched after JobRequest::models_dir and ./models
PipelineServices default_pipeline_services(std::vector<std::filesystem::path> extra_model_dirs = {});

/// Trimmed, lower-cased; empty becomes "auto".
std::string normalize_language(const std::string& language);

/// Run one job to completion on the calling thread.
/// @return COMPLETED or CANCELLED
/// @throws std::runtime_error on any failure (missing tool, download,
///         model load, write); the caller reports it
JobResult run_transcription(const JobRequest& request,
                            const PipelineServices& services,
                            const JobEvents& events,
                            const std::function<bool()>& cancelled);

} // namespace app
