// Copyright (c) 2025 Transcriber
// Application API - transcription job body

#include "app/transcription_pipeline.hpp"
#include "output/markdown_writer.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

namespace app {

namespace {

// Empties the data directory when the job leaves the pipeline, whatever the outcome.
class DataDirCleanup {
public:
    DataDirCleanup(std::filesystem::path dir, const core::LogFn& log)
        : dir_(std::move(dir)), log_(log) {}
    ~DataDirCleanup() {
        output::cleanup_data(dir_, log_);
    }

    DataDirCleanup(const DataDirCleanup&) = delete;
    DataDirCleanup& operator=(const DataDirCleanup&) = delete;

private:
    std::filesystem::path dir_;
    const core::LogFn& log_;
};

std::filesystem::path dir_or_default(const std::string& configured, const char* fallback) {
    std::string trimmed = configured;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\r\n"));
    trimmed.erase(trimmed.find_last_not_of(" \t\r\n") + 1);
    if (!trimmed.empty()) return std::filesystem::u8path(trimmed);
    return std::filesystem::current_path() / fallback;
}

void ensure_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + dir.u8string() + ": " + ec.message());
    }
}

} // namespace

std::string normalize_language(const std::string& language) {
    std::string out;
    for (unsigned char c : language) {
        if (!std::isspace(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out.empty() ? "auto" : out;
}

JobResult run_transcription(const JobRequest& request,
                            const PipelineServices& services,
                            const JobEvents& events,
                            const std::function<bool()>& cancelled) {
    const core::LogFn& log = events.log;
    auto is_cancelled = [&cancelled]() { return cancelled && cancelled(); };

    const std::string language = normalize_language(request.language);
    const core::ToolPaths tools = services.resolve_tools(request, log);

    asr::ComputeBackend requested = asr::ComputeBackend::Auto;
    if (!asr::parse_backend(request.backend, requested)) {
        if (log) log("Unknown backend '" + request.backend + "', using auto.");
    }
    std::unique_ptr<asr::ISpeechRecognizer> recognizer = services.make_recognizer(request);
    const std::string backend_name = recognizer->select_backend(requested, log);
    if (events.backend) events.backend(backend_name);

    const std::filesystem::path data_dir = dir_or_default(request.data_dir, "data");
    const std::filesystem::path transcripts_dir = dir_or_default(request.output_dir, "transcripts");
    ensure_dir(data_dir);
    ensure_dir(transcripts_dir);
    DataDirCleanup cleanup(data_dir, log);

    std::unique_ptr<media::IAudioDownloader> downloader = services.make_downloader(tools);
    const std::vector<media::VideoItem> items =
        downloader->download(request.url, data_dir, request.playlist, log, is_cancelled);
    if (items.empty()) {
        if (is_cancelled()) {
            if (log) log("Cancelled before transcription.");
            return JobResult{JobResult::State::CANCELLED, "Cancelled", {}};
        }
        throw std::runtime_error("No audio files were downloaded.");
    }

    JobResult result;
    if (is_cancelled()) {
        if (log) log("Cancelled before transcription.");
        result.state = JobResult::State::CANCELLED;
        result.message = "Cancelled";
        return result;
    }

    if (!recognizer->load_model(request.model_name, log)) {
        throw std::runtime_error("Failed to load Whisper model: " + request.model_name);
    }

    const int total = static_cast<int>(items.size());
    for (int index = 1; index <= total; ++index) {
        const media::VideoItem& item = items[index - 1];
        if (is_cancelled()) {
            if (log) log("Cancellation detected. Stopping further processing.");
            break;
        }

        if (events.progress) events.progress(index - 1, total);
        if (log) log("Transcribing " + item.video_id + " (" + std::to_string(index) + "/" + std::to_string(total) + ")...");

        std::vector<float> pcm;
        if (!services.load_audio(item.audio_path, pcm)) {
            throw std::runtime_error("Cannot read audio for " + item.video_id + ": " + item.audio_path.u8string());
        }

        asr::TranscriptResult transcript;
        try {
            transcript = recognizer->transcribe(pcm, language, is_cancelled);
        } catch (const asr::TranscriptionAborted&) {
            if (log) log("Cancellation detected. Stopping further processing.");
            break;
        }

        result.transcripts.push_back(
            output::write_transcript(transcripts_dir, item, transcript, request.model_name, services.now()));

        std::error_code ec;
        std::filesystem::remove(item.audio_path, ec);

        if (events.progress) events.progress(index, total);
        if (log) log("Saved transcript for " + item.video_id + ".");
    }

    if (is_cancelled()) {
        result.state = JobResult::State::CANCELLED;
        result.message = "Cancelled";
    } else {
        result.state = JobResult::State::COMPLETED;
        result.message = "Completed";
    }
    return result;
}

} // namespace app
