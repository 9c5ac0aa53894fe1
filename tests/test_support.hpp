// Copyright (c) 2025 Transcriber
// In-process stand-ins for yt-dlp, ffmpeg and whisper used by the tests

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "app/transcription_pipeline.hpp"
#include "audio/wav_reader.hpp"

namespace test_support {

inline std::filesystem::path make_temp_dir(const std::string& tag) {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() /
               ("transcriber_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(dir);
    return dir;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

inline size_t count_files(const std::filesystem::path& dir) {
    size_t n = 0;
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

template <typename T>
void put_le(std::ofstream& f, T v) {
    f.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

// Canonical 44-byte-header PCM16 WAV. Extra chunk before "data" when asked.
inline void write_wav_pcm16(const std::filesystem::path& path,
                            const std::vector<int16_t>& interleaved,
                            int sample_rate,
                            int channels,
                            bool with_list_chunk = false) {
    std::ofstream f(path, std::ios::binary);
    const uint32_t data_bytes = static_cast<uint32_t>(interleaved.size() * sizeof(int16_t));
    const uint32_t list_bytes = with_list_chunk ? 8 + 4 : 0;
    f.write("RIFF", 4);
    put_le<uint32_t>(f, 36 + list_bytes + data_bytes);
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put_le<uint32_t>(f, 16);
    put_le<uint16_t>(f, 1);
    put_le<uint16_t>(f, static_cast<uint16_t>(channels));
    put_le<uint32_t>(f, static_cast<uint32_t>(sample_rate));
    put_le<uint32_t>(f, static_cast<uint32_t>(sample_rate * channels * 2));
    put_le<uint16_t>(f, static_cast<uint16_t>(channels * 2));
    put_le<uint16_t>(f, 16);
    if (with_list_chunk) {
        f.write("LIST", 4);
        put_le<uint32_t>(f, 4);
        f.write("INFO", 4);
    }
    f.write("data", 4);
    put_le<uint32_t>(f, data_bytes);
    f.write(reinterpret_cast<const char*>(interleaved.data()), data_bytes);
}

// Knobs and observations shared between a test and the fakes it installs.
struct FakeWorld {
    struct Video {
        std::string id;
        std::string title;
    };

    std::mutex mutex;
    std::vector<Video> videos;
    bool download_fails = false;
    bool tools_missing = false;
    bool model_load_fails = false;
    std::string backend_label = "CPU";
    std::string detected_language = "en";

    // Runs inside download(), e.g. to block or to flip a cancel flag.
    std::function<void()> on_download;
    // Runs inside transcribe() before it returns.
    std::function<void(const std::string& video_hint)> on_transcribe;

    // Observations
    std::vector<std::string> loaded_models;
    std::vector<std::string> languages_seen;
    std::vector<bool> playlist_flags;
    int transcribe_calls = 0;
};

class FakeDownloader : public media::IAudioDownloader {
public:
    explicit FakeDownloader(std::shared_ptr<FakeWorld> world) : world_(std::move(world)) {}

    std::vector<media::VideoItem> download(const std::string&,
                                           const std::filesystem::path& data_dir,
                                           bool playlist,
                                           const core::LogFn& log,
                                           const media::CancelCheck& cancelled) override {
        {
            std::lock_guard<std::mutex> lock(world_->mutex);
            world_->playlist_flags.push_back(playlist);
        }
        if (world_->on_download) world_->on_download();
        if (world_->download_fails) throw std::runtime_error("ERROR: Video unavailable");
        if (log) log("Downloading audio with fake downloader...");

        std::vector<media::VideoItem> items;
        for (const auto& v : world_->videos) {
            if (cancelled && cancelled()) break;
            media::VideoItem item;
            item.video_id = v.id;
            item.title = v.title;
            item.url = "https://www.youtube.com/watch?v=" + v.id;
            item.audio_path = data_dir / (v.id + ".16k.wav");
            // 0.25 s of a quiet ramp
            std::vector<int16_t> samples(audio::kWhisperSampleRate / 4);
            for (size_t i = 0; i < samples.size(); ++i) samples[i] = static_cast<int16_t>(i % 200);
            write_wav_pcm16(item.audio_path, samples, audio::kWhisperSampleRate, 1);
            items.push_back(item);
        }
        return items;
    }

private:
    std::shared_ptr<FakeWorld> world_;
};

class FakeRecognizer : public asr::ISpeechRecognizer {
public:
    explicit FakeRecognizer(std::shared_ptr<FakeWorld> world) : world_(std::move(world)) {}

    std::string select_backend(asr::ComputeBackend, const core::LogFn& log) override {
        if (log) log("Using " + world_->backend_label + " backend.");
        return world_->backend_label;
    }

    bool load_model(const std::string& model_name, const core::LogFn& log) override {
        if (log) log("Loading Whisper model: " + model_name);
        std::lock_guard<std::mutex> lock(world_->mutex);
        world_->loaded_models.push_back(model_name);
        return !world_->model_load_fails;
    }

    asr::TranscriptResult transcribe(const std::vector<float>& pcm,
                                     const std::string& language,
                                     const std::function<bool()>& cancelled) override {
        int call = 0;
        {
            std::lock_guard<std::mutex> lock(world_->mutex);
            world_->languages_seen.push_back(language);
            call = ++world_->transcribe_calls;
        }
        if (world_->on_transcribe) world_->on_transcribe(std::to_string(call));
        if (cancelled && cancelled()) throw asr::TranscriptionAborted();

        asr::TranscriptResult r;
        r.text = "  segment " + std::to_string(call) + " with " + std::to_string(pcm.size()) + " samples  ";
        r.language = language == "auto" ? world_->detected_language : language;
        r.segments.push_back(asr::TranscriptSegment{r.text, 0, 250});
        return r;
    }

private:
    std::shared_ptr<FakeWorld> world_;
};

// 2025-01-31T08:15:00Z
inline std::chrono::system_clock::time_point fixed_time() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1738311300));
}

inline app::PipelineServices fake_services(std::shared_ptr<FakeWorld> world) {
    app::PipelineServices s;
    s.resolve_tools = [world](const app::JobRequest&, const core::LogFn& log) {
        if (world->tools_missing) throw std::runtime_error("Missing required tool in PATH: ffmpeg.");
        if (log) log("Environment check passed.");
        return core::ToolPaths{"/usr/bin/ffmpeg", "/usr/bin/yt-dlp"};
    };
    s.make_downloader = [world](const core::ToolPaths&) -> std::unique_ptr<media::IAudioDownloader> {
        return std::make_unique<FakeDownloader>(world);
    };
    s.make_recognizer = [world](const app::JobRequest&) -> std::unique_ptr<asr::ISpeechRecognizer> {
        return std::make_unique<FakeRecognizer>(world);
    };
    s.load_audio = [](const std::filesystem::path& path, std::vector<float>& pcm) {
        return audio::load_pcm_f32_16k(path.u8string(), pcm);
    };
    s.now = [] { return fixed_time(); };
    return s;
}

inline app::JobRequest fake_request(const std::filesystem::path& root) {
    app::JobRequest r;
    r.url = "https://www.youtube.com/watch?v=abc123";
    r.model_name = "base";
    r.output_dir = (root / "transcripts").u8string();
    r.data_dir = (root / "data").u8string();
    return r;
}

} // namespace test_support
