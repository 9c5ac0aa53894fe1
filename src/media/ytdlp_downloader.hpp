#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <QJsonObject>

#include "core/tool_paths.hpp"
#include "media/audio_downloader.hpp"

namespace media {

/**
 * @brief Downloads audio with the yt-dlp CLI and normalizes it with ffmpeg
 */
class YtDlpDownloader : public IAudioDownloader {
public:
    explicit YtDlpDownloader(core::ToolPaths tools);

    std::vector<VideoItem> download(const std::string& url,
                                    const std::filesystem::path& data_dir,
                                    bool playlist,
                                    const core::LogFn& log,
                                    const CancelCheck& cancelled) override;

private:
    core::ToolPaths tools_;
};

// URL heuristics used when metadata is unavailable.
bool is_playlist_url(const std::string& url);

// Uses yt-dlp metadata when `info` is non-empty, the URL pattern otherwise.
bool detect_playlist(const QJsonObject& info, const std::string& url, const core::LogFn& log);

// Flatten yt-dlp metadata into one entry per video.
std::vector<VideoEntry> parse_entries(const QJsonObject& info, const std::string& fallback_url);

std::vector<std::string> build_info_args(const std::string& url, bool playlist);
std::vector<std::string> build_download_args(const std::string& url,
                                             const std::filesystem::path& data_dir,
                                             const std::string& ffmpeg,
                                             bool playlist);

// First `<id>.*` file in `dir` that is not a partial download or an
// already-normalized WAV. Empty path if none.
std::filesystem::path find_downloaded_file(const std::filesystem::path& dir, const std::string& video_id);

// Suffix of the normalized 16 kHz file written next to the download.
constexpr const char* kNormalizedSuffix = ".16k.wav";

} // namespace media
