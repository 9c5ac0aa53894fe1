#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "core/logging.hpp"

namespace media {

/**
 * @brief Metadata for one video, as reported by the downloader
 */
struct VideoEntry {
    std::string id;
    std::string title;
    std::string url;
};

/**
 * @brief A downloaded video with its transient 16 kHz mono WAV
 */
struct VideoItem {
    std::string video_id;
    std::string title;
    std::string url;
    std::filesystem::path audio_path;
};

using CancelCheck = std::function<bool()>;

/**
 * @brief Abstract audio source for transcription jobs
 *
 * Implementations:
 * - YtDlpDownloader (yt-dlp + ffmpeg subprocesses)
 */
class IAudioDownloader {
public:
    virtual ~IAudioDownloader() = default;

    /**
     * @brief Download the audio of a video or playlist
     * @param url Video or playlist URL
     * @param data_dir Directory for transient audio files
     * @param playlist Download every item of a playlist URL
     * @param log Job log
     * @param cancelled Checked between items
     * @return Items whose audio is ready (may be fewer than requested)
     * @throws std::runtime_error if the download fails outright
     */
    virtual std::vector<VideoItem> download(const std::string& url,
                                            const std::filesystem::path& data_dir,
                                            bool playlist,
                                            const core::LogFn& log,
                                            const CancelCheck& cancelled) = 0;
};

} // namespace media
