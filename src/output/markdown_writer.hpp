#pragma once
#include <chrono>
#include <filesystem>
#include <string>

#include "asr/speech_recognizer.hpp"
#include "core/logging.hpp"
#include "media/audio_downloader.hpp"

namespace output {

// Strip characters not allowed in file names, trim, drop trailing dots and
// cap the length at 120 characters without splitting a UTF-8 sequence.
std::string sanitize_filename(const std::string& title);

// <dir>/<safe title>.md, then -1 .. -999 suffixes, then <dir>/<video id>.md.
std::filesystem::path build_output_path(const std::filesystem::path& dir,
                                        const std::string& title,
                                        const std::string& video_id);

// ISO-8601 UTC with seconds precision, e.g. 2025-01-31T08:15:00+00:00
std::string format_utc_timestamp(std::chrono::system_clock::time_point t);

std::string render_transcript(const media::VideoItem& item,
                              const asr::TranscriptResult& result,
                              const std::string& model_name,
                              const std::string& timestamp);

/// Write one Markdown transcript and return its path.
/// @throws std::runtime_error if the file cannot be written
std::filesystem::path write_transcript(const std::filesystem::path& dir,
                                       const media::VideoItem& item,
                                       const asr::TranscriptResult& result,
                                       const std::string& model_name,
                                       std::chrono::system_clock::time_point now);

// Delete regular files in the data directory. Never throws.
void cleanup_data(const std::filesystem::path& data_dir, const core::LogFn& log);

}
