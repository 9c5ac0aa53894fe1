#pragma once
#include <string>

#include "core/logging.hpp"

namespace core {

struct ToolPaths {
    std::string ffmpeg;
    std::string ytdlp;
};

// PATH lookup; empty if not found.
std::string find_executable(const std::string& name);

/// Resolve ffmpeg and yt-dlp. A non-empty configured path must exist and
/// takes precedence over PATH.
/// @throws std::runtime_error when a configured path is missing or a tool
///         cannot be found at all
ToolPaths ensure_environment(const std::string& ffmpeg_path,
                             const std::string& ytdlp_path,
                             const LogFn& log);
}
