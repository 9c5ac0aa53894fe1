#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "core/logging.hpp"

namespace media {

std::vector<std::string> build_convert_args(const std::filesystem::path& input,
                                            const std::filesystem::path& output);

// Convert any audio file to 16 kHz mono PCM16 WAV. No-op if `output` exists.
// Throws core::ProcessError on ffmpeg failure.
void convert_to_wav(const std::string& ffmpeg,
                    const std::filesystem::path& input,
                    const std::filesystem::path& output,
                    const core::LogFn& log);
}
