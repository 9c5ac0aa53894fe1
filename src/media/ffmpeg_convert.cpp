#include "media/ffmpeg_convert.hpp"
#include "audio/wav_reader.hpp"
#include "core/process.hpp"

namespace media {

std::vector<std::string> build_convert_args(const std::filesystem::path& input,
                                            const std::filesystem::path& output) {
    return {
        "-y",
        "-loglevel", "error",
        "-i", input.u8string(),
        "-ac", "1",
        "-ar", std::to_string(audio::kWhisperSampleRate),
        "-c:a", "pcm_s16le",
        output.u8string(),
    };
}

void convert_to_wav(const std::string& ffmpeg,
                    const std::filesystem::path& input,
                    const std::filesystem::path& output,
                    const core::LogFn& log) {
    if (std::filesystem::exists(output)) return;
    if (log) log("Converting to WAV: " + input.filename().u8string());
    core::run_command(ffmpeg, build_convert_args(input, output), log);
}

}
