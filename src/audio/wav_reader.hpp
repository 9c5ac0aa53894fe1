#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

constexpr int kWhisperSampleRate = 16000;

// Basic file info for reporting
struct WavInfo {
    int sample_rate = 0;
    int channels = 0;
    int bits_per_sample = 0;
    double duration_seconds = 0.0;
};

// Decode a PCM16 or float32 WAV file and downmix to mono PCM16 at the
// file's own sample rate. Returns false on unreadable/unsupported input.
bool read_wav_mono(const std::string& path, std::vector<int16_t>& mono, WavInfo& info);

// Linear interpolation to 16 kHz.
std::vector<int16_t> resample_to_16k(const std::vector<int16_t>& in, int in_hz);

// Whisper input: mono float [-1, 1] at 16 kHz.
bool load_pcm_f32_16k(const std::string& path, std::vector<float>& out);

}
