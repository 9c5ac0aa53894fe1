#include "audio/wav_reader.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace audio {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1Size;
    uint16_t audioFormat; // 1=PCM, 3=float, 0xFFFE=extensible
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;
} // namespace

bool read_wav_mono(const std::string& path, std::vector<int16_t>& mono, WavInfo& info) {
    mono.clear();
    info = WavInfo{};

    std::ifstream f(std::filesystem::u8path(path), std::ios::binary);
    if (!f) return false;
    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) return false;
    if (std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0) return false;
    if (std::strncmp(hdr.fmt, "fmt ", 4) != 0 || hdr.subchunk1Size < 16) return false;
    if (hdr.numChannels == 0 || hdr.sampleRate == 0) return false;

    // ffmpeg writes WAVE_FORMAT_EXTENSIBLE for some layouts; the sub-format
    // GUID starts with the real format tag.
    uint16_t format = hdr.audioFormat;
    uint32_t fmtExtra = hdr.subchunk1Size - 16;
    if (format == kFormatExtensible && fmtExtra >= 10) {
        char ext[10];
        if (!f.read(ext, sizeof(ext))) return false;
        std::memcpy(&format, ext + 8, sizeof(format));
        fmtExtra -= sizeof(ext);
    }
    if (fmtExtra) f.seekg(fmtExtra, std::ios::cur);

    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) return false;
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        // chunks are word aligned
        f.seekg(chunkSize + (chunkSize & 1u), std::ios::cur);
    }
    if (!found) return false;

    // streamed WAVs may carry a bogus data size; never read past the end
    const std::streamoff dataStart = f.tellg();
    f.seekg(0, std::ios::end);
    const std::streamoff remaining = f.tellg() - dataStart;
    f.seekg(dataStart);
    if (remaining < 0) return false;
    if (static_cast<uint64_t>(remaining) < chunkSize) chunkSize = static_cast<uint32_t>(remaining);

    const size_t channels = hdr.numChannels;
    const size_t bytesPerSample = hdr.bitsPerSample / 8;
    if (bytesPerSample == 0) return false;
    const size_t frameCount = chunkSize / (bytesPerSample * channels);

    mono.resize(frameCount);
    if (format == kFormatPcm && hdr.bitsPerSample == 16) {
        std::vector<int16_t> buf(frameCount * channels);
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size() * sizeof(int16_t)));
        // a truncated data chunk (streamed WAV with a bogus size) keeps what was read
        const size_t got = static_cast<size_t>(f.gcount()) / (sizeof(int16_t) * channels);
        mono.resize(got);
        for (size_t i = 0; i < got; ++i) {
            int sum = 0;
            for (size_t c = 0; c < channels; ++c) {
                sum += buf[i * channels + c];
            }
            mono[i] = static_cast<int16_t>(sum / static_cast<int>(channels));
        }
    } else if (format == kFormatFloat && hdr.bitsPerSample == 32) {
        std::vector<float> buf(frameCount * channels);
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size() * sizeof(float)));
        const size_t got = static_cast<size_t>(f.gcount()) / (sizeof(float) * channels);
        mono.resize(got);
        for (size_t i = 0; i < got; ++i) {
            float sum = 0.0f;
            for (size_t c = 0; c < channels; ++c) {
                sum += buf[i * channels + c];
            }
            float v = sum / static_cast<float>(channels);
            v = std::clamp(v, -1.0f, 1.0f);
            mono[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
        }
    } else {
        mono.clear();
        return false; // unsupported
    }

    info.sample_rate = static_cast<int>(hdr.sampleRate);
    info.channels = hdr.numChannels;
    info.bits_per_sample = hdr.bitsPerSample;
    info.duration_seconds = static_cast<double>(mono.size()) / hdr.sampleRate;
    return true;
}

std::vector<int16_t> resample_to_16k(const std::vector<int16_t>& in, int in_hz) {
    const int target = kWhisperSampleRate;
    if (in_hz == target || in_hz <= 0 || in.empty()) return in;
    const double ratio = static_cast<double>(target) / static_cast<double>(in_hz);
    const size_t out_len = static_cast<size_t>(std::llround(in.size() * ratio));
    std::vector<int16_t> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in.size() - 1);
        size_t i1 = std::min(i0 + 1, in.size() - 1);
        double frac = src_pos - static_cast<double>(i0);
        double v = (1.0 - frac) * static_cast<double>(in[i0]) + frac * static_cast<double>(in[i1]);
        int vi = static_cast<int>(std::lrint(v));
        vi = std::clamp(vi, -32768, 32767);
        out[i] = static_cast<int16_t>(vi);
    }
    return out;
}

bool load_pcm_f32_16k(const std::string& path, std::vector<float>& out) {
    std::vector<int16_t> mono;
    WavInfo info;
    if (!read_wav_mono(path, mono, info)) return false;
    if (info.sample_rate != kWhisperSampleRate) {
        mono = resample_to_16k(mono, info.sample_rate);
    }
    out.clear();
    out.reserve(mono.size());
    constexpr float scale = 1.0f / 32768.0f;
    for (int16_t s : mono) {
        out.push_back(static_cast<float>(s) * scale);
    }
    return true;
}

}
