#include "asr/whisper_backend.hpp"
#include "asr/model_locator.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "ggml-backend.h"
#include "whisper.h"

#include "core/logging.hpp"

namespace {
// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
    case GGML_LOG_LEVEL_WARN:
        std::fputs(text, stderr);
        break;
    case GGML_LOG_LEVEL_INFO:
    case GGML_LOG_LEVEL_DEBUG:
    default:
        if (core::debug_enabled()) std::fputs(text, stderr);
        break;
    }
}

void trim(std::string& x) {
    size_t a = x.find_first_not_of(" \t\r\n");
    size_t b = x.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) { x.clear(); return; }
    x = x.substr(a, b - a + 1);
}

// Whisper emits bracketed markers for silence and music.
bool is_non_speech(const std::string& s) {
    if (s == "[BLANK_AUDIO]" || s == "[ Silence ]" || s == "[silence]") return true;
    return s.size() > 2 && s.front() == '[' && s.back() == ']' &&
           s.find('[', 1) == std::string::npos;
}

bool call_cancel_check(void* user_data) {
    const auto* check = static_cast<const std::function<bool()>*>(user_data);
    return check && *check && (*check)();
}
} // anonymous namespace

namespace asr {

struct WhisperBackend::State {
    std::vector<std::filesystem::path> model_dirs;
    whisper_context* ctx = nullptr;
    whisper_state* state = nullptr;
    std::string model_name;
    unsigned n_threads = 0; // 0 = auto
    BackendChoice backend;

    void release() {
        if (state) whisper_free_state(state);
        if (ctx) whisper_free(ctx);
        state = nullptr;
        ctx = nullptr;
        model_name.clear();
    }
};

WhisperBackend::WhisperBackend(std::vector<std::filesystem::path> model_dirs)
    : state_(std::make_unique<State>()) {
    state_->model_dirs = std::move(model_dirs);
    // Set logging verbosity before creating context to suppress init spam when not verbose
    whisper_log_set(log_cb, nullptr);
}

WhisperBackend::~WhisperBackend() {
    state_->release();
}

std::vector<ComputeDevice> WhisperBackend::enumerate_devices() {
    ggml_backend_load_all();
    std::vector<ComputeDevice> devices;
    const size_t n = ggml_backend_dev_count();
    for (size_t i = 0; i < n; ++i) {
        ggml_backend_dev_t dev = ggml_backend_dev_get(i);
        ComputeDevice d;
        d.name = ggml_backend_dev_name(dev);
        d.description = ggml_backend_dev_description(dev);
        d.is_gpu = ggml_backend_dev_type(dev) == GGML_BACKEND_DEVICE_TYPE_GPU;
        core::log_debug("[whisper] device " + d.name + ": " + d.description);
        devices.push_back(d);
    }
    return devices;
}

std::string WhisperBackend::select_backend(ComputeBackend requested, const core::LogFn& log) {
    state_->backend = asr::select_backend(requested, enumerate_devices(), log);
    return state_->backend.label;
}

bool WhisperBackend::load_model(const std::string& model_name, const core::LogFn& log) {
    if (state_->ctx && state_->model_name == model_name) return true;
    state_->release();

    if (log) log("Loading Whisper model: " + model_name);
    const std::filesystem::path path = resolve_model_path(model_name, state_->model_dirs);
    if (path.empty()) {
        std::string where;
        for (const auto& d : state_->model_dirs) {
            if (!where.empty()) where += ", ";
            where += d.u8string();
        }
        if (log) log("Model file for '" + model_name + "' not found (searched: " + where + ").");
        core::log_error("[whisper] no model file for " + model_name);
        return false;
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = state_->backend.use_gpu;
    cparams.gpu_device = state_->backend.gpu_index;
    std::cerr << "[whisper] init from: " << path.u8string() << "\n";
    state_->ctx = whisper_init_from_file_with_params(path.u8string().c_str(), cparams);
    if (!state_->ctx) {
        std::cerr << "[whisper] init FAILED for path: " << path.u8string() << "\n";
        return false;
    }
    std::cerr << "[whisper] init OK: " << path.u8string() << "\n";
    if (core::debug_enabled()) {
        std::cerr << "[whisper] system: " << whisper_print_system_info() << "\n";
    }
    // allocate persistent state for repeated calls across playlist items
    state_->state = whisper_init_state(state_->ctx);
    if (!state_->state) {
        state_->release();
        return false;
    }
    state_->model_name = model_name;
    return true;
}

TranscriptResult WhisperBackend::transcribe(const std::vector<float>& pcm,
                                            const std::string& language,
                                            const std::function<bool()>& cancelled) {
    if (!state_->ctx || !state_->state) {
        throw std::runtime_error("Whisper model is not loaded");
    }
    TranscriptResult result;
    if (pcm.empty()) return result;

    const bool auto_detect = language.empty() || language == "auto";
    if (!auto_detect && whisper_lang_id(language.c_str()) < 0) {
        throw std::runtime_error("Unknown language code: " + language);
    }

    const bool verbose = core::debug_enabled();
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = verbose;
    wparams.print_timestamps = verbose;
    wparams.print_special    = false;
    wparams.translate        = false;
    wparams.language         = auto_detect ? "auto" : language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = (state_->n_threads == 0)
                                   ? static_cast<int>(std::max(1u, std::thread::hardware_concurrency()))
                                   : static_cast<int>(state_->n_threads);
    wparams.offset_ms        = 0;
    wparams.duration_ms      = 0; // process all
    wparams.token_timestamps = false;

    // Allow aborting inference when the user cancels
    wparams.abort_callback = call_cancel_check;
    wparams.abort_callback_user_data = const_cast<std::function<bool()>*>(&cancelled);

    if (verbose) {
        wparams.progress_callback = [](whisper_context*, whisper_state*, int progress, void*) {
            std::cerr << "[whisper] progress: " << progress << "%\n";
        };
        std::cerr << "[whisper] running on samples=" << pcm.size() << ", threads=" << wparams.n_threads << "\n";
    }

    const int ret = whisper_full_with_state(state_->ctx, state_->state, wparams, pcm.data(), static_cast<int>(pcm.size()));
    if (cancelled && cancelled()) {
        throw TranscriptionAborted();
    }
    if (ret != 0) {
        std::cerr << "[whisper] whisper_full FAILED, ret=" << ret << "\n";
        throw std::runtime_error("Whisper transcription failed (code " + std::to_string(ret) + ")");
    }

    const int n = whisper_full_n_segments_from_state(state_->state);
    if (verbose) std::cerr << "[whisper] segments=" << n << "\n";
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(state_->state, i);
        if (!txt) continue;
        std::string s(txt);
        trim(s);
        if (s.empty() || is_non_speech(s)) continue;

        TranscriptSegment seg;
        seg.text = s;
        // whisper timestamps are in 10 ms units
        seg.t0_ms = whisper_full_get_segment_t0_from_state(state_->state, i) * 10;
        seg.t1_ms = whisper_full_get_segment_t1_from_state(state_->state, i) * 10;
        if (!result.text.empty()) result.text += ' ';
        result.text += s;
        result.segments.push_back(std::move(seg));
    }

    const int lang_id = whisper_full_lang_id_from_state(state_->state);
    if (lang_id >= 0) {
        result.language = whisper_lang_str(lang_id);
    } else if (!auto_detect) {
        result.language = language;
    }
    if (verbose) whisper_print_timings(state_->ctx);
    return result;
}

void WhisperBackend::set_threads(int n) {
    if (n <= 0) {
        state_->n_threads = 0;
    } else {
        state_->n_threads = static_cast<unsigned>(n);
    }
}

} // namespace asr
