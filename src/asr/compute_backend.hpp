#pragma once
#include <string>
#include <vector>

#include "core/logging.hpp"

namespace asr {

enum class ComputeBackend {
    Auto,   // best available
    Cuda,   // NVIDIA CUDA
    Gpu,    // any other GPU backend (Vulkan, Metal, SYCL)
    Cpu
};

std::string to_string(ComputeBackend backend);
// Accepts auto, cuda, gpu, cpu (case-insensitive). False if unknown.
bool parse_backend(const std::string& text, ComputeBackend& out);

struct ComputeDevice {
    std::string name;          // ggml device name, e.g. "CUDA0", "Vulkan0", "CPU"
    std::string description;   // human readable
    bool is_gpu = false;
};

struct BackendChoice {
    ComputeBackend kind = ComputeBackend::Cpu;
    bool use_gpu = false;
    int gpu_index = 0;         // index among GPU devices only
    std::string label;         // shown in the UI
};

/// Pick the compute device for inference. Auto prefers CUDA, then any other
/// GPU, then CPU. An explicit request that cannot be met falls back to CPU.
BackendChoice select_backend(ComputeBackend requested,
                             const std::vector<ComputeDevice>& devices,
                             const core::LogFn& log);

}
