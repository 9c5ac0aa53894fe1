#include "asr/compute_backend.hpp"
#include <algorithm>
#include <cctype>

namespace asr {

namespace {
bool is_cuda(const ComputeDevice& d) {
    return d.is_gpu && d.name.compare(0, 4, "CUDA") == 0;
}

BackendChoice make_gpu_choice(ComputeBackend kind, int gpu_index, const ComputeDevice& dev) {
    BackendChoice c;
    c.kind = kind;
    c.use_gpu = true;
    c.gpu_index = gpu_index;
    if (kind == ComputeBackend::Cuda) {
        c.label = "CUDA";
    } else {
        c.label = "GPU (" + (dev.description.empty() ? dev.name : dev.description) + ")";
    }
    return c;
}

BackendChoice cpu_choice() {
    BackendChoice c;
    c.kind = ComputeBackend::Cpu;
    c.use_gpu = false;
    c.label = "CPU";
    return c;
}
} // namespace

std::string to_string(ComputeBackend backend) {
    switch (backend) {
        case ComputeBackend::Auto: return "auto";
        case ComputeBackend::Cuda: return "cuda";
        case ComputeBackend::Gpu:  return "gpu";
        case ComputeBackend::Cpu:  return "cpu";
    }
    return "auto";
}

bool parse_backend(const std::string& text, ComputeBackend& out) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "auto") out = ComputeBackend::Auto;
    else if (t == "cuda") out = ComputeBackend::Cuda;
    else if (t == "gpu") out = ComputeBackend::Gpu;
    else if (t == "cpu") out = ComputeBackend::Cpu;
    else return false;
    return true;
}

BackendChoice select_backend(ComputeBackend requested,
                             const std::vector<ComputeDevice>& devices,
                             const core::LogFn& log) {
    int cuda_index = -1, other_index = -1;
    const ComputeDevice* cuda_dev = nullptr;
    const ComputeDevice* other_dev = nullptr;
    int gpu_i = 0;
    for (const auto& d : devices) {
        if (!d.is_gpu) continue;
        if (is_cuda(d)) {
            if (!cuda_dev) { cuda_dev = &d; cuda_index = gpu_i; }
        } else if (!other_dev) {
            other_dev = &d;
            other_index = gpu_i;
        }
        ++gpu_i;
    }

    const bool want_cuda = requested == ComputeBackend::Auto || requested == ComputeBackend::Cuda;
    const bool want_other = requested == ComputeBackend::Auto || requested == ComputeBackend::Gpu;

    if (want_cuda && cuda_dev) {
        if (log) log("Using NVIDIA CUDA backend.");
        return make_gpu_choice(ComputeBackend::Cuda, cuda_index, *cuda_dev);
    }
    if (want_other && other_dev) {
        BackendChoice c = make_gpu_choice(ComputeBackend::Gpu, other_index, *other_dev);
        if (log) log("Using " + c.label + " backend.");
        return c;
    }
    if (requested == ComputeBackend::Cuda) {
        if (log) log("CUDA backend unavailable. Falling back to CPU backend.");
    } else if (requested == ComputeBackend::Gpu) {
        if (log) log("GPU backend unavailable. Falling back to CPU backend.");
    } else if (requested == ComputeBackend::Auto) {
        if (log) log("Falling back to CPU backend.");
    } else {
        if (log) log("Using CPU backend.");
    }
    return cpu_choice();
}

}
