#include "asr/model_locator.hpp"

namespace asr {

namespace {
bool has_model_ext(const std::string& name) {
    return name.find(".gguf") != std::string::npos || name.find(".bin") != std::string::npos;
}
}

std::vector<std::string> model_file_candidates(const std::string& model_name) {
    if (has_model_ext(model_name)) return {model_name};
    return {
        "ggml-" + model_name + ".bin",
        model_name + ".bin",
        "ggml-" + model_name + ".gguf",
        model_name + ".gguf",
        "ggml-" + model_name + "-q5_1.bin",
    };
}

std::filesystem::path resolve_model_path(const std::string& model_name,
                                         const std::vector<std::filesystem::path>& search_dirs) {
    std::error_code ec;
    const auto direct = std::filesystem::u8path(model_name);
    if (has_model_ext(model_name) && std::filesystem::is_regular_file(direct, ec)) return direct;

    for (const auto& dir : search_dirs) {
        if (dir.empty()) continue;
        for (const auto& file : model_file_candidates(model_name)) {
            const auto candidate = dir / std::filesystem::u8path(file);
            if (std::filesystem::is_regular_file(candidate, ec)) return candidate;
        }
    }
    return {};
}

}
