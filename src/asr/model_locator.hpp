#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace asr {

// File names tried for a bare model name such as "base" or "small.en".
std::vector<std::string> model_file_candidates(const std::string& model_name);

// Resolve a model name or path against the search directories.
// Returns an empty path if nothing exists.
std::filesystem::path resolve_model_path(const std::string& model_name,
                                         const std::vector<std::filesystem::path>& search_dirs);

}
