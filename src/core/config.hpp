#pragma once
#include <string>

class QSettings;

namespace core {

// Persisted user settings. Empty tool paths mean "look up in PATH".
struct AppSettings {
    std::string ffmpeg_path;
    std::string ytdlp_path;
    std::string output_dir;
    std::string models_dir;
    std::string theme = "system";     // system, light, dark
    std::string model = "base";
    std::string language = "auto";
    std::string backend = "auto";
};

AppSettings load_settings(QSettings& store);
void save_settings(QSettings& store, const AppSettings& settings);

// Trimmed value, or empty if only whitespace.
std::string normalized_path(const std::string& value);
}
