#include "core/config.hpp"

#include <QSettings>
#include <QString>

namespace core {

namespace {
std::string read_string(QSettings& store, const char* key, const std::string& fallback) {
    return store.value(QString::fromLatin1(key), QString::fromStdString(fallback))
        .toString().trimmed().toStdString();
}

void write_string(QSettings& store, const char* key, const std::string& value) {
    store.setValue(QString::fromLatin1(key), QString::fromStdString(value).trimmed());
}
} // namespace

AppSettings load_settings(QSettings& store) {
    const AppSettings defaults;
    AppSettings s;
    s.ffmpeg_path = read_string(store, "paths/ffmpeg", defaults.ffmpeg_path);
    s.ytdlp_path  = read_string(store, "paths/ytdlp", defaults.ytdlp_path);
    s.output_dir  = read_string(store, "paths/output", defaults.output_dir);
    s.models_dir  = read_string(store, "paths/models", defaults.models_dir);
    s.theme       = read_string(store, "ui/theme", defaults.theme);
    s.model       = read_string(store, "transcribe/model", defaults.model);
    s.language    = read_string(store, "transcribe/language", defaults.language);
    s.backend     = read_string(store, "transcribe/backend", defaults.backend);

    if (s.theme != "light" && s.theme != "dark") s.theme = defaults.theme;
    if (s.model.empty()) s.model = defaults.model;
    if (s.language.empty()) s.language = defaults.language;
    if (s.backend.empty()) s.backend = defaults.backend;
    return s;
}

void save_settings(QSettings& store, const AppSettings& s) {
    write_string(store, "paths/ffmpeg", s.ffmpeg_path);
    write_string(store, "paths/ytdlp", s.ytdlp_path);
    write_string(store, "paths/output", s.output_dir);
    write_string(store, "paths/models", s.models_dir);
    write_string(store, "ui/theme", s.theme);
    write_string(store, "transcribe/model", s.model);
    write_string(store, "transcribe/language", s.language);
    write_string(store, "transcribe/backend", s.backend);
    store.sync();
}

std::string normalized_path(const std::string& value) {
    size_t a = value.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = value.find_last_not_of(" \t\r\n");
    return value.substr(a, b - a + 1);
}

}
