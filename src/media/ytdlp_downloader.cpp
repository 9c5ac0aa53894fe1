#include "media/ytdlp_downloader.hpp"
#include "media/ffmpeg_convert.hpp"
#include "core/process.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

#include <QJsonArray>
#include <QJsonValue>

namespace media {

namespace {
std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string json_string(const QJsonObject& obj, const char* key) {
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isString()) return v.toString().trimmed().toStdString();
    return {};
}

VideoEntry entry_from_json(const QJsonObject& obj, const std::string& fallback_url) {
    VideoEntry e;
    e.id = json_string(obj, "id");
    if (e.id.empty()) e.id = "unknown";
    e.title = json_string(obj, "title");
    if (e.title.empty()) e.title = e.id;
    e.url = json_string(obj, "webpage_url");
    if (e.url.empty()) {
        // flat playlist entries carry the watch URL in "url"
        std::string u = json_string(obj, "url");
        if (starts_with(u, "http://") || starts_with(u, "https://")) e.url = u;
    }
    if (e.url.empty()) e.url = fallback_url;
    return e;
}

// yt-dlp output worth showing in the job log; the rest goes to debug.
bool is_progress_line(const std::string& line) {
    return starts_with(line, "[download] Downloading item") ||
           starts_with(line, "[download] Downloading playlist") ||
           starts_with(line, "[ExtractAudio] Destination") ||
           starts_with(line, "ERROR:");
}
} // namespace

bool is_playlist_url(const std::string& url) {
    static const char* indicators[] = {"list=", "/playlist", "/playlists/", "playlist?"};
    const std::string lower = to_lower(url);
    for (const char* ind : indicators) {
        if (lower.find(ind) != std::string::npos) return true;
    }
    return false;
}

bool detect_playlist(const QJsonObject& info, const std::string& url, const core::LogFn& log) {
    if (!info.isEmpty()) {
        const bool is_playlist = json_string(info, "_type") == "playlist";
        if (log) {
            if (is_playlist) {
                log("Detected playlist with " +
                    std::to_string(info.value(QLatin1String("entries")).toArray().size()) + " items");
            } else {
                log("Detected single video");
            }
        }
        return is_playlist;
    }
    const bool is_playlist = is_playlist_url(url);
    if (is_playlist && log) log("Detected playlist from URL pattern");
    return is_playlist;
}

std::vector<VideoEntry> parse_entries(const QJsonObject& info, const std::string& fallback_url) {
    std::vector<VideoEntry> out;
    const QJsonValue entries = info.value(QLatin1String("entries"));
    if (entries.isArray()) {
        for (const QJsonValue& v : entries.toArray()) {
            if (!v.isObject()) continue; // unavailable items come back as null
            out.push_back(entry_from_json(v.toObject(), fallback_url));
        }
        return out;
    }
    out.push_back(entry_from_json(info, fallback_url));
    return out;
}

std::vector<std::string> build_info_args(const std::string& url, bool playlist) {
    return {
        "--flat-playlist",
        "--dump-single-json",
        playlist ? "--yes-playlist" : "--no-playlist",
        url,
    };
}

std::vector<std::string> build_download_args(const std::string& url,
                                             const std::filesystem::path& data_dir,
                                             const std::string& ffmpeg,
                                             bool playlist) {
    std::vector<std::string> args = {
        "-x",
        "--audio-format", "wav",
        "--audio-quality", "0",
        "--newline",
        "--ffmpeg-location", ffmpeg,
        "-o", (data_dir / "%(id)s.%(ext)s").u8string(),
    };
    if (playlist) {
        args.push_back("--yes-playlist");
        args.push_back("--ignore-errors");
    } else {
        args.push_back("--no-playlist");
    }
    args.push_back(url);
    return args;
}

std::filesystem::path find_downloaded_file(const std::filesystem::path& dir, const std::string& video_id) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) return {};
    const std::string prefix = video_id + ".";
    std::vector<std::filesystem::path> matches;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        const std::string name = entry.path().filename().u8string();
        if (!starts_with(name, prefix)) continue;
        if (ends_with(name, kNormalizedSuffix) || ends_with(name, ".part") || ends_with(name, ".ytdl")) continue;
        matches.push_back(entry.path());
    }
    if (matches.empty()) return {};
    std::sort(matches.begin(), matches.end());
    return matches.front();
}

YtDlpDownloader::YtDlpDownloader(core::ToolPaths tools)
    : tools_(std::move(tools)) {
}

std::vector<VideoItem> YtDlpDownloader::download(const std::string& url,
                                                 const std::filesystem::path& data_dir,
                                                 bool playlist,
                                                 const core::LogFn& log,
                                                 const CancelCheck& cancelled) {
    QJsonObject info;
    try {
        info = core::run_json(tools_.ytdlp, build_info_args(url, playlist), log, cancelled);
    } catch (const core::ProcessCancelled&) {
        if (log) log("Download cancelled.");
        return {};
    } catch (const std::exception& e) {
        if (log) log(std::string("Could not read video metadata: ") + e.what());
    }
    const bool is_playlist = detect_playlist(info, url, log);
    if (is_playlist && !playlist && log) {
        log("URL points to a playlist; enable Playlist to download every item.");
    }

    if (log) log("Downloading audio with yt-dlp...");
    auto on_line = [&log](const std::string& line) {
        core::log_debug("[yt-dlp] " + line);
        if (log && is_progress_line(line)) log(line);
    };
    core::CommandResult result;
    try {
        result = core::run_command(tools_.ytdlp, build_download_args(url, data_dir, tools_.ffmpeg, playlist),
                                   log, on_line, false, cancelled);
    } catch (const core::ProcessCancelled&) {
        // partial files are left for the job's data-dir cleanup
        if (log) log("Download cancelled.");
        return {};
    }
    if (result.exit_code != 0) {
        std::string message = trim(result.stderr_text);
        if (message.empty()) message = "yt-dlp exited with code " + std::to_string(result.exit_code);
        if (!(playlist && is_playlist)) {
            throw core::ProcessError(message, result.exit_code);
        }
        if (log) log("yt-dlp reported errors for some playlist items; continuing with the rest.");
        core::log_warn(message);
    }

    std::vector<VideoEntry> entries;
    if (!info.isEmpty()) {
        entries = parse_entries(info, url);
    } else {
        // no metadata: every downloaded file is one video named by its id
        std::error_code ec;
        for (const auto& f : std::filesystem::directory_iterator(data_dir, ec)) {
            const std::string name = f.path().filename().u8string();
            if (!f.is_regular_file(ec) || ends_with(name, kNormalizedSuffix) || ends_with(name, ".part")) continue;
            VideoEntry e;
            e.id = f.path().stem().u8string();
            e.title = e.id;
            e.url = url;
            entries.push_back(e);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const VideoEntry& a, const VideoEntry& b) { return a.id < b.id; });
    }

    std::vector<VideoItem> items;
    for (const auto& entry : entries) {
        if (cancelled && cancelled()) break;
        std::filesystem::path raw = data_dir / (entry.id + ".wav");
        if (!std::filesystem::exists(raw)) raw = find_downloaded_file(data_dir, entry.id);
        if (raw.empty()) {
            if (log) log("Skipping " + entry.id + ": downloaded file not found.");
            continue;
        }
        const std::filesystem::path wav = data_dir / (entry.id + kNormalizedSuffix);
        convert_to_wav(tools_.ffmpeg, raw, wav, log);
        std::error_code ec;
        std::filesystem::remove(raw, ec);
        if (ec) core::log_warn("Could not remove " + raw.u8string() + ": " + ec.message());

        VideoItem item;
        item.video_id = entry.id;
        item.title = entry.title;
        item.url = entry.url;
        item.audio_path = wav;
        items.push_back(item);
    }
    return items;
}

} // namespace media
