#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "media/ffmpeg_convert.hpp"
#include "media/ytdlp_downloader.hpp"
#include "../test_support.hpp"

static QJsonObject parse(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

static void test_playlist_urls() {
    assert(media::is_playlist_url("https://www.youtube.com/playlist?list=PL123"));
    assert(media::is_playlist_url("https://www.youtube.com/watch?v=abc&list=PL123"));
    assert(media::is_playlist_url("https://www.youtube.com/@chan/playlists/"));
    assert(media::is_playlist_url("https://example.com/PLAYLIST?id=1"));
    assert(!media::is_playlist_url("https://www.youtube.com/watch?v=abc123"));
    assert(!media::is_playlist_url("https://youtu.be/abc123"));
}

static void test_detect_playlist() {
    std::vector<std::string> lines;
    auto log = [&](const std::string& l) { lines.push_back(l); };

    const QJsonObject playlist = parse(R"({"_type":"playlist","entries":[{"id":"a"},{"id":"b"},null]})");
    assert(media::detect_playlist(playlist, "https://youtu.be/x", log));
    assert(lines.back() == "Detected playlist with 3 items");

    const QJsonObject video = parse(R"({"id":"abc","title":"T"})");
    assert(!media::detect_playlist(video, "https://www.youtube.com/watch?v=abc&list=PL1", log));
    assert(lines.back() == "Detected single video");

    // Without metadata the URL decides
    assert(media::detect_playlist(QJsonObject(), "https://www.youtube.com/playlist?list=PL1", log));
    assert(lines.back() == "Detected playlist from URL pattern");
    assert(!media::detect_playlist(QJsonObject(), "https://youtu.be/abc", {}));
}

static void test_parse_entries() {
    const QJsonObject video = parse(
        R"({"id":"abc123","title":"  My Talk ","webpage_url":"https://www.youtube.com/watch?v=abc123"})");
    auto single = media::parse_entries(video, "https://fallback");
    assert(single.size() == 1);
    assert(single[0].id == "abc123");
    assert(single[0].title == "My Talk");
    assert(single[0].url == "https://www.youtube.com/watch?v=abc123");

    const QJsonObject playlist = parse(R"({
        "_type": "playlist",
        "entries": [
            {"id": "one", "title": "First", "url": "https://www.youtube.com/watch?v=one"},
            null,
            {"id": "two", "url": "two"},
            {"title": "No id"}
        ]})");
    auto entries = media::parse_entries(playlist, "https://www.youtube.com/playlist?list=PL1");
    assert(entries.size() == 3);
    assert(entries[0].id == "one" && entries[0].title == "First");
    assert(entries[0].url == "https://www.youtube.com/watch?v=one");
    // Title falls back to id, non-URL "url" falls back to the request URL
    assert(entries[1].id == "two" && entries[1].title == "two");
    assert(entries[1].url == "https://www.youtube.com/playlist?list=PL1");
    assert(entries[2].id == "unknown" && entries[2].title == "No id");
}

static void test_command_lines() {
    const auto info = media::build_info_args("https://u", false);
    assert((info == std::vector<std::string>{"--flat-playlist", "--dump-single-json", "--no-playlist", "https://u"}));
    assert(media::build_info_args("https://u", true)[2] == "--yes-playlist");

    const std::filesystem::path dir = "data";
    const auto single = media::build_download_args("https://u", dir, "/usr/bin/ffmpeg", false);
    const std::vector<std::string> expected = {
        "-x", "--audio-format", "wav", "--audio-quality", "0", "--newline",
        "--ffmpeg-location", "/usr/bin/ffmpeg",
        "-o", (dir / "%(id)s.%(ext)s").u8string(),
        "--no-playlist", "https://u",
    };
    assert(single == expected);

    const auto many = media::build_download_args("https://u", dir, "ffmpeg", true);
    assert(many[many.size() - 3] == "--yes-playlist");
    assert(many[many.size() - 2] == "--ignore-errors");
    assert(many.back() == "https://u");

    const auto convert = media::build_convert_args("in.webm", "out.16k.wav");
    assert((convert == std::vector<std::string>{
        "-y", "-loglevel", "error", "-i", "in.webm", "-ac", "1", "-ar", "16000",
        "-c:a", "pcm_s16le", "out.16k.wav"}));
}

static void test_find_downloaded_file() {
    const auto dir = test_support::make_temp_dir("ytdlp_find");
    auto touch = [&](const char* name) { std::ofstream(dir / name) << "x"; };

    assert(media::find_downloaded_file(dir, "abc").empty());
    touch("abc.webm.part");
    touch("abc.16k.wav");
    touch("abcdef.wav");
    assert(media::find_downloaded_file(dir, "abc").empty());
    touch("abc.m4a");
    assert(media::find_downloaded_file(dir, "abc") == dir / "abc.m4a");
    assert(media::find_downloaded_file(dir / "missing", "abc").empty());

    std::filesystem::remove_all(dir);
}

int main() {
    test_playlist_urls();
    test_detect_playlist();
    test_parse_entries();
    test_command_lines();
    test_find_downloaded_file();
    return 0;
}
