#include "output/markdown_writer.hpp"

#include <ctime>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace output {

namespace {
constexpr size_t kMaxTitleChars = 120;

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool is_invalid_char(unsigned char c) {
    switch (c) {
        case '<': case '>': case ':': case '"':
        case '/': case '\\': case '|': case '?': case '*':
            return true;
        default:
            return c < 0x20;
    }
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte length of the first `max_chars` code points of a UTF-8 string.
size_t utf8_prefix(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
        if (chars == max_chars) return i;
        ++chars;
    }
    return s.size();
}
} // namespace

std::string sanitize_filename(const std::string& title) {
    std::string cleaned;
    cleaned.reserve(title.size());
    for (unsigned char c : title) {
        if (!is_invalid_char(c)) cleaned.push_back(static_cast<char>(c));
    }
    cleaned = trim(cleaned);
    while (!cleaned.empty() && cleaned.back() == '.') cleaned.pop_back();

    std::string collapsed;
    collapsed.reserve(cleaned.size());
    for (char c : cleaned) {
        if (c == ' ' && !collapsed.empty() && collapsed.back() == ' ') continue;
        collapsed.push_back(c);
    }
    collapsed.resize(utf8_prefix(collapsed, kMaxTitleChars));
    return trim(collapsed);
}

std::filesystem::path build_output_path(const std::filesystem::path& dir,
                                        const std::string& title,
                                        const std::string& video_id) {
    std::string safe = sanitize_filename(title);
    if (safe.empty()) safe = video_id;

    std::error_code ec;
    auto candidate = dir / std::filesystem::u8path(safe + ".md");
    if (!std::filesystem::exists(candidate, ec)) return candidate;

    for (int suffix = 1; suffix < 1000; ++suffix) {
        candidate = dir / std::filesystem::u8path(safe + "-" + std::to_string(suffix) + ".md");
        if (!std::filesystem::exists(candidate, ec)) return candidate;
    }
    return dir / std::filesystem::u8path(video_id + ".md");
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point t) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &tt);
#else
    gmtime_r(&tt, &utc);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S+00:00", &utc);
    return buf;
}

std::string render_transcript(const media::VideoItem& item,
                              const asr::TranscriptResult& result,
                              const std::string& model_name,
                              const std::string& timestamp) {
    std::string title = trim(item.title);
    if (title.empty()) title = item.video_id;
    const std::string language = result.language.empty() ? "unknown" : result.language;

    const std::vector<std::string> lines = {
        "# " + title,
        "",
        "## Video Information",
        "",
        "- **Video ID**: " + item.video_id,
        "- **URL**: [" + item.url + "](" + item.url + ")",
        "- **Language**: " + language,
        "- **Model**: " + model_name,
        "- **Transcribed**: " + timestamp,
        "",
        "## Transcript",
        "",
        trim(result.text),
        "",
    };
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

std::filesystem::path write_transcript(const std::filesystem::path& dir,
                                       const media::VideoItem& item,
                                       const asr::TranscriptResult& result,
                                       const std::string& model_name,
                                       std::chrono::system_clock::time_point now) {
    std::string title = trim(item.title);
    if (title.empty()) title = item.video_id;
    const auto path = build_output_path(dir, title, item.video_id);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw std::runtime_error("Cannot write transcript: " + path.u8string());
    }
    f << render_transcript(item, result, model_name, format_utc_timestamp(now));
    f.close();
    if (!f) {
        throw std::runtime_error("Cannot write transcript: " + path.u8string());
    }
    return path;
}

void cleanup_data(const std::filesystem::path& data_dir, const core::LogFn& log) {
    std::error_code ec;
    std::filesystem::directory_iterator it(data_dir, ec);
    const std::filesystem::directory_iterator end;
    while (!ec && it != end) {
        std::error_code fec;
        if (it->is_regular_file(fec)) std::filesystem::remove(it->path(), fec);
        if (fec) { ec = fec; break; }
        it.increment(ec);
    }
    if (ec) {
        if (log) log("Cleanup skipped: " + ec.message());
        return;
    }
    if (log) log("Cleaned temporary data directory.");
}

}
