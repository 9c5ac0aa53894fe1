#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "output/markdown_writer.hpp"
#include "../test_support.hpp"

static media::VideoItem sample_item() {
    media::VideoItem item;
    item.video_id = "abc123";
    item.title = "My Talk";
    item.url = "https://www.youtube.com/watch?v=abc123";
    return item;
}

static void test_sanitize() {
    assert(output::sanitize_filename("My Talk") == "My Talk");
    assert(output::sanitize_filename("a/b\\c:d*e?f\"g<h>i|j") == "abcdefghij");
    assert(output::sanitize_filename("  spaced   out  ") == "spaced out");
    assert(output::sanitize_filename("Ends with dots...") == "Ends with dots");
    assert(output::sanitize_filename("tab\there") == "tabhere");
    assert(output::sanitize_filename("???").empty());

    const std::string long_title(300, 'x');
    assert(output::sanitize_filename(long_title).size() == 120);

    // The limit counts characters, not bytes
    std::string umlauts;
    for (int i = 0; i < 100; ++i) umlauts += "\xC3\xA4";
    assert(output::sanitize_filename(umlauts) == umlauts);
    umlauts += umlauts;
    const std::string cut = output::sanitize_filename(umlauts);
    assert(cut.size() == 240);
    assert((static_cast<unsigned char>(cut.back()) & 0xC0) == 0x80);

    std::string cjk;
    for (int i = 0; i < 60; ++i) cjk += "\xE4\xB8\xAD";
    assert(output::sanitize_filename(cjk) == cjk);
    cjk += cjk + cjk;
    assert(output::sanitize_filename(cjk).size() == 360);

    // 119 ASCII bytes then a 2-byte character: both fit in 120 characters
    const std::string mixed = std::string(119, 'a') + "\xC3\xA9" + "tail";
    assert(output::sanitize_filename(mixed) == std::string(119, 'a') + "\xC3\xA9");
}

static void test_unique_paths() {
    const auto dir = test_support::make_temp_dir("md_paths");

    const auto first = output::build_output_path(dir, "My Talk", "abc123");
    assert(first == dir / "My Talk.md");
    std::ofstream(first) << "x";

    const auto second = output::build_output_path(dir, "My Talk", "abc123");
    assert(second == dir / "My Talk-1.md");
    std::ofstream(second) << "x";

    assert(output::build_output_path(dir, "My Talk", "abc123") == dir / "My Talk-2.md");

    // Title with nothing usable falls back to the id
    assert(output::build_output_path(dir, "///", "abc123") == dir / "abc123.md");

    std::filesystem::remove_all(dir);
}

static void test_render() {
    asr::TranscriptResult result;
    result.text = "  Hello world.  ";
    result.language = "en";

    const std::string md = output::render_transcript(sample_item(), result, "base", "2025-01-31T08:15:00+00:00");
    const std::string expected =
        "# My Talk\n"
        "\n"
        "## Video Information\n"
        "\n"
        "- **Video ID**: abc123\n"
        "- **URL**: [https://www.youtube.com/watch?v=abc123](https://www.youtube.com/watch?v=abc123)\n"
        "- **Language**: en\n"
        "- **Model**: base\n"
        "- **Transcribed**: 2025-01-31T08:15:00+00:00\n"
        "\n"
        "## Transcript\n"
        "\n"
        "Hello world.\n";
    assert(md == expected);

    result.language.clear();
    media::VideoItem untitled = sample_item();
    untitled.title = "   ";
    const std::string md2 = output::render_transcript(untitled, result, "small", "t");
    assert(md2.rfind("# abc123\n", 0) == 0);
    assert(md2.find("- **Language**: unknown\n") != std::string::npos);
}

static void test_write_and_cleanup() {
    const auto dir = test_support::make_temp_dir("md_write");
    assert(output::format_utc_timestamp(test_support::fixed_time()) == "2025-01-31T08:15:00+00:00");

    asr::TranscriptResult result;
    result.text = "Text";
    result.language = "de";
    const auto path = output::write_transcript(dir, sample_item(), result, "tiny", test_support::fixed_time());
    assert(path == dir / "My Talk.md");
    const std::string content = test_support::read_file(path);
    assert(content.find("- **Transcribed**: 2025-01-31T08:15:00+00:00\n") != std::string::npos);
    assert(content.find("- **Model**: tiny\n") != std::string::npos);

    // Same title again never overwrites
    const auto path2 = output::write_transcript(dir, sample_item(), result, "tiny", test_support::fixed_time());
    assert(path2 == dir / "My Talk-1.md");

    // Only regular files go; subdirectories stay
    std::filesystem::create_directories(dir / "keep");
    std::ofstream(dir / "keep" / "inner.wav") << "x";
    std::ofstream(dir / "a.16k.wav") << "x";

    std::vector<std::string> lines;
    output::cleanup_data(dir, [&](const std::string& l) { lines.push_back(l); });
    assert(test_support::count_files(dir) == 0);
    assert(std::filesystem::exists(dir / "keep" / "inner.wav"));
    assert(!lines.empty() && lines.back() == "Cleaned temporary data directory.");

    lines.clear();
    output::cleanup_data(dir / "missing", [&](const std::string& l) { lines.push_back(l); });
    assert(lines.size() == 1 && lines[0].rfind("Cleanup skipped: ", 0) == 0);

    std::filesystem::remove_all(dir);
}

int main() {
    test_sanitize();
    test_unique_paths();
    test_render();
    test_write_and_cleanup();
    return 0;
}
