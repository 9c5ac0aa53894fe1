#include "core/tool_paths.hpp"
#include "core/config.hpp"

#include <filesystem>
#include <stdexcept>

#include <QStandardPaths>
#include <QString>

namespace core {

namespace {
std::string resolve_tool(const std::string& name,
                         const std::string& configured,
                         const std::string& label,
                         const LogFn& log) {
    const std::string path = normalized_path(configured);
    if (!path.empty()) {
        if (!std::filesystem::exists(std::filesystem::u8path(path))) {
            throw std::runtime_error("Configured " + label + " path does not exist.");
        }
        if (log) log("Using configured " + label + " path.");
        return path;
    }
    std::string found = find_executable(name);
    if (found.empty()) {
        throw std::runtime_error("Missing required tool in PATH: " + name + ".");
    }
    if (log) log("Resolved " + name + " at " + found);
    return found;
}
} // namespace

std::string find_executable(const std::string& name) {
    return QStandardPaths::findExecutable(QString::fromStdString(name)).toStdString();
}

ToolPaths ensure_environment(const std::string& ffmpeg_path,
                             const std::string& ytdlp_path,
                             const LogFn& log) {
    ToolPaths tools;
    tools.ffmpeg = resolve_tool("ffmpeg", ffmpeg_path, "ffmpeg", log);
    tools.ytdlp = resolve_tool("yt-dlp", ytdlp_path, "yt-dlp", log);
    if (log) log("Environment check passed.");
    return tools;
}

}
