#include "infrastructure/media/FfmpegTools.hpp"

#include "infrastructure/process/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

namespace channelscout::infra {

std::optional<std::filesystem::path> FfmpegTools::locate(const std::string& name) {
    auto path = ProcessRunner::findExecutable(name);
    if (path) {
        spdlog::debug("{} detected at {}", name, path->string());
    }
    return path;
}

bool FfmpegTools::checkInstalled(const std::string& name, bool raiseOnMissing) {
    if (locate(name)) {
        return true;
    }

    spdlog::warn("{} executable not found on system PATH", name);
    if (raiseOnMissing) {
        auto message = name + " is required but was not found on your PATH.\nInstall FFmpeg using:\n  " +
                       installInstructions();
        spdlog::error(message);
        throw FfmpegNotFoundError(message);
    }
    return false;
}

std::optional<std::string> FfmpegTools::version(const std::string& ffmpegPath) {
    if (!checkInstalled(ffmpegPath)) {
        return std::nullopt;
    }

    auto result = ProcessRunner::run(ffmpegPath, {"-version"}, std::chrono::seconds(5));
    if (!result.succeeded()) {
        spdlog::error("'{} -version' exited with code {}: {}", ffmpegPath, result.exitCode,
                      result.stderrText);
        return std::nullopt;
    }

    auto newline = result.stdoutText.find('\n');
    auto firstLine = result.stdoutText.substr(0, newline);
    while (!firstLine.empty() && (firstLine.back() == '\r' || firstLine.back() == ' ')) {
        firstLine.pop_back();
    }
    if (firstLine.empty()) {
        spdlog::warn("No version information returned by {}", ffmpegPath);
        return std::nullopt;
    }
    return firstLine;
}

std::string FfmpegTools::installInstructions() {
#if defined(__linux__)
    return "sudo apt-get update && sudo apt-get install -y ffmpeg libavcodec-extra";
#elif defined(__APPLE__)
    return "brew install ffmpeg";
#elif defined(_WIN32)
    return "choco install ffmpeg";
#else
    return "See https://ffmpeg.org/download.html for installation instructions.";
#endif
}

} // namespace channelscout::infra
