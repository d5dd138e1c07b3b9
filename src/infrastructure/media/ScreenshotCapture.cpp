#include "infrastructure/media/ScreenshotCapture.hpp"

#include "core/services/IResultStream.hpp"
#include "infrastructure/media/FfmpegTools.hpp"
#include "infrastructure/process/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace channelscout::infra {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

ScreenshotCapture::ScreenshotCapture(std::string ffmpegPath, std::string vaapiDevice)
    : ffmpegPath_(std::move(ffmpegPath)), vaapiDevice_(std::move(vaapiDevice)) {}

std::filesystem::path ScreenshotCapture::sanitizeOutputPath(const std::filesystem::path& path) {
    auto expanded = path;
    auto text = path.string();
    if (text.starts_with("~/")) {
        if (const char* home = std::getenv("HOME")) {
            expanded = std::filesystem::path(home) / text.substr(2);
        }
    }
    if (toLower(expanded.extension().string()) != ".png") {
        expanded.replace_extension(".png");
    }
    expanded = std::filesystem::absolute(expanded).lexically_normal();
    if (expanded.has_parent_path()) {
        std::filesystem::create_directories(expanded.parent_path());
    }
    return expanded;
}

std::vector<std::string> ScreenshotCapture::buildArguments(const std::string& url,
                                                           const std::filesystem::path& outputPath,
                                                           const std::string& hwaccel) const {
    std::vector<std::string> args = {"-hide_banner", "-loglevel", "error",
                                     "-ss", std::to_string(kFrameSeekSeconds)};

    auto accel = toLower(hwaccel);
    if (accel == "vaapi") {
        args.insert(args.end(), {"-hwaccel", "vaapi", "-hwaccel_device", vaapiDevice_});
    } else if (accel == "cuda") {
        args.insert(args.end(), {"-hwaccel", "cuda"});
    } else if (!accel.empty()) {
        spdlog::warn("Unknown hardware acceleration option '{}'. Falling back to software.",
                     hwaccel);
    }

    args.insert(args.end(), {"-i", url, "-vframes", "1", "-f", "image2", "-vcodec", "png", "-y",
                             outputPath.string()});
    return args;
}

std::filesystem::path ScreenshotCapture::capture(const std::string& url,
                                                 const std::filesystem::path& outputPath,
                                                 std::chrono::seconds timeout,
                                                 const std::string& hwaccel,
                                                 std::stop_token stopToken) const {
    if (timeout <= std::chrono::seconds::zero() || timeout > kMaxTimeout) {
        throw std::invalid_argument("timeout must be between 1 and " +
                                    std::to_string(kMaxTimeout.count()) + " seconds.");
    }

    if (!FfmpegTools::checkInstalled(ffmpegPath_)) {
        throw FfmpegNotFoundError("FFmpeg is required for screenshot capture.");
    }

    auto safePath = sanitizeOutputPath(outputPath);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    spdlog::debug("Capturing screenshot from {} -> {} (timeout={}s, hwaccel={})", url,
                  safePath.string(), timeout.count(), hwaccel.empty() ? "none" : hwaccel);

    auto attempt = [&](const std::string& accel) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            return ProcessResult{.launched = true, .timedOut = true};
        }
        return ProcessRunner::run(ffmpegPath_, buildArguments(url, safePath, accel),
                                  remaining, stopToken);
    };

    auto result = attempt(hwaccel);
    if (!result.succeeded() && !result.cancelled && !result.timedOut && !hwaccel.empty()) {
        spdlog::warn("Hardware acceleration '{}' failed for {}: {}. Retrying with software decoding.",
                     hwaccel, url, result.stderrText);
        result = attempt({});
    }

    if (result.cancelled) {
        throw core::OperationCancelled();
    }
    if (result.timedOut) {
        throw CaptureError("Screenshot capture timed out after " +
                           std::to_string(timeout.count()) + " seconds");
    }
    if (!result.succeeded()) {
        auto detail = result.stderrText.empty() ? "ffmpeg exited with code " +
                                                      std::to_string(result.exitCode)
                                                : result.stderrText;
        throw CaptureError("Screenshot capture failed for " + url + ": " + detail);
    }

    spdlog::info("Screenshot saved to {}", safePath.string());
    return safePath;
}

} // namespace channelscout::infra
