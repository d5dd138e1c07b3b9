#pragma once

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace channelscout::infra {

/**
 * @brief Raised when ffmpeg fails to grab a frame.
 */
class CaptureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Grabs a single PNG frame from a stream with ffmpeg.
 *
 * The frame is taken 5 seconds into the stream. With a hardware acceleration
 * hint set, a failed capture is retried exactly once with software decoding.
 */
class ScreenshotCapture {
public:
    static constexpr std::chrono::seconds kDefaultTimeout{10};
    static constexpr std::chrono::seconds kMaxTimeout{60};
    static constexpr int kFrameSeekSeconds = 5;

    /**
     * @brief Constructs the capturer.
     * @param ffmpegPath Program name or path of ffmpeg.
     * @param vaapiDevice Render node used with the "vaapi" hint.
     */
    explicit ScreenshotCapture(std::string ffmpegPath = "ffmpeg",
                               std::string vaapiDevice = "/dev/dri/renderD128");

    /**
     * @brief Captures one frame to a PNG file.
     * @param url Stream URL.
     * @param outputPath Destination; the extension is forced to ".png" and parent
     *                   directories are created.
     * @param timeout Deadline for the whole capture, both attempts included (1-60 s).
     * @param hwaccel Optional acceleration hint: "vaapi", "cuda" or empty.
     * @param stopToken Aborts the capture when stop is requested.
     * @return The absolute path of the written file.
     * @throws std::invalid_argument if the timeout is out of range.
     * @throws FfmpegNotFoundError if ffmpeg is not installed.
     * @throws CaptureError if ffmpeg fails or the deadline passes.
     * @throws core::OperationCancelled if stopped.
     */
    std::filesystem::path capture(const std::string& url, const std::filesystem::path& outputPath,
                                  std::chrono::seconds timeout = kDefaultTimeout,
                                  const std::string& hwaccel = {},
                                  std::stop_token stopToken = {}) const;

    /**
     * @brief Builds the ffmpeg argument list for one attempt.
     */
    [[nodiscard]] std::vector<std::string> buildArguments(const std::string& url,
                                                          const std::filesystem::path& outputPath,
                                                          const std::string& hwaccel) const;

    /**
     * @brief Normalizes an output path to an absolute ".png" path.
     */
    static std::filesystem::path sanitizeOutputPath(const std::filesystem::path& path);

private:
    std::string ffmpegPath_;
    std::string vaapiDevice_;
};

} // namespace channelscout::infra
