#pragma once

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace channelscout::infra {

/**
 * @brief Raised when an FFmpeg executable is required but cannot be found.
 */
class FfmpegNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Helpers for locating the FFmpeg tool suite.
 */
class FfmpegTools {
public:
    /**
     * @brief Locates an FFmpeg executable ("ffmpeg", "ffprobe" or an explicit path).
     * @param name Program name or path.
     * @return Absolute path, or nullopt if it is not installed.
     */
    static std::optional<std::filesystem::path> locate(const std::string& name);

    /**
     * @brief Checks that an executable is available.
     * @param name Program name or path.
     * @param raiseOnMissing Throw instead of returning false.
     * @throws FfmpegNotFoundError if missing and raiseOnMissing is set.
     */
    static bool checkInstalled(const std::string& name = "ffmpeg", bool raiseOnMissing = false);

    /**
     * @brief Returns the first line of "<ffmpeg> -version".
     * @return Version banner, or nullopt if ffmpeg is missing or fails.
     */
    static std::optional<std::string> version(const std::string& ffmpegPath = "ffmpeg");

    /**
     * @brief Returns a platform-specific installation hint.
     */
    static std::string installInstructions();
};

} // namespace channelscout::infra
