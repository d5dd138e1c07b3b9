#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace channelscout::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains scanner limits, FFmpeg tooling options, storage locations and
 * the logging level. Empty storage paths resolve below the config directory.
 */
struct AppConfig {
    // Scanner
    int maxConcurrency{10};           ///< Rate limiter slots (1-50).
    int timeoutSeconds{10};           ///< Default per-probe timeout (1-60).
    int discoveryTimeoutSeconds{20};  ///< Smart scan discovery timeout (1-120).
    bool smartScan{true};             ///< Allow smart port discovery for multicast scans.
    int workerThreads{8};             ///< Probe worker pool size (1-64).

    // FFmpeg
    std::string ffprobePath{"ffprobe"};                ///< ffprobe program name or path.
    std::string ffmpegPath{"ffmpeg"};                  ///< ffmpeg program name or path.
    std::string hwaccel;                               ///< "", "vaapi" or "cuda".
    std::string vaapiDevice{"/dev/dri/renderD128"};    ///< Render node for vaapi.
    std::vector<std::string> ffmpegCustomArgs;         ///< Extra probe arguments.

    // Storage
    std::string dataDir;        ///< Database directory.
    std::string screenshotDir;  ///< Screenshot output directory.
    std::string presetsFile;    ///< Multicast preset catalog.
    int retentionDays{30};      ///< Days of scan history to keep.

    // Logging
    std::string logLevel{"info"};  ///< debug, info, warn or error.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads config.json from the configuration directory (writing defaults if it
 * does not exist yet), then applies CHANNELSCOUT_* environment overrides and
 * range-checks the result.
 */
class ConfigManager {
public:
    static constexpr const char* kEnvPrefix = "CHANNELSCOUT_";

    /**
     * @brief Constructs a ConfigManager for the specified config directory.
     * @param configDir Path to the configuration directory; created if missing.
     */
    explicit ConfigManager(const std::filesystem::path& configDir);

    /**
     * @brief Loads configuration from disk and the environment.
     * @return True if loaded and valid. On failure the previous values are kept.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save();

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Checks every ranged or enumerated setting.
     * @return Empty string if valid, otherwise a description of the first problem.
     */
    static std::string validate(const AppConfig& config);

    /**
     * @brief Returns the path to the configuration file.
     */
    std::filesystem::path configPath() const { return configPath_; }

    std::filesystem::path dataDir() const;
    std::filesystem::path screenshotDir() const;
    std::filesystem::path presetsPath() const;

    /**
     * @brief Returns the path to the scan history database.
     */
    std::filesystem::path databasePath() const;

    std::string configDir() const { return configDir_.string(); }

private:
    nlohmann::json toJson() const;
    static void fromJson(const nlohmann::json& j, AppConfig& config);
    static void applyEnvironment(AppConfig& config);

    std::filesystem::path configDir_;
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace channelscout::infra
