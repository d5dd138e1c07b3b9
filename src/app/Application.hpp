#pragma once

#include "core/services/IStreamValidator.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/config/PresetCatalog.hpp"
#include "infrastructure/database/Database.hpp"
#include "infrastructure/database/ScanResultRepository.hpp"
#include "infrastructure/media/ScreenshotCapture.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/scanner/RateLimiter.hpp"
#include "infrastructure/scanner/ScanSessionManager.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/sinks/sink.h>
#include <string>

namespace channelscout::app {

/**
 * @brief Owns and wires every long-lived component of the command-line tool.
 */
class Application {
public:
    static constexpr const char* kVersion = "1.0.0";

    /**
     * @brief Initializes logging, loads configuration and builds all components.
     * @param configDir Configuration directory.
     * @param logLevel Console log level overriding the configured one.
     * @throws std::runtime_error if the database cannot be opened.
     */
    explicit Application(const std::filesystem::path& configDir,
                         std::optional<std::string> logLevel = std::nullopt);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Accessors
    infra::ConfigManager& config() { return *config_; }
    infra::AsioContext& asioContext() { return *asioContext_; }
    infra::ScanSessionManager& sessions() { return *sessionManager_; }
    infra::ScanResultRepository& results() { return *resultRepository_; }
    const infra::PresetCatalog& presets() const { return *presets_; }
    core::IStreamValidator& validator() { return *validator_; }
    infra::ScreenshotCapture& screenshots() { return *screenshotCapture_; }

    /**
     * @brief Returns $XDG_CONFIG_HOME/channelscout, or ~/.config/channelscout.
     */
    static std::filesystem::path defaultConfigDir();

private:
    void initializeLogging(const std::filesystem::path& configDir);
    void applyLogLevel(const std::string& level);
    void initializeComponents();
    void performCleanup();

    std::unique_ptr<infra::ConfigManager> config_;
    std::shared_ptr<infra::Database> database_;
    std::unique_ptr<infra::ScanResultRepository> resultRepository_;
    std::unique_ptr<infra::AsioContext> asioContext_;
    std::shared_ptr<infra::RateLimiter> rateLimiter_;
    std::shared_ptr<core::IStreamValidator> validator_;
    std::shared_ptr<infra::PresetCatalog> presets_;
    std::unique_ptr<infra::ScreenshotCapture> screenshotCapture_;
    std::unique_ptr<infra::ScanSessionManager> sessionManager_;

    spdlog::sink_ptr consoleSink_;
};

} // namespace channelscout::app
