#include "app/Application.hpp"

#include "infrastructure/media/FfprobeMediaProbe.hpp"
#include "infrastructure/media/StreamValidator.hpp"
#include "infrastructure/scanner/ScanOrchestrator.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>

namespace channelscout::app {

Application::Application(const std::filesystem::path& configDir,
                         std::optional<std::string> logLevel) {
    initializeLogging(configDir);

    config_ = std::make_unique<infra::ConfigManager>(configDir);
    if (!config_->load()) {
        spdlog::warn("Continuing with default configuration");
    }
    applyLogLevel(logLevel.value_or(config_->config().logLevel));

    initializeComponents();
}

Application::~Application() {
    spdlog::debug("Application shutting down...");

    // Sessions first: their tasks still use the worker pool.
    sessionManager_.reset();

    if (asioContext_) {
        asioContext_->stop();
    }

    performCleanup();
}

std::filesystem::path Application::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "channelscout";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "channelscout";
    }
    return std::filesystem::current_path() / ".channelscout";
}

void Application::initializeLogging(const std::filesystem::path& configDir) {
    std::filesystem::create_directories(configDir);
    auto logPath = configDir / "channelscout.log";

    consoleSink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink_->set_level(spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger = std::make_shared<spdlog::logger>("channelscout",
                                                   spdlog::sinks_init_list{consoleSink_, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::debug("ChannelScout {} starting...", kVersion);
    spdlog::debug("Log file: {}", logPath.string());
}

void Application::applyLogLevel(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', keeping info", level);
        return;
    }
    consoleSink_->set_level(parsed);
}

void Application::initializeComponents() {
    const auto& cfg = config_->config();

    // Scan history
    std::filesystem::create_directories(config_->dataDir());
    database_ = std::make_shared<infra::Database>(config_->databasePath().string());
    resultRepository_ = std::make_unique<infra::ScanResultRepository>(database_);

    // Worker pool: one thread per admission slot so admitted probes never queue.
    auto threads = static_cast<size_t>(std::max(cfg.workerThreads, cfg.maxConcurrency));
    asioContext_ = std::make_unique<infra::AsioContext>(threads);
    asioContext_->start();

    rateLimiter_ = std::make_shared<infra::RateLimiter>(*asioContext_, cfg.maxConcurrency,
                                                        std::chrono::seconds(cfg.timeoutSeconds));

    // Media tooling
    auto probe = std::make_shared<infra::FfprobeMediaProbe>(cfg.ffprobePath, cfg.ffmpegCustomArgs);
    validator_ = std::make_shared<infra::StreamValidator>(probe);
    screenshotCapture_ = std::make_unique<infra::ScreenshotCapture>(cfg.ffmpegPath, cfg.vaapiDevice);

    // Presets
    presets_ = std::make_shared<infra::PresetCatalog>();
    presets_->loadFromFile(config_->presetsPath());

    // Sessions
    auto validator = validator_;
    auto limiter = rateLimiter_;
    auto* context = asioContext_.get();
    sessionManager_ = std::make_unique<infra::ScanSessionManager>(
        [validator, limiter, context]() -> std::unique_ptr<core::IScanOrchestrator> {
            return std::make_unique<infra::ScanOrchestrator>(validator, limiter, *context);
        },
        presets_, std::chrono::seconds(cfg.discoveryTimeoutSeconds), cfg.smartScan);

    auto* repository = resultRepository_.get();
    sessionManager_->addResultObserver(
        [repository](const std::string& scanId, const core::ValidationResult& result) {
            repository->insert(scanId, result);
        });

    spdlog::debug("Application components initialized");
}

void Application::performCleanup() {
    if (!resultRepository_) {
        return;
    }

    try {
        resultRepository_->cleanupOlderThan(std::chrono::hours(config_->config().retentionDays * 24));
    } catch (const std::exception& e) {
        spdlog::warn("Scan history cleanup failed: {}", e.what());
    }
}

} // namespace channelscout::app
