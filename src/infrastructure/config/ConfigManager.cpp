#include "infrastructure/config/ConfigManager.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace channelscout::infra {

namespace {

std::optional<std::string> env(const std::string& name) {
    const char* value = std::getenv((std::string(ConfigManager::kEnvPrefix) + name).c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

int parseInt(const std::string& name, const std::string& text) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string(ConfigManager::kEnvPrefix) + name +
                                    " is not a number: " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(std::string(ConfigManager::kEnvPrefix) + name +
                                    " is not a number: " + text);
    }
    return value;
}

bool parseBool(const std::string& name, const std::string& text) {
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        return false;
    }
    throw std::invalid_argument(std::string(ConfigManager::kEnvPrefix) + name +
                                " is not a boolean: " + text);
}

// Accepts a JSON array or a comma separated list.
std::vector<std::string> parseArgList(const std::string& text) {
    std::vector<std::string> args;
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_array()) {
        for (const auto& item : parsed) {
            args.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
        return args;
    }

    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(',', start);
        auto part = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        auto first = part.find_first_not_of(" \t");
        if (first != std::string::npos) {
            args.push_back(part.substr(first, part.find_last_not_of(" \t") - first + 1));
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return args;
}

} // namespace

ConfigManager::ConfigManager(const std::filesystem::path& configDir) : configDir_(configDir) {
    if (!std::filesystem::exists(configDir_)) {
        std::filesystem::create_directories(configDir_);
    }

    configPath_ = configDir_ / "config.json";
}

bool ConfigManager::load() {
    AppConfig loaded = config_;

    if (!std::filesystem::exists(configPath_)) {
        spdlog::info("Config file not found, using defaults");
        if (!save()) {
            return false;
        }
    } else {
        try {
            std::ifstream file(configPath_);
            if (!file) {
                spdlog::error("Failed to open config file: {}", configPath_.string());
                return false;
            }

            nlohmann::json j;
            file >> j;
            fromJson(j, loaded);
        } catch (const std::exception& e) {
            spdlog::error("Failed to load config: {}", e.what());
            return false;
        }
    }

    try {
        applyEnvironment(loaded);
    } catch (const std::exception& e) {
        spdlog::error("Invalid environment override: {}", e.what());
        return false;
    }

    auto problem = validate(loaded);
    if (!problem.empty()) {
        spdlog::error("Invalid configuration in {}: {}", configPath_.string(), problem);
        return false;
    }

    config_ = std::move(loaded);
    spdlog::info("Loaded configuration from {}", configPath_.string());
    return true;
}

bool ConfigManager::save() {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2);
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::string ConfigManager::validate(const AppConfig& config) {
    if (config.maxConcurrency < 1 || config.maxConcurrency > 50) {
        return "scanner.max_concurrency must be between 1 and 50";
    }
    if (config.timeoutSeconds < 1 || config.timeoutSeconds > 60) {
        return "scanner.timeout_seconds must be between 1 and 60";
    }
    if (config.discoveryTimeoutSeconds < 1 || config.discoveryTimeoutSeconds > 120) {
        return "scanner.discovery_timeout_seconds must be between 1 and 120";
    }
    if (config.workerThreads < 1 || config.workerThreads > 64) {
        return "scanner.worker_threads must be between 1 and 64";
    }
    if (config.retentionDays < 1) {
        return "storage.retention_days must be at least 1";
    }
    if (!config.hwaccel.empty() && config.hwaccel != "vaapi" && config.hwaccel != "cuda") {
        return "ffmpeg.hwaccel must be empty, \"vaapi\" or \"cuda\"";
    }
    if (config.logLevel != "debug" && config.logLevel != "info" && config.logLevel != "warn" &&
        config.logLevel != "error") {
        return "logging.level must be one of debug, info, warn, error";
    }
    return {};
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    j["scanner"]["max_concurrency"] = config_.maxConcurrency;
    j["scanner"]["timeout_seconds"] = config_.timeoutSeconds;
    j["scanner"]["discovery_timeout_seconds"] = config_.discoveryTimeoutSeconds;
    j["scanner"]["smart_scan"] = config_.smartScan;
    j["scanner"]["worker_threads"] = config_.workerThreads;

    j["ffmpeg"]["ffprobe_path"] = config_.ffprobePath;
    j["ffmpeg"]["ffmpeg_path"] = config_.ffmpegPath;
    j["ffmpeg"]["hwaccel"] = config_.hwaccel;
    j["ffmpeg"]["vaapi_device"] = config_.vaapiDevice;
    j["ffmpeg"]["custom_args"] = config_.ffmpegCustomArgs;

    j["storage"]["data_dir"] = config_.dataDir;
    j["storage"]["screenshot_dir"] = config_.screenshotDir;
    j["storage"]["presets_file"] = config_.presetsFile;
    j["storage"]["retention_days"] = config_.retentionDays;

    j["logging"]["level"] = config_.logLevel;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j, AppConfig& config) {
    const AppConfig defaults;

    if (j.contains("scanner")) {
        const auto& s = j["scanner"];
        config.maxConcurrency = s.value("max_concurrency", defaults.maxConcurrency);
        config.timeoutSeconds = s.value("timeout_seconds", defaults.timeoutSeconds);
        config.discoveryTimeoutSeconds =
            s.value("discovery_timeout_seconds", defaults.discoveryTimeoutSeconds);
        config.smartScan = s.value("smart_scan", defaults.smartScan);
        config.workerThreads = s.value("worker_threads", defaults.workerThreads);
    }

    if (j.contains("ffmpeg")) {
        const auto& f = j["ffmpeg"];
        config.ffprobePath = f.value("ffprobe_path", defaults.ffprobePath);
        config.ffmpegPath = f.value("ffmpeg_path", defaults.ffmpegPath);
        config.hwaccel = f.value("hwaccel", defaults.hwaccel);
        config.vaapiDevice = f.value("vaapi_device", defaults.vaapiDevice);
        config.ffmpegCustomArgs = f.value("custom_args", defaults.ffmpegCustomArgs);
    }

    if (j.contains("storage")) {
        const auto& st = j["storage"];
        config.dataDir = st.value("data_dir", defaults.dataDir);
        config.screenshotDir = st.value("screenshot_dir", defaults.screenshotDir);
        config.presetsFile = st.value("presets_file", defaults.presetsFile);
        config.retentionDays = st.value("retention_days", defaults.retentionDays);
    }

    if (j.contains("logging")) {
        config.logLevel = j["logging"].value("level", defaults.logLevel);
    }
}

void ConfigManager::applyEnvironment(AppConfig& config) {
    if (auto v = env("MAX_CONCURRENCY")) {
        config.maxConcurrency = parseInt("MAX_CONCURRENCY", *v);
    }
    if (auto v = env("TIMEOUT")) {
        config.timeoutSeconds = parseInt("TIMEOUT", *v);
    }
    if (auto v = env("DISCOVERY_TIMEOUT")) {
        config.discoveryTimeoutSeconds = parseInt("DISCOVERY_TIMEOUT", *v);
    }
    if (auto v = env("SMART_SCAN")) {
        config.smartScan = parseBool("SMART_SCAN", *v);
    }
    if (auto v = env("WORKER_THREADS")) {
        config.workerThreads = parseInt("WORKER_THREADS", *v);
    }
    if (auto v = env("FFPROBE_PATH")) {
        config.ffprobePath = *v;
    }
    if (auto v = env("FFMPEG_PATH")) {
        config.ffmpegPath = *v;
    }
    if (auto v = env("FFMPEG_HWACCEL")) {
        config.hwaccel = *v;
    }
    if (auto v = env("FFMPEG_VAAPI_DEVICE")) {
        config.vaapiDevice = *v;
    }
    if (auto v = env("FFMPEG_CUSTOM_ARGS")) {
        config.ffmpegCustomArgs = parseArgList(*v);
    }
    if (auto v = env("DATA_DIR")) {
        config.dataDir = *v;
    }
    if (auto v = env("SCREENSHOT_DIR")) {
        config.screenshotDir = *v;
    }
    if (auto v = env("PRESETS_FILE")) {
        config.presetsFile = *v;
    }
    if (auto v = env("RETENTION_DAYS")) {
        config.retentionDays = parseInt("RETENTION_DAYS", *v);
    }
    if (auto v = env("LOG_LEVEL")) {
        config.logLevel = *v;
    }
}

std::filesystem::path ConfigManager::dataDir() const {
    return config_.dataDir.empty() ? configDir_ / "data" : std::filesystem::path(config_.dataDir);
}

std::filesystem::path ConfigManager::screenshotDir() const {
    return config_.screenshotDir.empty() ? configDir_ / "screenshots"
                                         : std::filesystem::path(config_.screenshotDir);
}

std::filesystem::path ConfigManager::presetsPath() const {
    return config_.presetsFile.empty() ? configDir_ / "multicast_presets.json"
                                       : std::filesystem::path(config_.presetsFile);
}

std::filesystem::path ConfigManager::databasePath() const {
    return dataDir() / "channelscout.db";
}

} // namespace channelscout::infra
