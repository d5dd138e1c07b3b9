#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace channelscout::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "channelscout_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path path() const { return configDir_; }

    void write(const std::string& content) const {
        std::ofstream file(configDir_ / "config.json");
        file << content;
    }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::string& value)
        : name_(std::string(ConfigManager::kEnvPrefix) + name) {
        setenv(name_.c_str(), value.c_str(), 1);
    }

    ~ScopedEnv() { unsetenv(name_.c_str()); }

private:
    std::string name_;
};

} // namespace

TEST_CASE("ConfigManager constructor", "[ConfigManager]") {
    SECTION("Creates config directory if it does not exist") {
        auto tempPath = std::filesystem::temp_directory_path() / "channelscout_config_new_test";
        std::filesystem::remove_all(tempPath);

        REQUIRE_FALSE(std::filesystem::exists(tempPath));

        ConfigManager manager(tempPath);

        REQUIRE(std::filesystem::is_directory(tempPath));
        REQUIRE(manager.configPath() == tempPath / "config.json");

        std::filesystem::remove_all(tempPath);
    }
}

TEST_CASE("ConfigManager path methods", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.path());

    SECTION("Defaults live under the config directory") {
        REQUIRE(manager.dataDir() == testDir.path() / "data");
        REQUIRE(manager.screenshotDir() == testDir.path() / "screenshots");
        REQUIRE(manager.presetsPath() == testDir.path() / "multicast_presets.json");
        REQUIRE(manager.databasePath() == testDir.path() / "data" / "channelscout.db");
    }

    SECTION("Explicit storage paths win") {
        manager.config().dataDir = "/var/lib/channelscout";
        manager.config().presetsFile = "/etc/channelscout/presets.json";

        REQUIRE(manager.databasePath() == "/var/lib/channelscout/channelscout.db");
        REQUIRE(manager.presetsPath() == "/etc/channelscout/presets.json");
    }
}

TEST_CASE("ConfigManager load and save", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Missing file writes defaults") {
        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(std::filesystem::exists(manager.configPath()));

        const auto& config = manager.config();
        REQUIRE(config.maxConcurrency == 10);
        REQUIRE(config.timeoutSeconds == 10);
        REQUIRE(config.discoveryTimeoutSeconds == 20);
        REQUIRE(config.smartScan);
        REQUIRE(config.retentionDays == 30);
        REQUIRE(config.logLevel == "info");
    }

    SECTION("Reads sections and keeps defaults for missing keys") {
        testDir.write(R"({
            "scanner": {"max_concurrency": 25, "timeout_seconds": 15},
            "ffmpeg": {"hwaccel": "vaapi", "custom_args": ["-rw_timeout", "5000000"]},
            "logging": {"level": "debug"}
        })");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());

        const auto& config = manager.config();
        REQUIRE(config.maxConcurrency == 25);
        REQUIRE(config.timeoutSeconds == 15);
        REQUIRE(config.discoveryTimeoutSeconds == 20);
        REQUIRE(config.hwaccel == "vaapi");
        REQUIRE(config.ffmpegCustomArgs == std::vector<std::string>{"-rw_timeout", "5000000"});
        REQUIRE(config.ffprobePath == "ffprobe");
        REQUIRE(config.logLevel == "debug");
    }

    SECTION("Saved values survive a reload") {
        {
            ConfigManager manager(testDir.path());
            manager.config().maxConcurrency = 32;
            manager.config().retentionDays = 7;
            REQUIRE(manager.save());
        }

        ConfigManager reloaded(testDir.path());
        REQUIRE(reloaded.load());
        REQUIRE(reloaded.config().maxConcurrency == 32);
        REQUIRE(reloaded.config().retentionDays == 7);
    }

    SECTION("Malformed JSON is rejected") {
        testDir.write("{ not json");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().maxConcurrency == 10);
    }

    SECTION("Out of range values are rejected and defaults kept") {
        testDir.write(R"({"scanner": {"max_concurrency": 100}})");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().maxConcurrency == 10);
    }
}

TEST_CASE("ConfigManager environment overrides", "[ConfigManager]") {
    TestConfigDir testDir;
    testDir.write(R"({"scanner": {"max_concurrency": 5}})");

    SECTION("Environment wins over the file") {
        ScopedEnv concurrency("MAX_CONCURRENCY", "12");
        ScopedEnv smart("SMART_SCAN", "false");
        ScopedEnv args("FFMPEG_CUSTOM_ARGS", "-fflags, nobuffer");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().maxConcurrency == 12);
        REQUIRE_FALSE(manager.config().smartScan);
        REQUIRE(manager.config().ffmpegCustomArgs ==
                std::vector<std::string>{"-fflags", "nobuffer"});
    }

    SECTION("Custom args accept a JSON array") {
        ScopedEnv args("FFMPEG_CUSTOM_ARGS", R"(["-user_agent", "VLC/3.0"])");

        ConfigManager manager(testDir.path());
        REQUIRE(manager.load());
        REQUIRE(manager.config().ffmpegCustomArgs ==
                std::vector<std::string>{"-user_agent", "VLC/3.0"});
    }

    SECTION("Non-numeric values fail the load") {
        ScopedEnv timeout("TIMEOUT", "ten");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
    }

    SECTION("Overrides are validated") {
        ScopedEnv timeout("TIMEOUT", "90");

        ConfigManager manager(testDir.path());
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().timeoutSeconds == 10);
    }
}

TEST_CASE("ConfigManager validation", "[ConfigManager]") {
    AppConfig config;
    REQUIRE(ConfigManager::validate(config).empty());

    SECTION("Concurrency bounds") {
        config.maxConcurrency = 0;
        REQUIRE_FALSE(ConfigManager::validate(config).empty());
        config.maxConcurrency = 50;
        REQUIRE(ConfigManager::validate(config).empty());
    }

    SECTION("Hardware acceleration hint") {
        config.hwaccel = "cuda";
        REQUIRE(ConfigManager::validate(config).empty());
        config.hwaccel = "opencl";
        REQUIRE_FALSE(ConfigManager::validate(config).empty());
    }

    SECTION("Log level") {
        config.logLevel = "verbose";
        REQUIRE_FALSE(ConfigManager::validate(config).empty());
    }

    SECTION("Retention") {
        config.retentionDays = 0;
        REQUIRE_FALSE(ConfigManager::validate(config).empty());
    }
}
