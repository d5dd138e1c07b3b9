#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/PresetCatalog.hpp"

#include <filesystem>
#include <fstream>

using namespace channelscout::core;
using namespace channelscout::infra;

namespace {

const char* kCatalogJson = R"({
    "presets": [
        {
            "id": "beijing-unicom",
            "name": "Beijing Unicom IPTV",
            "description": "Unicom multicast channels",
            "protocol": "rtp",
            "ip_ranges": ["239.3.1.1-239.3.1.255"],
            "ports": [8000, 8004, 8008],
            "estimated_targets": 765,
            "estimated_duration": "10-15 minutes"
        },
        {
            "id": "lab",
            "name": "Lab group",
            "protocol": "udp",
            "ip_ranges": ["239.255.0.1"],
            "ports": [1234]
        }
    ]
})";

class TempPresetFile {
public:
    explicit TempPresetFile(const std::string& content)
        : path_(std::filesystem::temp_directory_path() / "channelscout_presets_test.json") {
        std::ofstream file(path_);
        file << content;
    }

    ~TempPresetFile() { std::filesystem::remove(path_); }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

TEST_CASE("ScanPreset JSON mapping", "[PresetCatalog][ScanPreset]") {
    auto document = nlohmann::json::parse(kCatalogJson);
    auto preset = ScanPreset::fromJson(document["presets"][0]);

    REQUIRE(preset.id == "beijing-unicom");
    REQUIRE(preset.protocol == "rtp");
    REQUIRE(preset.ports == std::vector<int>{8000, 8004, 8008});
    REQUIRE(preset.estimatedTargets == 765);
    REQUIRE_FALSE(preset.reference.has_value());

    SECTION("Converts to a multicast strategy") {
        auto strategy = preset.toStrategy();
        REQUIRE(strategy->protocol() == "rtp");
        REQUIRE(strategy->estimateTargetCount() == 255 * 3);
    }

    SECTION("Optional fields are omitted when absent") {
        auto lab = ScanPreset::fromJson(document["presets"][1]);
        auto j = lab.toJson();
        REQUIRE_FALSE(j.contains("description"));
        REQUIRE(j["ip_ranges"] == nlohmann::json::array({"239.255.0.1"}));
    }

    SECTION("Missing required fields throw") {
        REQUIRE_THROWS(ScanPreset::fromJson({{"id", "x"}, {"name", "X"}}));
    }
}

TEST_CASE("PresetCatalog lookup", "[PresetCatalog]") {
    PresetCatalog catalog;
    REQUIRE(catalog.empty());

    catalog.loadFromJson(nlohmann::json::parse(kCatalogJson));

    REQUIRE(catalog.all().size() == 2);
    REQUIRE(catalog.findById("lab").has_value());
    REQUIRE(catalog.findById("lab")->name == "Lab group");
    REQUIRE_FALSE(catalog.findById("missing").has_value());
}

TEST_CASE("PresetCatalog file loading", "[PresetCatalog]") {
    SECTION("Loads a valid file") {
        TempPresetFile file(kCatalogJson);
        PresetCatalog catalog;

        REQUIRE(catalog.loadFromFile(file.path()));
        REQUIRE(catalog.all().size() == 2);
    }

    SECTION("Missing file leaves the catalog unchanged") {
        PresetCatalog catalog({ScanPreset{.id = "keep", .name = "Keep", .protocol = "udp"}});

        REQUIRE_FALSE(catalog.loadFromFile("/nonexistent/channelscout/presets.json"));
        REQUIRE(catalog.findById("keep").has_value());
    }

    SECTION("Malformed file leaves the catalog unchanged") {
        TempPresetFile file("{ \"presets\": [ {\"id\": ");
        PresetCatalog catalog({ScanPreset{.id = "keep", .name = "Keep", .protocol = "udp"}});

        REQUIRE_FALSE(catalog.loadFromFile(file.path()));
        REQUIRE(catalog.all().size() == 1);
    }
}

TEST_CASE("PresetNotFound carries the preset id", "[PresetCatalog]") {
    PresetNotFound error("nope");
    REQUIRE(error.presetId() == "nope");
    REQUIRE(std::string(error.what()) == "Preset not found: nope");
}
