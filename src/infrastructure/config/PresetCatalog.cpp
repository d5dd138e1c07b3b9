#include "infrastructure/config/PresetCatalog.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace channelscout::infra {

PresetCatalog::PresetCatalog(std::vector<core::ScanPreset> presets)
    : presets_(std::move(presets)) {}

bool PresetCatalog::loadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("Preset file not found: {}", path.string());
        return false;
    }

    try {
        std::ifstream file(path);
        if (!file) {
            spdlog::error("Failed to open preset file: {}", path.string());
            return false;
        }

        nlohmann::json document;
        file >> document;
        loadFromJson(document);

        spdlog::info("Loaded {} scan presets from {}", presets_.size(), path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load presets from {}: {}", path.string(), e.what());
        return false;
    }
}

void PresetCatalog::loadFromJson(const nlohmann::json& document) {
    std::vector<core::ScanPreset> loaded;
    if (document.contains("presets")) {
        for (const auto& entry : document.at("presets")) {
            loaded.push_back(core::ScanPreset::fromJson(entry));
        }
    }
    presets_ = std::move(loaded);
}

std::optional<core::ScanPreset> PresetCatalog::findById(const std::string& id) const {
    for (const auto& preset : presets_) {
        if (preset.id == id) {
            return preset;
        }
    }
    return std::nullopt;
}

} // namespace channelscout::infra
