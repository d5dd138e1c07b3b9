#pragma once

#include "core/types/ScanPreset.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace channelscout::infra {

/**
 * @brief Raised when a scan names a preset the catalog does not contain.
 */
class PresetNotFound : public std::invalid_argument {
public:
    explicit PresetNotFound(const std::string& presetId)
        : std::invalid_argument("Preset not found: " + presetId), presetId_(presetId) {}

    [[nodiscard]] const std::string& presetId() const { return presetId_; }

private:
    std::string presetId_;
};

/**
 * @brief In-memory collection of named multicast scan presets.
 *
 * Populated from a JSON document of the form {"presets": [ ... ]}.
 */
class PresetCatalog {
public:
    PresetCatalog() = default;
    explicit PresetCatalog(std::vector<core::ScanPreset> presets);

    /**
     * @brief Replaces the catalog with the presets in a JSON file.
     * @return True if the file was read; on failure the catalog is left unchanged.
     */
    bool loadFromFile(const std::filesystem::path& path);

    /**
     * @brief Replaces the catalog with the presets in a parsed document.
     * @throws nlohmann::json::exception on malformed entries.
     */
    void loadFromJson(const nlohmann::json& document);

    [[nodiscard]] std::optional<core::ScanPreset> findById(const std::string& id) const;
    [[nodiscard]] const std::vector<core::ScanPreset>& all() const { return presets_; }
    [[nodiscard]] bool empty() const { return presets_.empty(); }

private:
    std::vector<core::ScanPreset> presets_;
};

} // namespace channelscout::infra
