#pragma once

#include "core/strategy/MulticastStrategy.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace channelscout::core {

/**
 * @brief Named multicast configuration, typically describing one provider's block.
 */
struct ScanPreset {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::string protocol;                  ///< "udp" or "rtp"
    std::vector<std::string> ipRanges;
    std::vector<int> ports;
    std::optional<int> estimatedTargets;
    std::optional<std::string> estimatedDuration;
    std::optional<std::string> reference;

    /**
     * @brief Builds the multicast strategy described by this preset.
     * @throws std::invalid_argument if the preset's ranges or ports are invalid.
     */
    [[nodiscard]] std::shared_ptr<MulticastStrategy> toStrategy() const;

    /**
     * @brief Parses a preset entry.
     * @throws nlohmann::json::exception if a required field is missing or ill-typed.
     */
    static ScanPreset fromJson(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json toJson() const;
};

} // namespace channelscout::core
