#include "core/types/ScanPreset.hpp"

namespace channelscout::core {

std::shared_ptr<MulticastStrategy> ScanPreset::toStrategy() const {
    return std::make_shared<MulticastStrategy>(protocol, ipRanges, ports);
}

ScanPreset ScanPreset::fromJson(const nlohmann::json& j) {
    ScanPreset preset;
    preset.id = j.at("id").get<std::string>();
    preset.name = j.at("name").get<std::string>();
    preset.protocol = j.at("protocol").get<std::string>();
    preset.ipRanges = j.value("ip_ranges", std::vector<std::string>{});
    preset.ports = j.value("ports", std::vector<int>{});

    if (j.contains("description") && !j["description"].is_null()) {
        preset.description = j["description"].get<std::string>();
    }
    if (j.contains("estimated_targets") && !j["estimated_targets"].is_null()) {
        preset.estimatedTargets = j["estimated_targets"].get<int>();
    }
    if (j.contains("estimated_duration") && !j["estimated_duration"].is_null()) {
        preset.estimatedDuration = j["estimated_duration"].get<std::string>();
    }
    if (j.contains("reference") && !j["reference"].is_null()) {
        preset.reference = j["reference"].get<std::string>();
    }
    return preset;
}

nlohmann::json ScanPreset::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["protocol"] = protocol;
    j["ip_ranges"] = ipRanges;
    j["ports"] = ports;
    if (description) {
        j["description"] = *description;
    }
    if (estimatedTargets) {
        j["estimated_targets"] = *estimatedTargets;
    }
    if (estimatedDuration) {
        j["estimated_duration"] = *estimatedDuration;
    }
    if (reference) {
        j["reference"] = *reference;
    }
    return j;
}

} // namespace channelscout::core
