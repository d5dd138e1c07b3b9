#include "core/types/ScanRequest.hpp"

namespace channelscout::core {

void ScanRequest::validate() const {
    if (timeoutSeconds < kMinTimeoutSeconds || timeoutSeconds > kMaxTimeoutSeconds) {
        throw InvalidScanRequest("timeout must be between " + std::to_string(kMinTimeoutSeconds) +
                                 " and " + std::to_string(kMaxTimeoutSeconds) + " seconds");
    }

    if (ports) {
        for (int port : *ports) {
            if (port < 1 || port > 65535) {
                throw InvalidScanRequest("Ports must be within range 1-65535.");
            }
        }
    }

    switch (mode) {
    case ScanMode::Template:
        if (!baseUrl || !startIp || !endIp) {
            throw InvalidScanRequest("Template scan requires base_url, start_ip, and end_ip.");
        }
        break;
    case ScanMode::Multicast: {
        bool anyCustom = protocol || ipRanges || ports;
        bool allCustom = protocol && ipRanges && ports;
        if (presetId && anyCustom) {
            throw InvalidScanRequest(
                "Multicast scan accepts either a preset or protocol, ip_ranges, and ports, "
                "not both.");
        }
        if (!presetId && !allCustom) {
            throw InvalidScanRequest(
                "Multicast scan requires protocol, ip_ranges, and ports or preset.");
        }
        break;
    }
    }
}

ScanRequest ScanRequest::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InvalidScanRequest("Scan request must be a JSON object");
    }

    ScanRequest request;
    try {
        auto modeName = j.at("mode").get<std::string>();
        auto mode = scanModeFromString(modeName);
        if (!mode) {
            throw InvalidScanRequest("Unsupported scan mode: " + modeName);
        }
        request.mode = *mode;

        auto optionalString = [&j](const char* key) -> std::optional<std::string> {
            if (!j.contains(key) || j[key].is_null()) {
                return std::nullopt;
            }
            return j[key].get<std::string>();
        };

        request.baseUrl = optionalString("base_url");
        request.startIp = optionalString("start_ip");
        request.endIp = optionalString("end_ip");
        request.protocol = optionalString("protocol");
        request.presetId = optionalString("preset");

        if (j.contains("ip_ranges") && !j["ip_ranges"].is_null()) {
            request.ipRanges = j["ip_ranges"].get<std::vector<std::string>>();
        }
        if (j.contains("ports") && !j["ports"].is_null()) {
            request.ports = j["ports"].get<std::vector<int>>();
        }

        request.timeoutSeconds = j.value("timeout", 10);
        request.smartScan = j.value("smart_scan", false);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidScanRequest(std::string("Malformed scan request: ") + e.what());
    }

    request.validate();
    return request;
}

} // namespace channelscout::core
