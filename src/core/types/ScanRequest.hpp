/**
 * @file ScanRequest.hpp
 * @brief Scan start request accepted by the session manager.
 */

#pragma once

#include "core/strategy/ITargetStrategy.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace channelscout::core {

/**
 * @brief Raised when a scan request is rejected before any session is created.
 */
class InvalidScanRequest : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Parameters of a scan start request.
 *
 * Template mode requires baseUrl, startIp and endIp. Multicast mode requires
 * either presetId or all of protocol, ipRanges and ports, but not both.
 */
struct ScanRequest {
    static constexpr int kMinTimeoutSeconds = 1;
    static constexpr int kMaxTimeoutSeconds = 60;

    ScanMode mode{ScanMode::Template};
    std::optional<std::string> baseUrl;
    std::optional<std::string> startIp;
    std::optional<std::string> endIp;
    std::optional<std::string> protocol;
    std::optional<std::vector<std::string>> ipRanges;
    std::optional<std::vector<int>> ports;
    std::optional<std::string> presetId;
    int timeoutSeconds{10};   ///< Per-probe timeout, 1-60 seconds
    bool smartScan{false};    ///< Use smart port discovery for multicast scans

    /**
     * @brief Checks field presence and bounds for the selected mode.
     * @throws InvalidScanRequest describing the first violation found.
     */
    void validate() const;

    /**
     * @brief Parses a request from its JSON form and validates it.
     * @throws InvalidScanRequest on missing/ill-typed fields or failed validation.
     */
    static ScanRequest fromJson(const nlohmann::json& j);
};

} // namespace channelscout::core
