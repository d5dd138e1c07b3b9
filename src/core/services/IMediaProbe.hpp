/**
 * @file IMediaProbe.hpp
 * @brief Interface to the external media probing tool.
 *
 * The probe is the only component that touches the network; it runs the
 * external tool against one URL and hands back either stream metadata or
 * the tool's diagnostic text.
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace channelscout::core {

/**
 * @brief Extra "-key value" options passed to the probing tool.
 */
using ProbeOptions = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Raw outcome of one probe invocation.
 */
struct ProbeOutcome {
    bool success{false};      ///< True if the tool exited cleanly with metadata
    nlohmann::json metadata;  ///< Parsed metadata ("streams", "format") on success
    std::string diagnostic;   ///< Diagnostic text (standard error) on failure
};

/**
 * @brief Interface for the media probing backend.
 */
class IMediaProbe {
public:
    virtual ~IMediaProbe() = default;

    /**
     * @brief Checks whether the probing tool can be executed.
     * @return True if the tool is installed and reachable.
     */
    virtual bool isAvailable() = 0;

    /**
     * @brief Probes a URL for stream metadata.
     * @param url Stream URL to probe.
     * @param options Protocol-specific tool options.
     * @param timeout Deadline for the whole invocation.
     * @param stopToken Aborts the invocation early when stop is requested.
     * @return ProbeOutcome with metadata or diagnostic text. Never throws for probe failures.
     */
    virtual ProbeOutcome probe(const std::string& url, const ProbeOptions& options,
                               std::chrono::seconds timeout, std::stop_token stopToken) = 0;
};

} // namespace channelscout::core
