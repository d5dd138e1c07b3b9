#pragma once

#include "core/services/IMediaProbe.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace channelscout::infra {

/**
 * @brief IMediaProbe backed by the ffprobe executable.
 *
 * Runs "ffprobe -v error -print_format json -show_format -show_streams <options> <url>"
 * and parses the JSON it prints. The deadline is enforced by killing the process.
 */
class FfprobeMediaProbe : public core::IMediaProbe {
public:
    /**
     * @brief Constructs the probe.
     * @param ffprobePath Program name or path of ffprobe.
     * @param customArgs Extra arguments placed before the URL on every invocation.
     */
    explicit FfprobeMediaProbe(std::string ffprobePath = "ffprobe",
                               std::vector<std::string> customArgs = {});

    bool isAvailable() override;

    core::ProbeOutcome probe(const std::string& url, const core::ProbeOptions& options,
                             std::chrono::seconds timeout, std::stop_token stopToken) override;

    /**
     * @brief Builds the ffprobe argument list for a URL.
     */
    [[nodiscard]] std::vector<std::string> buildArguments(const std::string& url,
                                                          const core::ProbeOptions& options) const;

private:
    std::string ffprobePath_;
    std::vector<std::string> customArgs_;
    std::atomic<bool> located_{false}; ///< Set once the executable has been found
};

} // namespace channelscout::infra
