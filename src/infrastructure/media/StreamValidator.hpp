#pragma once

#include "core/services/IMediaProbe.hpp"
#include "core/services/IStreamValidator.hpp"

#include <map>
#include <memory>
#include <optional>

namespace channelscout::infra {

/**
 * @brief Probe settings for one URL scheme.
 */
struct ProtocolProfile {
    core::ProbeOptions options;          ///< Options forwarded to the probe tool
    std::chrono::seconds minimumTimeout; ///< Floor applied to the requested timeout
};

/**
 * @brief Validates candidate streams by probing them with an IMediaProbe.
 *
 * Protocol handling is table driven: each supported scheme maps to a
 * ProtocolProfile. Every failure is folded into the returned ValidationResult.
 */
class StreamValidator : public core::IStreamValidator {
public:
    static constexpr std::chrono::seconds kRtpMinimumTimeout{20};

    explicit StreamValidator(std::shared_ptr<core::IMediaProbe> probe);

    core::ValidationResult validate(const std::string& url,
                                    std::chrono::seconds timeout = kDefaultTimeout,
                                    std::stop_token stopToken = {}) override;

    std::chrono::seconds effectiveTimeout(const std::string& url,
                                          std::chrono::seconds requested) const override;

    /**
     * @brief Extracts the lower-case scheme of a URL.
     * @return The scheme, or nullopt if the URL has none.
     */
    static std::optional<std::string> detectProtocol(const std::string& url);

    /**
     * @brief Classifies probe diagnostic text into an error category.
     * @param diagnostic Text the probe tool wrote to standard error.
     * @param protocol Scheme of the probed URL.
     */
    static core::ErrorCategory categorizeError(const std::string& diagnostic,
                                               const std::string& protocol);

    /**
     * @brief Returns true if the scheme has a probe profile.
     */
    [[nodiscard]] bool supports(const std::string& protocol) const;

private:
    core::ValidationResult parseProbeResult(const std::string& url, const std::string& protocol,
                                            const nlohmann::json& metadata) const;

    std::shared_ptr<core::IMediaProbe> probe_;
    std::map<std::string, ProtocolProfile> profiles_;
};

} // namespace channelscout::infra
