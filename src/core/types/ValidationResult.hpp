/**
 * @file ValidationResult.hpp
 * @brief Stream validation results and the failure taxonomy.
 *
 * This file defines the closed set of failure categories reported by the
 * stream validator and the immutable result record produced for each probe.
 */

#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace channelscout::core {

/**
 * @brief Reason a candidate stream failed validation.
 */
enum class ErrorCategory : int {
    NetworkUnreachable = 0,    ///< Connection refused, no route, DNS failure or unknown error
    Timeout = 1,               ///< Probe exceeded its deadline
    NoVideoStream = 2,         ///< Probe succeeded but found no video elementary stream
    UnsupportedCodec = 3,      ///< The media tool could not decode the codec
    UnsupportedProtocol = 4,   ///< Unknown scheme or probing tool not installed
    MulticastNotSupported = 5  ///< Multicast join failed for an RTP stream
};

/**
 * @brief Outcome of validating one candidate stream URL.
 *
 * A valid result always has a video codec detected and no error category.
 * An invalid result always carries an error category.
 */
struct ValidationResult {
    std::string url;                              ///< Probed URL
    std::string protocol;                         ///< Lower-case URL scheme ("unknown" if absent)
    bool isValid{false};                          ///< True if a video stream was detected
    std::optional<std::string> resolution;        ///< "{width}x{height}" when both are known
    std::optional<std::string> videoCodec;        ///< Video codec name
    std::optional<std::string> audioCodec;        ///< Audio codec name, if an audio stream exists
    std::optional<ErrorCategory> errorCategory;   ///< Failure category when invalid
    std::optional<std::string> errorMessage;      ///< Trimmed diagnostic text when invalid
    std::chrono::system_clock::time_point timestamp; ///< When the result was produced

    /**
     * @brief Builds a successful result.
     */
    static ValidationResult valid(std::string url, std::string protocol,
                                  std::optional<std::string> resolution,
                                  std::optional<std::string> videoCodec,
                                  std::optional<std::string> audioCodec);

    /**
     * @brief Builds a failed result.
     */
    static ValidationResult invalid(std::string url, std::string protocol, ErrorCategory category,
                                    std::string message);

    /**
     * @brief Converts an ErrorCategory to its wire name (e.g. "network_unreachable").
     */
    static std::string categoryToString(ErrorCategory category);

    /**
     * @brief Parses a wire name back into an ErrorCategory.
     * @return The category, or nullopt for an unknown name.
     */
    static std::optional<ErrorCategory> categoryFromString(const std::string& str);

    /**
     * @brief Serializes the result for logs, the CLI and storage export.
     */
    [[nodiscard]] nlohmann::json toJson() const;

    bool operator==(const ValidationResult& other) const = default;
};

} // namespace channelscout::core
