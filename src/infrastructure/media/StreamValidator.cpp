#include "infrastructure/media/StreamValidator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace channelscout::infra {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::optional<std::string> stringField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it != object.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

int64_t intField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it != object.end() && it->is_number_integer()) {
        return it->get<int64_t>();
    }
    return 0;
}

const nlohmann::json* findStream(const nlohmann::json& streams, const std::string& type) {
    for (const auto& stream : streams) {
        if (stream.is_object() && stringField(stream, "codec_type") == type) {
            return &stream;
        }
    }
    return nullptr;
}

} // namespace

StreamValidator::StreamValidator(std::shared_ptr<core::IMediaProbe> probe)
    : probe_(std::move(probe)) {
    if (!probe_) {
        throw std::invalid_argument("StreamValidator requires a media probe");
    }

    const std::chrono::seconds none{0};
    profiles_["http"] = ProtocolProfile{{}, none};
    profiles_["https"] = ProtocolProfile{{}, none};
    profiles_["rtsp"] = ProtocolProfile{{{"rtsp_transport", "tcp"}}, none};
    profiles_["rtp"] = ProtocolProfile{
        {{"analyzeduration", "10M"}, {"probesize", "10M"}, {"rtbufsize", "2048k"}},
        kRtpMinimumTimeout};
    profiles_["udp"] = ProtocolProfile{{{"analyzeduration", "5M"}, {"probesize", "5M"}}, none};
}

bool StreamValidator::supports(const std::string& protocol) const {
    return profiles_.contains(protocol);
}

std::optional<std::string> StreamValidator::detectProtocol(const std::string& url) {
    auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }
    auto scheme = url.substr(0, pos);
    bool wellFormed = std::isalpha(static_cast<unsigned char>(scheme.front())) &&
                      std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
                          return std::isalnum(c) || c == '+' || c == '-' || c == '.';
                      });
    if (!wellFormed) {
        return std::nullopt;
    }
    return toLower(scheme);
}

std::chrono::seconds StreamValidator::effectiveTimeout(const std::string& url,
                                                       std::chrono::seconds requested) const {
    auto protocol = detectProtocol(url);
    if (!protocol) {
        return requested;
    }
    auto it = profiles_.find(*protocol);
    if (it == profiles_.end()) {
        return requested;
    }
    return std::max(requested, it->second.minimumTimeout);
}

core::ValidationResult StreamValidator::validate(const std::string& url,
                                                 std::chrono::seconds timeout,
                                                 std::stop_token stopToken) {
    auto protocol = detectProtocol(url);
    if (!protocol || !supports(*protocol)) {
        spdlog::warn("Unsupported protocol for URL {}", url);
        return core::ValidationResult::invalid(url, protocol.value_or("unknown"),
                                               core::ErrorCategory::UnsupportedProtocol,
                                               "Protocol not supported by stream validator.");
    }

    if (!probe_->isAvailable()) {
        spdlog::error("FFmpeg must be installed for stream validation.");
        return core::ValidationResult::invalid(url, *protocol,
                                               core::ErrorCategory::UnsupportedProtocol,
                                               "FFmpeg is not installed.");
    }

    const auto& profile = profiles_.at(*protocol);
    auto probeTimeout = std::max(timeout, profile.minimumTimeout);

    spdlog::debug("Running ffmpeg probe for {} ({})", url, *protocol);
    auto outcome = probe_->probe(url, profile.options, probeTimeout, stopToken);

    if (!outcome.success) {
        auto message = trim(outcome.diagnostic);
        spdlog::warn("FFmpeg error for {}: {}", url, message);
        return core::ValidationResult::invalid(url, *protocol,
                                               categorizeError(outcome.diagnostic, *protocol),
                                               message.empty() ? "Unknown FFmpeg error." : message);
    }

    return parseProbeResult(url, *protocol, outcome.metadata);
}

core::ValidationResult StreamValidator::parseProbeResult(const std::string& url,
                                                         const std::string& protocol,
                                                         const nlohmann::json& metadata) const {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    const nlohmann::json* streams = &kEmpty;
    if (metadata.is_object()) {
        auto it = metadata.find("streams");
        if (it != metadata.end() && it->is_array()) {
            streams = &*it;
        }
    }

    const auto* video = findStream(*streams, "video");
    const auto* audio = findStream(*streams, "audio");

    if (!video) {
        spdlog::info("No video stream detected for {}", url);
        return core::ValidationResult::invalid(url, protocol, core::ErrorCategory::NoVideoStream,
                                               "No video stream detected.");
    }

    std::optional<std::string> resolution;
    auto width = intField(*video, "width");
    auto height = intField(*video, "height");
    if (width != 0 && height != 0) {
        resolution = std::to_string(width) + "x" + std::to_string(height);
    }

    auto result = core::ValidationResult::valid(url, protocol, resolution,
                                                stringField(*video, "codec_name"),
                                                audio ? stringField(*audio, "codec_name")
                                                      : std::nullopt);
    spdlog::debug("Validation success for {}: {} {}", url, result.videoCodec.value_or("?"),
                  result.resolution.value_or("unknown resolution"));
    return result;
}

core::ErrorCategory StreamValidator::categorizeError(const std::string& diagnostic,
                                                     const std::string& protocol) {
    auto text = toLower(diagnostic);

    if (contains(text, "timed out") || contains(text, "timeout")) {
        return core::ErrorCategory::Timeout;
    }
    if (contains(text, "connection refused") || contains(text, "no route") ||
        contains(text, "failed to resolve") || contains(text, "network unreachable")) {
        return core::ErrorCategory::NetworkUnreachable;
    }
    if (protocol == "rtp" && contains(text, "multicast")) {
        return core::ErrorCategory::MulticastNotSupported;
    }
    if (contains(text, "codec") && contains(text, "unsupported")) {
        return core::ErrorCategory::UnsupportedCodec;
    }
    return core::ErrorCategory::NetworkUnreachable;
}

} // namespace channelscout::infra
