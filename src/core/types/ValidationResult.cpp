#include "core/types/ValidationResult.hpp"

#include <ctime>

namespace channelscout::core {

namespace {

std::string toIso8601(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

} // namespace

ValidationResult ValidationResult::valid(std::string url, std::string protocol,
                                         std::optional<std::string> resolution,
                                         std::optional<std::string> videoCodec,
                                         std::optional<std::string> audioCodec) {
    ValidationResult result;
    result.url = std::move(url);
    result.protocol = std::move(protocol);
    result.isValid = true;
    result.resolution = std::move(resolution);
    result.videoCodec = std::move(videoCodec);
    result.audioCodec = std::move(audioCodec);
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

ValidationResult ValidationResult::invalid(std::string url, std::string protocol,
                                           ErrorCategory category, std::string message) {
    ValidationResult result;
    result.url = std::move(url);
    result.protocol = std::move(protocol);
    result.isValid = false;
    result.errorCategory = category;
    result.errorMessage = std::move(message);
    result.timestamp = std::chrono::system_clock::now();
    return result;
}

std::string ValidationResult::categoryToString(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::NetworkUnreachable:
        return "network_unreachable";
    case ErrorCategory::Timeout:
        return "timeout";
    case ErrorCategory::NoVideoStream:
        return "no_video_stream";
    case ErrorCategory::UnsupportedCodec:
        return "unsupported_codec";
    case ErrorCategory::UnsupportedProtocol:
        return "unsupported_protocol";
    case ErrorCategory::MulticastNotSupported:
        return "multicast_not_supported";
    }
    return "network_unreachable";
}

std::optional<ErrorCategory> ValidationResult::categoryFromString(const std::string& str) {
    if (str == "network_unreachable")
        return ErrorCategory::NetworkUnreachable;
    if (str == "timeout")
        return ErrorCategory::Timeout;
    if (str == "no_video_stream")
        return ErrorCategory::NoVideoStream;
    if (str == "unsupported_codec")
        return ErrorCategory::UnsupportedCodec;
    if (str == "unsupported_protocol")
        return ErrorCategory::UnsupportedProtocol;
    if (str == "multicast_not_supported")
        return ErrorCategory::MulticastNotSupported;
    return std::nullopt;
}

nlohmann::json ValidationResult::toJson() const {
    nlohmann::json j;
    j["url"] = url;
    j["protocol"] = protocol;
    j["is_valid"] = isValid;
    j["resolution"] = resolution ? nlohmann::json(*resolution) : nlohmann::json(nullptr);
    j["codec_video"] = videoCodec ? nlohmann::json(*videoCodec) : nlohmann::json(nullptr);
    j["codec_audio"] = audioCodec ? nlohmann::json(*audioCodec) : nlohmann::json(nullptr);
    j["error_category"] =
        errorCategory ? nlohmann::json(categoryToString(*errorCategory)) : nlohmann::json(nullptr);
    j["error_message"] = errorMessage ? nlohmann::json(*errorMessage) : nlohmann::json(nullptr);
    j["timestamp"] = toIso8601(timestamp);
    return j;
}

} // namespace channelscout::core
