#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"
#include "infrastructure/media/StreamValidator.hpp"

#include <stdexcept>

using namespace channelscout;
using namespace channelscout::infra;
using namespace std::chrono_literals;
using core::ErrorCategory;

namespace {

nlohmann::json videoStream(int width, int height, const std::string& codec) {
    return {{"index", 0}, {"codec_type", "video"}, {"codec_name", codec},
            {"width", width}, {"height", height}};
}

nlohmann::json audioStream(const std::string& codec) {
    return {{"index", 1}, {"codec_type", "audio"}, {"codec_name", codec}};
}

} // namespace

TEST_CASE("StreamValidator protocol detection", "[StreamValidator]") {
    REQUIRE(StreamValidator::detectProtocol("http://192.168.1.1/live") == "http");
    REQUIRE(StreamValidator::detectProtocol("RTSP://cam/stream") == "rtsp");
    REQUIRE(StreamValidator::detectProtocol("udp://239.1.1.1:5000") == "udp");
    REQUIRE_FALSE(StreamValidator::detectProtocol("192.168.1.1:8080").has_value());
    REQUIRE_FALSE(StreamValidator::detectProtocol("://missing").has_value());
}

TEST_CASE("StreamValidator error categorization", "[StreamValidator]") {
    SECTION("Timeout wording wins over everything else") {
        REQUIRE(StreamValidator::categorizeError("Connection timed out", "http") ==
                ErrorCategory::Timeout);
        REQUIRE(StreamValidator::categorizeError("rtsp timeout, connection refused", "rtsp") ==
                ErrorCategory::Timeout);
    }

    SECTION("Network failures") {
        REQUIRE(StreamValidator::categorizeError("Connection refused", "http") ==
                ErrorCategory::NetworkUnreachable);
        REQUIRE(StreamValidator::categorizeError("No route to host", "rtsp") ==
                ErrorCategory::NetworkUnreachable);
        REQUIRE(StreamValidator::categorizeError("Failed to resolve hostname", "http") ==
                ErrorCategory::NetworkUnreachable);
    }

    SECTION("Multicast failures only for rtp") {
        REQUIRE(StreamValidator::categorizeError("Multicast join failed", "rtp") ==
                ErrorCategory::MulticastNotSupported);
        REQUIRE(StreamValidator::categorizeError("Multicast join failed", "udp") ==
                ErrorCategory::NetworkUnreachable);
    }

    SECTION("Unsupported codec needs both words") {
        REQUIRE(StreamValidator::categorizeError("Codec hevc_foo is unsupported", "http") ==
                ErrorCategory::UnsupportedCodec);
        REQUIRE(StreamValidator::categorizeError("Unknown codec", "http") ==
                ErrorCategory::NetworkUnreachable);
    }

    SECTION("Anything else defaults to network unreachable") {
        REQUIRE(StreamValidator::categorizeError("Invalid data found when processing input",
                                                 "http") == ErrorCategory::NetworkUnreachable);
    }
}

TEST_CASE("StreamValidator validation", "[StreamValidator]") {
    auto probe = std::make_shared<test::FakeMediaProbe>();
    StreamValidator validator(probe);

    SECTION("Video with audio yields resolution and codecs") {
        probe->outcome = test::FakeMediaProbe::success(
            {audioStream("aac"), videoStream(1920, 1080, "h264")});

        auto result = validator.validate("http://192.168.1.10:8080/live", 5s);

        REQUIRE(result.isValid);
        REQUIRE(result.protocol == "http");
        REQUIRE(result.resolution == "1920x1080");
        REQUIRE(result.videoCodec == "h264");
        REQUIRE(result.audioCodec == "aac");
        REQUIRE_FALSE(result.errorCategory.has_value());
        REQUIRE(probe->lastTimeout == 5s);
        REQUIRE(probe->lastOptions.empty());
    }

    SECTION("Unknown dimensions leave resolution empty") {
        probe->outcome = test::FakeMediaProbe::success({videoStream(0, 0, "mpeg2video")});

        auto result = validator.validate("udp://239.1.1.1:5000", 5s);
        REQUIRE(result.isValid);
        REQUIRE_FALSE(result.resolution.has_value());
        REQUIRE_FALSE(result.audioCodec.has_value());
    }

    SECTION("Audio only stream has no video") {
        probe->outcome = test::FakeMediaProbe::success({audioStream("mp2")});

        auto result = validator.validate("udp://239.1.1.1:5000", 5s);
        REQUIRE_FALSE(result.isValid);
        REQUIRE(result.errorCategory == ErrorCategory::NoVideoStream);
        REQUIRE(result.errorMessage == "No video stream detected.");
    }

    SECTION("Probe failure is categorized with the trimmed diagnostic") {
        probe->outcome = test::FakeMediaProbe::failure("  Connection refused\n");

        auto result = validator.validate("rtsp://10.0.0.2/cam", 5s);
        REQUIRE_FALSE(result.isValid);
        REQUIRE(result.errorCategory == ErrorCategory::NetworkUnreachable);
        REQUIRE(result.errorMessage == "Connection refused");
    }

    SECTION("Empty diagnostic gets a generic message") {
        probe->outcome = test::FakeMediaProbe::failure("");

        auto result = validator.validate("http://10.0.0.2/", 5s);
        REQUIRE(result.errorMessage == "Unknown FFmpeg error.");
    }

    SECTION("Unsupported scheme never reaches the probe") {
        auto result = validator.validate("ftp://10.0.0.2/video.ts", 5s);

        REQUIRE_FALSE(result.isValid);
        REQUIRE(result.protocol == "ftp");
        REQUIRE(result.errorCategory == ErrorCategory::UnsupportedProtocol);
        REQUIRE(probe->calls == 0);
    }

    SECTION("Missing scheme reports unknown protocol") {
        auto result = validator.validate("10.0.0.2/video.ts", 5s);
        REQUIRE(result.protocol == "unknown");
        REQUIRE(result.errorCategory == ErrorCategory::UnsupportedProtocol);
    }

    SECTION("Unavailable tool is reported as unsupported protocol") {
        probe->available = false;

        auto result = validator.validate("http://10.0.0.2/", 5s);
        REQUIRE(result.errorCategory == ErrorCategory::UnsupportedProtocol);
        REQUIRE(result.errorMessage == "FFmpeg is not installed.");
        REQUIRE(probe->calls == 0);
    }
}

TEST_CASE("StreamValidator protocol profiles", "[StreamValidator]") {
    auto probe = std::make_shared<test::FakeMediaProbe>();
    probe->outcome = test::FakeMediaProbe::success({videoStream(720, 576, "mpeg2video")});
    StreamValidator validator(probe);

    SECTION("RTSP forces TCP transport") {
        validator.validate("rtsp://10.0.0.2/cam", 5s);
        REQUIRE(probe->lastOptions == core::ProbeOptions{{"rtsp_transport", "tcp"}});
    }

    SECTION("RTP raises the timeout to its floor and enlarges buffers") {
        validator.validate("rtp://239.3.1.1:8000", 5s);
        REQUIRE(probe->lastTimeout == StreamValidator::kRtpMinimumTimeout);
        REQUIRE(probe->lastOptions.size() == 3);
        REQUIRE(validator.effectiveTimeout("rtp://239.3.1.1:8000", 5s) == 20s);
        REQUIRE(validator.effectiveTimeout("rtp://239.3.1.1:8000", 30s) == 30s);
    }

    SECTION("UDP keeps the requested timeout") {
        validator.validate("udp://239.1.1.1:5000", 7s);
        REQUIRE(probe->lastTimeout == 7s);
        REQUIRE(validator.effectiveTimeout("udp://239.1.1.1:5000", 7s) == 7s);
    }

    SECTION("Supported protocol list") {
        for (const auto* protocol : {"http", "https", "rtsp", "rtp", "udp"}) {
            REQUIRE(validator.supports(protocol));
        }
        REQUIRE_FALSE(validator.supports("rtmp"));
    }
}

TEST_CASE("StreamValidator requires a probe", "[StreamValidator]") {
    REQUIRE_THROWS_AS(StreamValidator(nullptr), std::invalid_argument);
}
