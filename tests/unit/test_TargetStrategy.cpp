#include <catch2/catch_test_macros.hpp>

#include "core/strategy/MulticastStrategy.hpp"
#include "core/strategy/TemplateStrategy.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace channelscout::core;

namespace {

std::vector<std::string> drain(const ITargetStrategy& strategy) {
    std::vector<std::string> urls;
    auto cursor = strategy.generateTargets();
    while (auto url = cursor->next()) {
        urls.push_back(*url);
    }
    return urls;
}

} // namespace

TEST_CASE("ScanMode names", "[TargetStrategy]") {
    REQUIRE(scanModeToString(ScanMode::Template) == "template");
    REQUIRE(scanModeToString(ScanMode::Multicast) == "multicast");
    REQUIRE(scanModeFromString("multicast") == ScanMode::Multicast);
    REQUIRE_FALSE(scanModeFromString("broadcast").has_value());
}

TEST_CASE("TemplateStrategy target generation", "[TargetStrategy][TemplateStrategy]") {
    SECTION("Substitutes every address of the range in order") {
        TemplateStrategy strategy("http://{ip}:8080/live", "192.168.1.1", "192.168.1.3");

        REQUIRE(strategy.mode() == ScanMode::Template);
        REQUIRE(strategy.estimateTargetCount() == 3);
        REQUIRE(drain(strategy) == std::vector<std::string>{
                                       "http://192.168.1.1:8080/live",
                                       "http://192.168.1.2:8080/live",
                                       "http://192.168.1.3:8080/live",
                                   });
    }

    SECTION("Single address range") {
        TemplateStrategy strategy("rtsp://{ip}/stream1", "10.0.0.5", "10.0.0.5");
        REQUIRE(strategy.estimateTargetCount() == 1);
        REQUIRE(drain(strategy) == std::vector<std::string>{"rtsp://10.0.0.5/stream1"});
    }

    SECTION("Crosses octet boundaries") {
        TemplateStrategy strategy("http://{ip}/", "192.168.1.255", "192.168.2.0");
        REQUIRE(drain(strategy) ==
                std::vector<std::string>{"http://192.168.1.255/", "http://192.168.2.0/"});
    }

    SECTION("Each cursor restarts from the beginning") {
        TemplateStrategy strategy("http://{ip}/", "172.16.0.1", "172.16.0.2");
        REQUIRE(drain(strategy).size() == 2);
        REQUIRE(drain(strategy).size() == 2);
    }

    SECTION("Accepts exactly the maximum range") {
        TemplateStrategy strategy("http://{ip}/", "10.0.0.0", "10.0.3.255");
        REQUIRE(strategy.estimateTargetCount() == TemplateStrategy::kMaxRange);
    }
}

TEST_CASE("TemplateStrategy validation", "[TargetStrategy][TemplateStrategy]") {
    SECTION("Placeholder must appear exactly once") {
        REQUIRE_THROWS_AS(TemplateStrategy("http://192.168.1.1/", "192.168.1.1", "192.168.1.2"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(TemplateStrategy("http://{ip}/{ip}", "192.168.1.1", "192.168.1.2"),
                          std::invalid_argument);
    }

    SECTION("Start must not exceed end") {
        REQUIRE_THROWS_AS(TemplateStrategy("http://{ip}/", "192.168.1.10", "192.168.1.1"),
                          std::invalid_argument);
    }

    SECTION("Range larger than the maximum is rejected") {
        REQUIRE_THROWS_AS(TemplateStrategy("http://{ip}/", "10.0.0.0", "10.0.4.0"),
                          std::invalid_argument);
    }

    SECTION("Public addresses are rejected") {
        REQUIRE_THROWS_AS(TemplateStrategy("http://{ip}/", "8.8.8.8", "8.8.8.9"),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(TemplateStrategy("http://{ip}/", "172.31.255.255", "172.32.0.0"),
                          std::invalid_argument);
    }

    SECTION("Invalid addresses are rejected") {
        REQUIRE_THROWS_AS(TemplateStrategy("http://{ip}/", "192.168.1", "192.168.1.5"),
                          std::invalid_argument);
    }
}

TEST_CASE("MulticastStrategy target generation", "[TargetStrategy][MulticastStrategy]") {
    SECTION("Enumerates addresses outer and ports inner") {
        MulticastStrategy strategy("udp", {"239.1.1.1-239.1.1.2"}, {5000, 5001});

        REQUIRE(strategy.mode() == ScanMode::Multicast);
        REQUIRE(strategy.estimateTargetCount() == 4);
        REQUIRE(drain(strategy) == std::vector<std::string>{
                                       "udp://239.1.1.1:5000",
                                       "udp://239.1.1.1:5001",
                                       "udp://239.1.1.2:5000",
                                       "udp://239.1.1.2:5001",
                                   });
    }

    SECTION("Single address ranges and multiple ranges") {
        MulticastStrategy strategy("RTP", {"239.3.1.1", "239.3.2.10-239.3.2.11"}, {8000});

        REQUIRE(strategy.protocol() == "rtp");
        REQUIRE(strategy.addressCount() == 3);
        REQUIRE(strategy.estimateTargetCount() == 3);
        REQUIRE(drain(strategy) == std::vector<std::string>{
                                       "rtp://239.3.1.1:8000",
                                       "rtp://239.3.2.10:8000",
                                       "rtp://239.3.2.11:8000",
                                   });
    }

    SECTION("Address list matches the range order") {
        MulticastStrategy strategy("udp", {"239.0.0.254-239.0.1.1"}, {1234});
        auto addresses = strategy.addresses();
        REQUIRE(addresses.size() == 4);
        REQUIRE(addresses.front().toString() == "239.0.0.254");
        REQUIRE(addresses.back().toString() == "239.0.1.1");
    }

    SECTION("Preserves port order") {
        MulticastStrategy strategy("udp", {"224.0.0.1"}, {9000, 1234, 5000});
        REQUIRE(strategy.ports() == std::vector<uint16_t>{9000, 1234, 5000});
    }
}

TEST_CASE("MulticastStrategy validation", "[TargetStrategy][MulticastStrategy]") {
    SECTION("Only udp and rtp are accepted") {
        REQUIRE_THROWS_AS(MulticastStrategy("http", {"239.1.1.1"}, {80}), std::invalid_argument);
    }

    SECTION("Ranges and ports must be present") {
        REQUIRE_THROWS_AS(MulticastStrategy("udp", {}, {5000}), std::invalid_argument);
        REQUIRE_THROWS_AS(MulticastStrategy("udp", {"239.1.1.1"}, {}), std::invalid_argument);
    }

    SECTION("Ports must be within 1-65535") {
        REQUIRE_THROWS_AS(MulticastStrategy("udp", {"239.1.1.1"}, {0}), std::invalid_argument);
        REQUIRE_THROWS_AS(MulticastStrategy("udp", {"239.1.1.1"}, {65536}),
                          std::invalid_argument);
        REQUIRE_NOTHROW(MulticastStrategy("udp", {"239.1.1.1"}, {1, 65535}));
    }

    SECTION("Ranges must stay inside the multicast block") {
        REQUIRE_THROWS_AS(MulticastStrategy("udp", {"192.168.1.1"}, {5000}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(MulticastStrategy("udp", {"239.255.255.255-240.0.0.1"}, {5000}),
                          std::invalid_argument);
    }

    SECTION("Malformed and reversed ranges are rejected") {
        REQUIRE_THROWS_AS(MulticastStrategy::parseRange("239.1.1"), std::invalid_argument);
        REQUIRE_THROWS_AS(MulticastStrategy::parseRange("239.1.1.10-239.1.1.1"),
                          std::invalid_argument);
    }
}
