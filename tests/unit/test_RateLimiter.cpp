#include <catch2/catch_test_macros.hpp>

#include "TestDoubles.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "infrastructure/scanner/RateLimitedValidator.hpp"
#include "infrastructure/scanner/RateLimiter.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace channelscout;
using namespace channelscout::infra;
using namespace std::chrono_literals;

TEST_CASE("RateLimiter construction", "[RateLimiter]") {
    AsioContext context(1);

    REQUIRE_THROWS_AS(RateLimiter(context, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(RateLimiter(context, RateLimiter::kMaxConcurrency + 1),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(RateLimiter(context, 5, 0ms), std::invalid_argument);

    RateLimiter limiter(context, 5, 3s);
    REQUIRE(limiter.maxConcurrency() == 5);
    REQUIRE(limiter.timeout() == 3s);
    REQUIRE(limiter.activeCount() == 0);
}

TEST_CASE("RateLimiter execution", "[RateLimiter]") {
    AsioContext context(4);
    context.start();
    RateLimiter limiter(context, 2, 2s);

    SECTION("Returns the work result") {
        auto value = limiter.execute([](std::stop_token) { return 42; });
        REQUIRE(value == 42);
        REQUIRE(limiter.activeCount() == 0);
    }

    SECTION("Propagates exceptions from the work") {
        REQUIRE_THROWS_AS(limiter.execute([](std::stop_token) -> int {
                              throw std::runtime_error("probe exploded");
                          }),
                          std::runtime_error);
        REQUIRE(limiter.activeCount() == 0);
    }

    SECTION("Times out and stops the work") {
        std::atomic<bool> sawStop{false};
        REQUIRE_THROWS_AS(limiter.execute(
                              [&sawStop](std::stop_token token) {
                                  while (!token.stop_requested()) {
                                      std::this_thread::sleep_for(5ms);
                                  }
                                  sawStop = true;
                                  return 0;
                              },
                              50ms),
                          ProbeTimeoutError);
        REQUIRE(limiter.activeCount() == 0);

        for (int i = 0; i < 100 && !sawStop; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        REQUIRE(sawStop);
    }

    SECTION("Cancellation interrupts a waiting caller") {
        std::stop_source cancel;
        std::thread canceller([&cancel] {
            std::this_thread::sleep_for(50ms);
            cancel.request_stop();
        });

        REQUIRE_THROWS_AS(limiter.execute(
                              [](std::stop_token token) {
                                  while (!token.stop_requested()) {
                                      std::this_thread::sleep_for(5ms);
                                  }
                                  return 0;
                              },
                              std::nullopt, cancel.get_token()),
                          core::OperationCancelled);
        canceller.join();
        REQUIRE(limiter.activeCount() == 0);
    }
}

TEST_CASE("RateLimiter bounds concurrency", "[RateLimiter]") {
    AsioContext context(8);
    context.start();
    RateLimiter limiter(context, 2, 5s);

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> callers;

    for (int i = 0; i < 8; ++i) {
        callers.emplace_back([&] {
            limiter.execute([&](std::stop_token) {
                int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(20ms);
                --running;
                return 0;
            });
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    REQUIRE(peak.load() <= 2);
    REQUIRE(peak.load() >= 1);
    REQUIRE(limiter.activeCount() == 0);
}

TEST_CASE("RateLimiter timeouts leave sibling calls intact", "[RateLimiter]") {
    AsioContext context(4);
    context.start();
    RateLimiter limiter(context, 2, 2s);

    std::atomic<bool> slowTimedOut{false};
    std::thread slowCaller([&] {
        try {
            limiter.execute(
                [](std::stop_token token) {
                    while (!token.stop_requested()) {
                        std::this_thread::sleep_for(5ms);
                    }
                    return 0;
                },
                100ms);
        } catch (const ProbeTimeoutError&) {
            slowTimedOut = true;
        }
    });

    // Outlives the sibling's deadline.
    auto value = limiter.execute([](std::stop_token) {
        std::this_thread::sleep_for(300ms);
        return 7;
    });
    slowCaller.join();

    REQUIRE(slowTimedOut);
    REQUIRE(value == 7);
    REQUIRE(limiter.activeCount() == 0);

    SECTION("Freed slots are reusable") {
        std::vector<std::thread> callers;
        std::atomic<int> sum{0};
        for (int i = 1; i <= 2; ++i) {
            callers.emplace_back([&limiter, &sum, i] {
                sum += limiter.execute([i](std::stop_token) { return i; });
            });
        }
        for (auto& caller : callers) {
            caller.join();
        }
        REQUIRE(sum == 3);
        REQUIRE(limiter.activeCount() == 0);
    }
}

TEST_CASE("RateLimitedValidator", "[RateLimiter][RateLimitedValidator]") {
    AsioContext context(2);
    context.start();
    auto limiter = std::make_shared<RateLimiter>(context, 2, 5s);
    auto inner = std::make_shared<test::FakeStreamValidator>();

    SECTION("Forwards results from the wrapped validator") {
        inner->validUrls = {"http://192.168.1.1/live"};
        RateLimitedValidator validator(inner, limiter);

        auto result = validator.validate("http://192.168.1.1/live", 3s);
        REQUIRE(result.isValid);
        REQUIRE(inner->timeoutFor("http://192.168.1.1/live") == 3s);
    }

    SECTION("Outer deadline adds the grace period") {
        RateLimitedValidator validator(inner, limiter, 4s);
        REQUIRE(validator.effectiveTimeout("udp://239.1.1.1:5000", 10s) == 14s);
    }

    SECTION("Deadline overrun becomes a timeout result") {
        inner->blockUntilStopped = true;
        RateLimitedValidator validator(inner, limiter, 0s);

        auto result = validator.validate("rtsp://10.0.0.9/cam", 1s);
        REQUIRE_FALSE(result.isValid);
        REQUIRE(result.protocol == "rtsp");
        REQUIRE(result.errorCategory == core::ErrorCategory::Timeout);
    }

    SECTION("Requires both collaborators") {
        REQUIRE_THROWS_AS(RateLimitedValidator(nullptr, limiter), std::invalid_argument);
        REQUIRE_THROWS_AS(RateLimitedValidator(inner, nullptr), std::invalid_argument);
    }
}
