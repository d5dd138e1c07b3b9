#pragma once

#include "core/services/IResultStream.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <type_traits>

namespace channelscout::infra {

/**
 * @brief Raised when work executed through the RateLimiter exceeds its deadline.
 */
class ProbeTimeoutError : public std::runtime_error {
public:
    explicit ProbeTimeoutError(std::chrono::milliseconds timeout);

    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Counting admission gate with a per-execution deadline.
 *
 * At most maxConcurrency() executions are admitted at a time; further callers block
 * until a slot frees up. Admitted work runs on the AsioContext worker pool while the
 * caller waits for it, its deadline, or an external stop request. The slot is
 * released when execute() returns, whatever the outcome.
 *
 * The work receives a std::stop_token that is triggered when its caller stops waiting
 * (deadline or cancellation), so long-running work such as a subprocess can abort.
 */
class RateLimiter {
public:
    static constexpr int kMaxConcurrency = 50;

    /**
     * @brief Constructs a RateLimiter.
     * @param context Worker pool the admitted work runs on.
     * @param maxConcurrency Number of admission slots, 1-50.
     * @param timeout Default deadline for each execution, must be positive.
     * @throws std::invalid_argument if either bound is violated.
     */
    RateLimiter(AsioContext& context, int maxConcurrency = 10,
                std::chrono::milliseconds timeout = std::chrono::seconds(10));

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    [[nodiscard]] int maxConcurrency() const { return capacity_; }
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }

    /**
     * @brief Number of executions currently holding a slot.
     */
    [[nodiscard]] int activeCount() const;

    /**
     * @brief Runs work under the concurrency and deadline constraints.
     * @tparam Work Callable taking std::stop_token and returning a value.
     * @param work Work to execute on the worker pool.
     * @param timeout Deadline for this execution; the default timeout if omitted.
     * @param cancel External cancellation; aborts waiting for a slot or for the work.
     * @return The value returned by the work.
     * @throws ProbeTimeoutError if the deadline expires first.
     * @throws core::OperationCancelled if cancel is triggered first.
     * @throws Any exception thrown by the work itself.
     */
    template <typename Work>
    auto execute(Work&& work, std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                 std::stop_token cancel = {}) -> std::invoke_result_t<std::decay_t<Work>&, std::stop_token> {
        using Result = std::invoke_result_t<std::decay_t<Work>&, std::stop_token>;
        static_assert(!std::is_void_v<Result>, "RateLimiter work must return a value");

        acquire(cancel);
        SlotGuard slot(*this);

        auto state = std::make_shared<ExecutionState<Result>>();
        std::stop_source workStop;
        context_.post([state, token = workStop.get_token(),
                       fn = std::decay_t<Work>(std::forward<Work>(work))]() mutable {
            try {
                auto value = fn(token);
                std::lock_guard lock(state->mutex);
                state->value.emplace(std::move(value));
                state->done = true;
            } catch (...) {
                std::lock_guard lock(state->mutex);
                state->error = std::current_exception();
                state->done = true;
            }
            state->cv.notify_all();
        });

        auto effective = timeout.value_or(timeout_);
        auto deadline = std::chrono::steady_clock::now() + effective;

        std::unique_lock lock(state->mutex);
        bool finished = state->cv.wait_until(lock, cancel, deadline, [&state] { return state->done; });
        if (!finished) {
            workStop.request_stop();
            if (cancel.stop_requested()) {
                throw core::OperationCancelled();
            }
            throw ProbeTimeoutError(effective);
        }
        if (state->error) {
            std::rethrow_exception(state->error);
        }
        return std::move(*state->value);
    }

private:
    template <typename T>
    struct ExecutionState {
        std::mutex mutex;
        std::condition_variable_any cv;
        std::optional<T> value;
        std::exception_ptr error;
        bool done{false};
    };

    class SlotGuard {
    public:
        explicit SlotGuard(RateLimiter& limiter) : limiter_(limiter) {}
        ~SlotGuard() { limiter_.release(); }

        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;

    private:
        RateLimiter& limiter_;
    };

    void acquire(std::stop_token cancel);
    void release();

    AsioContext& context_;
    int capacity_;
    std::chrono::milliseconds timeout_;
    int active_{0};
    mutable std::mutex slotMutex_;
    std::condition_variable_any slotAvailable_;
};

} // namespace channelscout::infra
