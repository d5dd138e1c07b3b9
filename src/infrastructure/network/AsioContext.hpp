#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace channelscout::infra {

/**
 * @brief Worker pool for blocking probe work and observer dispatch.
 *
 * Wraps an asio::io_context run by a fixed set of threads. Probe invocations are
 * posted here so that a slow or hanging external tool never blocks the thread
 * that consumes scan results.
 *
 * @note This class is non-copyable.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one is always used).
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Starts the worker threads. Has no effect if already running.
     */
    void start();

    /**
     * @brief Stops the context and joins all worker threads.
     *
     * Handlers still queued are discarded.
     */
    void stop();

    /**
     * @brief Posts a handler to be executed on the worker pool.
     * @tparam Handler Move-constructible callable taking no arguments.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Posts a callable and returns a future for its result.
     *
     * Exceptions thrown by the callable are stored in the future.
     */
    template <typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>&>> {
        using Result = std::invoke_result_t<std::decay_t<Func>&>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Func>(func));
        auto future = task->get_future();
        asio::post(ioContext_, [task]() { (*task)(); });
        return future;
    }

private:
    void runWorker(size_t index);

    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace channelscout::infra
