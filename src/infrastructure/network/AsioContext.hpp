/**
 * @file AsioContext.hpp
 * @brief Shared asio::io_context with its worker threads.
 */

#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace lanwatch::infra {

/**
 * @brief Worker threads running one io_context.
 *
 * The scan orchestrator schedules its periodic timer here and posts
 * background sweeps to it; the daemon waits for shutdown signals on it.
 * A work guard keeps the threads alive while the queue is empty.
 *
 * @note Non-copyable. stop() may be followed by another start().
 */
class AsioContext {
public:
    /// @param threadCount Worker threads to spawn; 0 is treated as 1.
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency());

    /// Stops and joins the workers.
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /// Spawns the workers. No-op when already running.
    void start();

    /**
     * @brief Drops the work guard, stops the context and joins every worker.
     *
     * Handlers still queued are discarded. The context is restarted so a
     * later start() runs it again.
     */
    void stop();

    asio::io_context& ioContext() { return ioContext_; }

    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] size_t threadCount() const { return threadCount_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    size_t threadCount_;
};

} // namespace lanwatch::infra
