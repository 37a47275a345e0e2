/**
 * @file thread_adapter.hpp
 * @brief Adapter for per-frame parallel work using thread_system
 *
 * Frames of encapsulated pixel data have no cross-frame dependency once the
 * offset table has been read, so decoding and encoding can be fanned out to
 * a shared thread pool. This adapter owns that pool.
 *
 * @example
 * @code
 * auto decoded = thread_adapter::run_indexed(frames.size(), [&](std::size_t i) {
 *     return decode_one_frame(frames[i]);
 * });
 * @endcode
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace dcmpix::integration {

/**
 * @struct thread_pool_config
 * @brief Configuration for the frame worker pool
 */
struct thread_pool_config {
    /// Worker threads; 0 selects std::thread::hardware_concurrency()
    std::size_t worker_count = 0;

    /// Batches with fewer jobs run on the calling thread
    std::size_t min_batch_size = 2;

    /// Thread pool name for logging
    std::string pool_name = "dcmpix_frame_pool";
};

/**
 * @class thread_adapter
 * @brief Static facade over a shared kcenon::thread::thread_pool
 *
 * The pool is created lazily and started on the first submission. A stopped
 * pool is recreated by the next start().
 *
 * Thread Safety: All methods are thread-safe.
 */
class thread_adapter {
public:
    /**
     * @brief Replace the pool configuration
     *
     * A worker_count of 0 is resolved to the hardware concurrency and a
     * min_batch_size of 0 to 1. Takes effect the next time the pool starts.
     */
    static void configure(const thread_pool_config& config);

    [[nodiscard]] static auto get_config() -> thread_pool_config;

    /**
     * @brief Start the pool with get_config().worker_count workers
     * @return true if the pool is running afterwards
     */
    [[nodiscard]] static auto start() -> bool;

    [[nodiscard]] static auto is_running() -> bool;

    /**
     * @brief Stop the pool and release it
     * @param wait_for_completion Drain queued jobs before stopping
     */
    static void shutdown(bool wait_for_completion = true);

    [[nodiscard]] static auto get_thread_count() -> std::size_t;

    /**
     * @brief Submit one task and obtain its result through a future
     *
     * @throws std::runtime_error if the pool cannot be started or refuses
     *         the job
     */
    template <typename F>
    [[nodiscard]] static auto submit(F&& task)
        -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    /**
     * @brief Runs task(0) .. task(count - 1) and returns the results in order
     *
     * Batches of at least min_batch_size jobs go to the pool. Jobs the pool
     * refuses, and every job when the pool cannot start, run on the calling
     * thread. All jobs have finished when this returns; the first exception
     * thrown by a job is rethrown.
     */
    template <typename F>
    static auto run_indexed(std::size_t count, const F& task)
        -> std::vector<std::invoke_result_t<const F&, std::size_t>>;

private:
    [[nodiscard]] static auto try_enqueue(std::function<void()> job) -> bool;

    thread_adapter() = delete;
};

template <typename F>
auto thread_adapter::submit(F&& task)
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using return_type = std::invoke_result_t<std::decay_t<F>>;

    auto job = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(task));
    auto future = job->get_future();

    if (!start() || !try_enqueue([job]() { (*job)(); })) {
        throw std::runtime_error("The frame pool did not accept the job");
    }
    return future;
}

template <typename F>
auto thread_adapter::run_indexed(std::size_t count, const F& task)
    -> std::vector<std::invoke_result_t<const F&, std::size_t>> {
    using return_type = std::invoke_result_t<const F&, std::size_t>;

    const bool pooled = count >= get_config().min_batch_size && start();

    std::vector<std::future<return_type>> futures;
    futures.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto job = std::make_shared<std::packaged_task<return_type()>>(
            [&task, i]() { return task(i); });
        futures.push_back(job->get_future());
        if (!pooled || !try_enqueue([job]() { (*job)(); })) {
            (*job)();
        }
    }

    // Jobs reference task; none may outlive this frame
    for (auto& future : futures) {
        future.wait();
    }

    std::vector<return_type> results;
    results.reserve(count);
    for (auto& future : futures) {
        results.push_back(future.get());
    }
    return results;
}

}  // namespace dcmpix::integration
