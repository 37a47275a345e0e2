/**
 * @file thread_adapter.cpp
 * @brief Implementation of thread_adapter for thread_system integration
 */

#include <dcmpix/integration/thread_adapter.hpp>
#include <dcmpix/integration/logger_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <mutex>
#include <thread>

namespace dcmpix::integration {

namespace {

auto resolve(thread_pool_config config) -> thread_pool_config {
    if (config.worker_count == 0) {
        config.worker_count =
            std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    if (config.min_batch_size == 0) {
        config.min_batch_size = 1;
    }
    return config;
}

struct pool_state {
    std::mutex mutex;
    thread_pool_config config = resolve({});
    std::shared_ptr<kcenon::thread::thread_pool> pool;
};

pool_state& state() {
    static pool_state instance;
    return instance;
}

auto start_locked(pool_state& s) -> bool {
    if (s.pool && s.pool->is_running()) {
        return true;
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(s.config.pool_name);
    for (std::size_t i = 0; i < s.config.worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        auto added = pool->enqueue(std::move(worker));
        if (!added) {
            return false;
        }
    }

    auto started = pool->start();
    if (!started) {
        return false;
    }

    s.pool = std::move(pool);
    logger_adapter::debug("Started frame pool '{}' with {} workers", s.config.pool_name,
                          s.config.worker_count);
    return true;
}

}  // namespace

void thread_adapter::configure(const thread_pool_config& config) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.config = resolve(config);
}

auto thread_adapter::get_config() -> thread_pool_config {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.config;
}

auto thread_adapter::start() -> bool {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (start_locked(s)) {
        return true;
    }
    logger_adapter::warn("Frame pool '{}' could not be started", s.config.pool_name);
    return false;
}

auto thread_adapter::is_running() -> bool {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.pool && s.pool->is_running();
}

void thread_adapter::shutdown(bool wait_for_completion) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.pool) {
        s.pool->stop(!wait_for_completion);
        s.pool.reset();
    }
}

auto thread_adapter::get_thread_count() -> std::size_t {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.pool ? s.pool->get_thread_count() : 0;
}

auto thread_adapter::try_enqueue(std::function<void()> job) -> bool {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.pool && s.pool->is_running() && s.pool->submit_task(std::move(job));
}

}  // namespace dcmpix::integration
