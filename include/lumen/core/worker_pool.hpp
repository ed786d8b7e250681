#pragma once

/** \file worker_pool.hpp
 *  \brief Fixed-size FIFO worker pool used for concurrent embedding lanes.
 *
 * Tasks run in submission order across workers; results come back through futures so
 * the submitter decides the order in which they are consumed.
 */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace lumen::core {

class WorkerPool {
public:
    /** \param num_threads Number of workers (0 = hardware concurrency / 2, at least 1) */
    explicit WorkerPool(std::size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        workers_.reserve(num_threads);
        try {
            for (std::size_t i = 0; i < num_threads; ++i) {
                workers_.emplace_back([this] { worker_loop(); });
            }
        } catch (...) {
            shutdown();
            throw;
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /** \brief Queue a task. Exceptions thrown by the task surface from future::get(). */
    template <typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>> {
        using return_type = std::invoke_result_t<std::decay_t<Func>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<Func>(func));
        auto future = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("worker pool is stopped");
            }
            tasks_.emplace_back([task] { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    [[nodiscard]] auto num_threads() const noexcept -> std::size_t { return workers_.size(); }

private:
    auto shutdown() -> void {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

    auto worker_loop() -> void {
#if defined(__linux__)
        pthread_setname_np(pthread_self(), "lumen-embed");
#endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_{false};
};

} // namespace lumen::core
