#ifndef REQ_FORGE_THREAD_POOL_HPP
#define REQ_FORGE_THREAD_POOL_HPP

#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {
    // Fixed set of workers with a cap on queued plus running tasks. enqueue() blocks the
    // caller while the cap is reached, so the dispatching thread never runs ahead of the pool.
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads, size_t max_in_flight = 0);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        void enqueue(std::function<void()> next_task);

        // Blocks until every enqueued task finished. Rethrows the first exception a task let escape.
        void wait_all();

        [[nodiscard]] size_t size() const { return threads_.size(); }

       private:
        void worker_loop();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::condition_variable capacity_cv_;
        std::condition_variable completion_cv_;
        bool stop_ = false;
        size_t active_tasks_ = 0;
        size_t max_in_flight_;
        std::exception_ptr first_error_;
    };
}  // namespace concurrency

#endif
