#include "thread_pool.hpp"

#include <condition_variable>
#include <exception>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {

    ThreadPool::ThreadPool(size_t num_threads, size_t max_in_flight) : max_in_flight_(max_in_flight == 0 ? num_threads : max_in_flight) {
        if (num_threads == 0) {
            num_threads = 1;
            max_in_flight_ = max_in_flight_ == 0 ? 1 : max_in_flight_;
        }

        threads_.reserve(num_threads);

        for (size_t i = 0; i < num_threads; ++i) {
            threads_.emplace_back([this] { worker_loop(); });
        }
    }

    ThreadPool::~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }

        condition_variable_.notify_all();

        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void ThreadPool::worker_loop() {
        while (true) {
            std::function<void()> activate_task_from_queue;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                condition_variable_.wait(lock, [this]() { return !tasks_.empty() || stop_; });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                activate_task_from_queue = std::move(tasks_.front());
                tasks_.pop();

                ++active_tasks_;
            }

            std::exception_ptr task_error;
            try {
                activate_task_from_queue();
            } catch (...) {
                task_error = std::current_exception();
            }

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                --active_tasks_;
                if (task_error && !first_error_) {
                    first_error_ = task_error;
                }
            }

            capacity_cv_.notify_one();
            completion_cv_.notify_all();
        }
    }

    void ThreadPool::enqueue(std::function<void()> next_task) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            capacity_cv_.wait(lock, [this]() { return tasks_.size() + active_tasks_ < max_in_flight_; });

            tasks_.emplace(std::move(next_task));
        }

        condition_variable_.notify_one();
    }

    void ThreadPool::wait_all() {
        std::exception_ptr error;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            completion_cv_.wait(lock, [this]() { return tasks_.empty() && active_tasks_ == 0; });

            error = first_error_;
            first_error_ = nullptr;
        }

        if (error) {
            std::rethrow_exception(error);
        }
    }
}  // namespace concurrency
