#include "cbxconv/thread_pool.hpp"

namespace cbxconv {

size_t ThreadPool::hardware_threads() noexcept {
    size_t n = std::thread::hardware_concurrency();
    return n == 0 ? 4 : n;  // fallback
}

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = hardware_threads();
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            // erst leer machen, dann raus
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // packaged_task fängt exceptions selbst und legt sie in die future
        task();

        // decrement unter lock, sonst verpasst wait_all das notify
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            pending_tasks_--;
        }
        done_condition_.notify_all();
    }
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    done_condition_.wait(lock, [this] {
        return pending_tasks_ == 0;
    });
}

} // namespace cbxconv
