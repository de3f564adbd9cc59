// blocking_queue.hpp - unbounded FIFO mit join()
// join() wartet bis jedes gepushte item per task_done() abgehakt ist,
// nicht nur bis die queue leer ist
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace cbxconv {

template<typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
            ++unfinished_;
        }
        not_empty_.notify_one();
    }

    // blockt bis was da ist
    T pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !items_.empty(); });
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // ein gepopptes item ist fertig verarbeitet
    void task_done() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (unfinished_ > 0 && --unfinished_ == 0) {
            all_done_.notify_all();
        }
    }

    void join() {
        std::unique_lock<std::mutex> lock(mutex_);
        all_done_.wait(lock, [this] { return unfinished_ == 0; });
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable all_done_;
    std::deque<T> items_;
    size_t unfinished_ = 0;
};

} // namespace cbxconv
