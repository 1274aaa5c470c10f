// Copyright (c) rAthena Dev Teams - Licensed under GNU GPL
// For more information, see LICENCE in the main folder

#ifndef TPSDK_SYNC_HPP
#define TPSDK_SYNC_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tpsdk {

/**
 * Thread-safe FIFO queue
 *
 * pop() blocks until an item is available or the queue is closed.
 * Items queued before close() are still handed out.
 */
template<typename T>
class sync_queue {
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    bool closed_{false};

public:
    bool push(T&& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;

        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !queue_.empty() || closed_; });

        if (queue_.empty()) return false;

        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
};

/**
 * Fixed-size worker pool
 *
 * Tasks are fire-and-forget: post() returns once the task is queued and
 * tasks may complete in any order. shutdown() stops accepting work, lets
 * the workers drain what is already queued and joins them.
 */
class thread_pool {
    std::vector<std::thread> workers_;
    sync_queue<std::function<void()>> tasks_;
    std::atomic<bool> stopped_{false};

public:
    explicit thread_pool(size_t num_threads) {
        if (num_threads == 0) num_threads = 1;

        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] {
                std::function<void()> task;
                while (tasks_.pop(task)) {
                    task();
                    task = nullptr;
                }
            });
        }
    }

    ~thread_pool() {
        shutdown();
    }

    bool post(std::function<void()> task) {
        if (!task) return false;
        return tasks_.push(std::move(task));
    }

    void shutdown() {
        if (stopped_.exchange(true)) return;

        tasks_.close();
        for (auto& worker : workers_) {
            if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                worker.join();
            } else if (worker.joinable()) {
                worker.detach();
            }
        }
    }

    size_t size() const { return workers_.size(); }
    size_t queue_size() const { return tasks_.size(); }

    thread_pool(const thread_pool&) = delete;
    thread_pool& operator=(const thread_pool&) = delete;
};

} // namespace tpsdk

#endif // TPSDK_SYNC_HPP
