#include "background_task_queue.hpp"
#include "logger.hpp"

#include <exception>

namespace mailcore {

BackgroundTaskQueue::BackgroundTaskQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

BackgroundTaskQueue::~BackgroundTaskQueue() {
    shutdown();
}

void BackgroundTaskQueue::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable() || stopping_) return;
    worker_ = std::thread([this]() { run(); });
}

void BackgroundTaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_ && !worker_.joinable() && items_.empty()) return;
        accepting_ = false;
        stopping_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    // Never started: drain on the calling thread.
    std::deque<Item> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(items_);
    }
    for (auto& item : remaining) {
        execute(item);
    }
}

bool BackgroundTaskQueue::enqueue(std::string name, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            return false;
        }
        if (items_.size() >= capacity_) {
            LOG_WARNING_FMT("Background queue full ({}), dropping task '{}'",
                            capacity_, items_.front().name);
            items_.pop_front();
            ++dropped_;
        }
        items_.push_back(Item{std::move(name), std::move(task)});
    }
    cv_.notify_one();
    return true;
}

size_t BackgroundTaskQueue::pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

void BackgroundTaskQueue::run() {
    for (;;) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !items_.empty(); });
            if (items_.empty()) {
                return;
            }
            item = std::move(items_.front());
            items_.pop_front();
        }
        execute(item);
    }
}

void BackgroundTaskQueue::execute(Item& item) {
    try {
        item.task();
        ++completed_;
    } catch (const std::exception& e) {
        ++failed_;
        LOG_ERROR_FMT("Background task '{}' failed: {}", item.name, e.what());
    }
}

}  // namespace mailcore
