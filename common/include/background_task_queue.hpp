#pragma once

#include <functional>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <string>

namespace mailcore {

// Bounded fire-and-forget work queue with a single consumer thread.
// A full queue drops its oldest task; enqueue never blocks. shutdown()
// stops accepting new work and runs whatever is still queued.
class BackgroundTaskQueue {
public:
    using Task = std::function<void()>;

    static constexpr size_t DEFAULT_CAPACITY = 10000;

    explicit BackgroundTaskQueue(size_t capacity = DEFAULT_CAPACITY);
    ~BackgroundTaskQueue();

    BackgroundTaskQueue(const BackgroundTaskQueue&) = delete;
    BackgroundTaskQueue& operator=(const BackgroundTaskQueue&) = delete;

    void start();
    void shutdown();

    // False once shutdown has begun.
    bool enqueue(std::string name, Task task);

    size_t pending();
    size_t dropped() const { return dropped_; }
    size_t failed() const { return failed_; }
    size_t completed() const { return completed_; }

private:
    struct Item {
        std::string name;
        Task task;
    };

    void run();
    void execute(Item& item);

    size_t capacity_;
    std::deque<Item> items_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    bool accepting_ = true;
    bool stopping_ = false;

    std::atomic<size_t> dropped_{0};
    std::atomic<size_t> failed_{0};
    std::atomic<size_t> completed_{0};
};

}  // namespace mailcore
