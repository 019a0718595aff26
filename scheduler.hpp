#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

// One-shot delayed task (expiry + label + callback)
struct Timer {
    std::chrono::steady_clock::time_point expiry;  // when the task fires
    std::string label;                             // shown in logs
    std::function<void()> task;
};

// ------------------------------------------------------------
// TaskScheduler: delayed callbacks that can be cancelled
// ------------------------------------------------------------
class TaskScheduler {
public:
    using TaskId = std::uint64_t;

    virtual ~TaskScheduler() = default;

    // Run task once after delay. Returns an id usable with cancel().
    virtual TaskId scheduleAfter(std::chrono::milliseconds delay,
                                 const std::string& label,
                                 std::function<void()> task) = 0;

    // False when the task already ran or was never scheduled.
    virtual bool cancel(TaskId id) = 0;
};

// ------------------------------------------------------------
// ThreadScheduler: single worker thread, tasks ordered by expiry
// ------------------------------------------------------------
class ThreadScheduler : public TaskScheduler {
public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    ThreadScheduler(const ThreadScheduler&) = delete;
    ThreadScheduler& operator=(const ThreadScheduler&) = delete;

    TaskId scheduleAfter(std::chrono::milliseconds delay,
                         const std::string& label,
                         std::function<void()> task) override;
    bool cancel(TaskId id) override;

    size_t pendingCount() const;

private:
    void run();

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::map<TaskId, Timer> timers;
    TaskId nextId = 1;
    bool stopping = false;
    std::thread worker;
};
