#include "scheduler.hpp"
#include "logger.hpp"

#include <exception>

ThreadScheduler::ThreadScheduler() {
    worker = std::thread([this]() { run(); });
}

ThreadScheduler::~ThreadScheduler() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopping = true;
        if (!timers.empty()) {
            LOG_DEBUG("Scheduler", "Dropping " + std::to_string(timers.size()) +
                                   " pending task(s) on shutdown");
        }
        timers.clear();
    }
    cv.notify_all();
    if (worker.joinable()) {
        worker.join();
    }
}

TaskScheduler::TaskId ThreadScheduler::scheduleAfter(std::chrono::milliseconds delay,
                                                     const std::string& label,
                                                     std::function<void()> task) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mtx);
        id = nextId++;
        timers[id] = Timer{std::chrono::steady_clock::now() + delay, label, std::move(task)};
    }
    cv.notify_all();
    LOG_TRACE("Scheduler", "Scheduled '" + label + "' in " +
                           std::to_string(delay.count()) + "ms (id=" + std::to_string(id) + ")");
    return id;
}

bool ThreadScheduler::cancel(TaskId id) {
    bool removed;
    {
        std::lock_guard<std::mutex> lock(mtx);
        removed = timers.erase(id) > 0;
    }
    if (removed) {
        cv.notify_all();
        LOG_TRACE("Scheduler", "Cancelled task id=" + std::to_string(id));
    }
    return removed;
}

size_t ThreadScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return timers.size();
}

// ------------------------------------------------------------
// Worker loop: sleep until the earliest expiry, run it unlocked
// ------------------------------------------------------------
void ThreadScheduler::run() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stopping) {
        if (timers.empty()) {
            cv.wait(lock, [this]() { return stopping || !timers.empty(); });
            continue;
        }

        auto earliest = timers.begin();
        for (auto it = timers.begin(); it != timers.end(); ++it) {
            if (it->second.expiry < earliest->second.expiry) earliest = it;
        }

        auto expiry = earliest->second.expiry;
        if (std::chrono::steady_clock::now() < expiry) {
            cv.wait_until(lock, expiry);
            continue;   // re-evaluate: a cancel or new task may have changed the set
        }

        Timer due = std::move(earliest->second);
        timers.erase(earliest);

        lock.unlock();
        LOG_TRACE("Scheduler", "Running '" + due.label + "'");
        try {
            if (due.task) due.task();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler", "Task '" + due.label + "' threw: " + e.what());
        }
        lock.lock();
    }
}
