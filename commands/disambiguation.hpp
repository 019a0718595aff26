#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "commands/command.hpp"
#include "scheduler.hpp"
#include "voice_constants.hpp"

// Pending "which piece?" question after an Ambiguous outcome
struct DisambiguationState {
    std::vector<std::string> candidates;
    San::PieceType piece = San::PieceType::Pawn;
    std::string square;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::milliseconds timeout{DISAMBIGUATION_TIMEOUT};
};

// ------------------------------------------------------------
// DisambiguationController: at most one pending state.
// None -> Pending on begin(); Pending -> None on resolved(),
// cancel() or timeout. Only the timeout path emits onTimeout.
// ------------------------------------------------------------
class DisambiguationController {
public:
    using TimeoutCallback = std::function<void(const DisambiguationState&)>;

    explicit DisambiguationController(TaskScheduler& scheduler,
                                      std::chrono::milliseconds timeout = DISAMBIGUATION_TIMEOUT);
    ~DisambiguationController();

    DisambiguationController(const DisambiguationController&) = delete;
    DisambiguationController& operator=(const DisambiguationController&) = delete;

    // Start (or replace) the pending state and arm the timeout
    void begin(const Ambiguous& outcome);

    // The follow-up picked a move
    void resolved();

    // Screen exit or an unrelated command; no notification
    void cancel();

    std::optional<DisambiguationState> pending() const;
    bool isPending() const;

    // Runs on the scheduler thread after the state has been cleared
    void setOnTimeout(TimeoutCallback cb);

private:
    // Shared with scheduled timers so a late timer never touches a
    // destroyed controller.
    struct Core {
        std::mutex mtx;
        std::condition_variable idle;
        std::optional<DisambiguationState> state;
        std::optional<TaskScheduler::TaskId> timerId;
        std::uint64_t generation = 0;
        TimeoutCallback onTimeout;
        int runningCallbacks = 0;
        std::thread::id callbackThread;
        bool closed = false;
    };

    static void clearLocked(Core& core, TaskScheduler& scheduler, const char* reason);
    static void onTimer(const std::weak_ptr<Core>& weak, std::uint64_t generation);

    TaskScheduler& scheduler;
    std::chrono::milliseconds timeout;
    std::shared_ptr<Core> core;
};
