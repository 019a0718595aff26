#include "commands/disambiguation.hpp"
#include "logger.hpp"

DisambiguationController::DisambiguationController(TaskScheduler& scheduler,
                                                   std::chrono::milliseconds timeout)
    : scheduler(scheduler), timeout(timeout), core(std::make_shared<Core>()) {}

DisambiguationController::~DisambiguationController() {
    std::unique_lock<std::mutex> lock(core->mtx);
    core->closed = true;
    clearLocked(*core, scheduler, "controller destroyed");

    // A timeout callback may be mid-flight on the scheduler thread.
    // Skip the wait when the callback itself is tearing us down.
    if (core->callbackThread != std::this_thread::get_id()) {
        core->idle.wait(lock, [this]() { return core->runningCallbacks == 0; });
    }
}

// Caller holds core.mtx. Bumping the generation turns any timer that
// already left the scheduler queue into a no-op.
void DisambiguationController::clearLocked(Core& core, TaskScheduler& scheduler,
                                           const char* reason) {
    ++core.generation;
    if (core.timerId) {
        scheduler.cancel(*core.timerId);
        core.timerId.reset();
    }
    if (core.state) {
        LOG_DEBUG("Disambiguation", std::string("Cleared pending ") + core.state->square +
                                    " question (" + reason + ")");
        core.state.reset();
    }
}

void DisambiguationController::begin(const Ambiguous& outcome) {
    std::lock_guard<std::mutex> lock(core->mtx);
    clearLocked(*core, scheduler, "replaced");

    DisambiguationState next;
    next.candidates = outcome.candidates;
    next.piece = outcome.piece;
    next.square = outcome.square;
    next.createdAt = std::chrono::steady_clock::now();
    next.timeout = timeout;
    core->state = std::move(next);

    const std::uint64_t gen = core->generation;
    std::weak_ptr<Core> weak = core;
    core->timerId = scheduler.scheduleAfter(timeout, "disambiguation timeout",
                                            [weak, gen]() { onTimer(weak, gen); });

    LOG_DEBUG("Disambiguation", "Pending " + San::pieceName(outcome.piece) + " to " +
                                outcome.square + " (" +
                                std::to_string(outcome.candidates.size()) + " candidates)");
}

void DisambiguationController::resolved() {
    std::lock_guard<std::mutex> lock(core->mtx);
    clearLocked(*core, scheduler, "resolved");
}

void DisambiguationController::cancel() {
    std::lock_guard<std::mutex> lock(core->mtx);
    clearLocked(*core, scheduler, "cancelled");
}

std::optional<DisambiguationState> DisambiguationController::pending() const {
    std::lock_guard<std::mutex> lock(core->mtx);
    return core->state;
}

bool DisambiguationController::isPending() const {
    std::lock_guard<std::mutex> lock(core->mtx);
    return core->state.has_value();
}

void DisambiguationController::setOnTimeout(TimeoutCallback cb) {
    std::lock_guard<std::mutex> lock(core->mtx);
    core->onTimeout = std::move(cb);
}

// ------------------------------------------------------------
// Timer body (scheduler thread)
// ------------------------------------------------------------
void DisambiguationController::onTimer(const std::weak_ptr<Core>& weak, std::uint64_t gen) {
    std::shared_ptr<Core> core = weak.lock();
    if (!core) return;

    DisambiguationState expired;
    TimeoutCallback cb;
    {
        std::lock_guard<std::mutex> lock(core->mtx);
        if (core->closed || gen != core->generation || !core->state) {
            LOG_TRACE("Disambiguation", "Stale timeout ignored");
            return;
        }
        expired = std::move(*core->state);
        core->state.reset();
        core->timerId.reset();
        ++core->generation;
        cb = core->onTimeout;
        ++core->runningCallbacks;
        core->callbackThread = std::this_thread::get_id();
    }

    LOG_DEBUG("Disambiguation", "Timed out waiting for origin of " + expired.square);
    try {
        if (cb) cb(expired);
    } catch (const std::exception& e) {
        LOG_ERROR("Disambiguation", std::string("Timeout callback threw: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(core->mtx);
        --core->runningCallbacks;
        core->callbackThread = std::thread::id();
    }
    core->idle.notify_all();
}
