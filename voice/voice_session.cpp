#include "voice/voice_session.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <exception>
#include <thread>

std::string sessionStateName(const SessionState& state) {
    switch (state.kind) {
        case SessionStateKind::Idle:      return "Idle";
        case SessionStateKind::Starting:  return "Starting";
        case SessionStateKind::Listening: return "Listening";
        case SessionStateKind::Muted:     return "Muted";
        case SessionStateKind::Stopping:  return "Stopping";
        case SessionStateKind::Failed:    return "Failed(" + state.reason + ")";
    }
    return "Unknown";
}

VoiceSessionCoordinator::VoiceSessionCoordinator(std::unique_ptr<AsrBackend> primary,
                                                 std::unique_ptr<AsrBackend> fallback,
                                                 SpeechOutput& speech,
                                                 std::chrono::milliseconds muteTail)
    : primary(std::move(primary)),
      fallback(std::move(fallback)),
      speech(speech),
      muteTail(muteTail) {}

VoiceSessionCoordinator::~VoiceSessionCoordinator() {
    std::vector<std::shared_future<bool>> outstanding;
    {
        std::lock_guard<std::mutex> lock(mtx);
        outstanding = playbacks;
    }
    for (auto& f : outstanding) f.wait();

    stop();
}

// ============================================================
// State helpers
// ============================================================
void VoiceSessionCoordinator::setStateLocked(SessionState next, std::vector<Notification>& out) {
    if (next == current) return;
    LOG_DEBUG("VoiceSession", sessionStateName(current) + " -> " + sessionStateName(next));
    current = std::move(next);
    current.seq = ++stateSeq;
    if (lane && lane->callbacks.onStateChange) {
        out.emplace_back(lane->callbacks.onStateChange, current);
    }
}

void VoiceSessionCoordinator::dispatch(const std::vector<Notification>& notes) {
    for (const auto& [cb, state] : notes) {
        try {
            cb(state);
        } catch (const std::exception& e) {
            LOG_ERROR("VoiceSession", std::string("State callback threw: ") + e.what());
        }
    }
}

SessionState VoiceSessionCoordinator::state() const {
    std::lock_guard<std::mutex> lock(mtx);
    return current;
}

bool VoiceSessionCoordinator::isVoiceDisabled() const {
    std::lock_guard<std::mutex> lock(mtx);
    return voiceDisabled;
}

std::string VoiceSessionCoordinator::activeBackend() const {
    std::lock_guard<std::mutex> lock(mtx);
    return active ? active->name() : std::string();
}

// ============================================================
// Lanes
// ============================================================
std::optional<LaneHandle> VoiceSessionCoordinator::registerLane(const std::string& id,
                                                                bool isProtected,
                                                                LaneCallbacks callbacks,
                                                                bool takeover) {
    std::vector<Notification> notes;
    LaneHandle handle;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (lane && lane->isProtected && lane->id != id && !takeover) {
            LOG_WARN("VoiceSession", "Lane '" + id + "' rejected, '" + lane->id + "' is protected");
            return std::nullopt;
        }

        if (lane && lane->id != id) {
            LOG_DEBUG("VoiceSession", "Lane '" + lane->id + "' replaced by '" + id + "'" +
                                      (takeover ? " (takeover)" : ""));
        }

        lane = Lane{ id, isProtected, std::move(callbacks), nextToken++ };
        handle = LaneHandle{ id, lane->token };

        if (lane->callbacks.onStateChange) {
            notes.emplace_back(lane->callbacks.onStateChange, current);
        }
    }
    dispatch(notes);
    return handle;
}

void VoiceSessionCoordinator::releaseLane(const LaneHandle& handle) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!lane || lane->token != handle.token) {
        LOG_TRACE("VoiceSession", "Ignoring stale release for lane '" + handle.id + "'");
        return;
    }
    LOG_DEBUG("VoiceSession", "Lane '" + lane->id + "' released");
    lane.reset();
}

void VoiceSessionCoordinator::clearProtectedLane() {
    std::lock_guard<std::mutex> lock(mtx);
    if (lane && lane->isProtected) {
        LOG_DEBUG("VoiceSession", "Protection cleared on lane '" + lane->id + "'");
        lane->isProtected = false;
    }
}

std::optional<std::string> VoiceSessionCoordinator::currentLane() const {
    std::lock_guard<std::mutex> lock(mtx);
    if (!lane) return std::nullopt;
    return lane->id;
}

bool VoiceSessionCoordinator::isLaneProtected() const {
    std::lock_guard<std::mutex> lock(mtx);
    return lane && lane->isProtected;
}

// ============================================================
// Start / Stop
// ============================================================
SessionState VoiceSessionCoordinator::start() {
    std::vector<Notification> notes;
    std::unique_lock<std::mutex> lock(mtx);
    settled.wait(lock, [this]{ return !transitioning; });

    if (current.is(SessionStateKind::Listening) || current.is(SessionStateKind::Muted)) {
        LOG_TRACE("VoiceSession", "start() ignored, already " + sessionStateName(current));
        return current;
    }
    if (voiceDisabled) {
        LOG_DEBUG("VoiceSession", "start() ignored, voice input is disabled");
        return current;
    }

    transitioning = true;
    setStateLocked({ SessionStateKind::Starting, {} }, notes);

    AsrBackend* backend = (fallbackUsed && fallback) ? fallback.get() : primary.get();
    bool canFallBack = !fallbackUsed && fallback;
    lock.unlock();
    dispatch(notes);
    notes.clear();

    auto sink = [this](const std::string& text) { deliver(text); };

    AsrStartResult result = backend
        ? backend->start(sink)
        : AsrStartResult::failed("no recognition backend");

    bool attemptedFallback = false;
    if (result.status == AsrStartStatus::Failed && canFallBack) {
        ErrorManager::report("ERR_VOICE_SESSION_START",
                             (backend ? backend->name() : std::string("none")) + ": " + result.reason);
        LOG_WARN("VoiceSession", "Falling back to '" + fallback->name() + "' backend");
        attemptedFallback = true;
        backend = fallback.get();
        result = backend->start(sink);
    }

    lock.lock();
    if (attemptedFallback) fallbackUsed = true;

    std::string failureCode;
    if (result.ok()) {
        active = backend;
        LOG_PHASE("Voice session start (" + backend->name() + ")", true);
        setStateLocked({ muteDepth > 0 ? SessionStateKind::Muted : SessionStateKind::Listening, {} },
                       notes);
    } else if (result.status == AsrStartStatus::PermissionDenied) {
        failureCode = "ERR_VOICE_PERMISSION_DENIED";
        setStateLocked({ SessionStateKind::Failed, "permission denied" }, notes);
    } else {
        // Fallback already spent (or none configured): stay off until restart
        LOG_PHASE("Voice session start", false);
        voiceDisabled = true;
        failureCode = "ERR_VOICE_DISABLED";
        setStateLocked({ SessionStateKind::Failed, "voice disabled" }, notes);
    }

    transitioning = false;
    SessionState settledState = current;
    lock.unlock();
    settled.notify_all();

    if (!failureCode.empty()) {
        ErrorManager::report(failureCode, result.reason);
    }
    dispatch(notes);
    return settledState;
}

void VoiceSessionCoordinator::stop() {
    std::vector<Notification> notes;
    std::unique_lock<std::mutex> lock(mtx);
    settled.wait(lock, [this]{ return !transitioning; });

    if (!active) {
        LOG_TRACE("VoiceSession", "stop() ignored, nothing is capturing");
        return;
    }

    transitioning = true;
    setStateLocked({ SessionStateKind::Stopping, {} }, notes);
    AsrBackend* backend = active;
    lock.unlock();
    dispatch(notes);
    notes.clear();

    backend->stop();

    lock.lock();
    active = nullptr;
    setStateLocked({ SessionStateKind::Idle, {} }, notes);
    transitioning = false;
    lock.unlock();
    settled.notify_all();

    LOG_PHASE("Voice session stop", true);
    dispatch(notes);
}

// ============================================================
// Playback muting
// ============================================================
std::shared_future<bool> VoiceSessionCoordinator::muteForPlayback(const std::string& utterance) {
    std::vector<Notification> notes;
    {
        std::lock_guard<std::mutex> lock(mtx);
        ++muteDepth;
        if (current.is(SessionStateKind::Listening)) {
            setStateLocked({ SessionStateKind::Muted, {} }, notes);
        }
    }
    dispatch(notes);

    std::shared_future<bool> done = std::async(std::launch::async, [this, utterance]() {
        bool played = false;
        try {
            played = speech.speak(utterance);
        } catch (const std::exception& e) {
            LOG_ERROR("VoiceSession", std::string("Playback failed: ") + e.what());
        }
        if (muteTail.count() > 0) {
            std::this_thread::sleep_for(muteTail);
        }
        endPlayback();
        return played;
    }).share();

    std::lock_guard<std::mutex> lock(mtx);
    playbacks.erase(std::remove_if(playbacks.begin(), playbacks.end(),
                        [](const std::shared_future<bool>& f) {
                            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                        }),
                    playbacks.end());
    playbacks.push_back(done);
    return done;
}

void VoiceSessionCoordinator::endPlayback() {
    std::vector<Notification> notes;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (muteDepth > 0) --muteDepth;
        if (muteDepth == 0 && current.is(SessionStateKind::Muted)) {
            setStateLocked({ SessionStateKind::Listening, {} }, notes);
        }
    }
    dispatch(notes);
}

// ============================================================
// Transcript delivery (backend worker thread)
// ============================================================
void VoiceSessionCoordinator::deliver(const std::string& transcript) {
    std::function<void(const std::string&)> target;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!current.is(SessionStateKind::Listening)) {
            LOG_TRACE("VoiceSession", "Dropped transcript while " + sessionStateName(current) +
                                      ": \"" + transcript + "\"");
            return;
        }
        if (!lane || !lane->callbacks.onTranscript) {
            LOG_TRACE("VoiceSession", "No lane for transcript: \"" + transcript + "\"");
            return;
        }
        target = lane->callbacks.onTranscript;
    }

    try {
        target(transcript);
    } catch (const std::exception& e) {
        LOG_ERROR("VoiceSession", std::string("Transcript handler threw: ") + e.what());
    }
}
