#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "voice/asr_backend.hpp"
#include "voice/voice_speak.hpp"

// =====================================================
// Session State
// =====================================================
enum class SessionStateKind {
    Idle,
    Starting,
    Listening,
    Muted,
    Stopping,
    Failed
};

struct SessionState {
    SessionStateKind kind = SessionStateKind::Idle;
    std::string reason;                    // Failed only
    std::uint64_t seq = 0;                 // grows with every transition

    bool is(SessionStateKind k) const { return kind == k; }
    bool operator==(const SessionState& o) const { return kind == o.kind && reason == o.reason; }
    bool operator!=(const SessionState& o) const { return !(*this == o); }
};

std::string sessionStateName(const SessionState& state);

// =====================================================
// Lanes
// =====================================================
struct LaneCallbacks {
    std::function<void(const std::string&)> onTranscript;     // backend thread
    std::function<void(const SessionState&)> onStateChange;
};

// Proof of ownership; a handle is stale once another registration happens
struct LaneHandle {
    std::string id;
    std::uint64_t token = 0;
};

// =====================================================
// VoiceSessionCoordinator
//
// Owns the single ASR session shared by all screens. Lane changes
// never touch capture; only stop() releases the microphone.
// Callbacks run without the coordinator lock held and must not call
// start() or stop().
// =====================================================
class VoiceSessionCoordinator {
public:
    VoiceSessionCoordinator(std::unique_ptr<AsrBackend> primary,
                            std::unique_ptr<AsrBackend> fallback,
                            SpeechOutput& speech,
                            std::chrono::milliseconds muteTail = std::chrono::milliseconds(350));
    ~VoiceSessionCoordinator();

    VoiceSessionCoordinator(const VoiceSessionCoordinator&) = delete;
    VoiceSessionCoordinator& operator=(const VoiceSessionCoordinator&) = delete;

    // ---- Lanes ----
    std::optional<LaneHandle> registerLane(const std::string& id,
                                           bool isProtected,
                                           LaneCallbacks callbacks,
                                           bool takeover = false);
    void releaseLane(const LaneHandle& handle);
    void clearProtectedLane();

    std::optional<std::string> currentLane() const;
    bool isLaneProtected() const;

    // ---- Session ----
    // Idempotent. Waits for an in-flight transition, returns the settled state.
    SessionState start();
    void stop();

    // Gates delivery while the utterance plays; resolves true when it played
    std::shared_future<bool> muteForPlayback(const std::string& utterance);

    SessionState state() const;
    bool isVoiceDisabled() const;
    std::string activeBackend() const;

private:
    struct Lane {
        std::string id;
        bool isProtected = false;
        LaneCallbacks callbacks;
        std::uint64_t token = 0;
    };

    using Notification = std::pair<std::function<void(const SessionState&)>, SessionState>;

    void setStateLocked(SessionState next, std::vector<Notification>& out);
    static void dispatch(const std::vector<Notification>& notes);

    void deliver(const std::string& transcript);
    void endPlayback();

    std::unique_ptr<AsrBackend> primary;
    std::unique_ptr<AsrBackend> fallback;
    SpeechOutput& speech;
    std::chrono::milliseconds muteTail;

    mutable std::mutex mtx;
    std::condition_variable settled;
    SessionState current;
    std::uint64_t stateSeq = 0;
    bool transitioning = false;
    bool fallbackUsed = false;
    bool voiceDisabled = false;
    AsrBackend* active = nullptr;
    int muteDepth = 0;

    std::optional<Lane> lane;
    std::uint64_t nextToken = 1;

    std::vector<std::shared_future<bool>> playbacks;
};
