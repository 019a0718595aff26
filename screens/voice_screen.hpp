#pragma once
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "commands/command.hpp"
#include "commands/command_result.hpp"
#include "commands/disambiguation.hpp"
#include "commands/move_resolver.hpp"
#include "phonetics/vocabulary.hpp"
#include "scheduler.hpp"
#include "voice/voice_session.hpp"

// Shared collaborators every screen talks to
struct VoiceServices {
    VoiceSessionCoordinator& session;
    const Phonetics::Vocabulary& vocab;
    const MoveResolver& resolver;
    TaskScheduler& scheduler;
};

// "Two rooks can move to d1. The one on a or f?"
std::string disambiguationPrompt(const Ambiguous& outcome);

// ------------------------------------------------------------
// VoiceScreen: one screen's view of the shared voice session.
//
// mount() takes the screen's lane and makes sure the session is
// listening; unmount() cancels any pending question and gives the
// lane back without stopping capture. Transcripts arrive on the
// backend thread and are handled under the screen lock.
// ------------------------------------------------------------
class VoiceScreen {
public:
    VoiceScreen(VoiceServices services, std::string laneId, bool protectedLane, bool takeover);
    virtual ~VoiceScreen();

    VoiceScreen(const VoiceScreen&) = delete;
    VoiceScreen& operator=(const VoiceScreen&) = delete;

    // False when another protected lane holds the session
    bool mount();
    void unmount();
    bool isMounted() const { return handle.has_value(); }

    // Full pipeline: length filter, normalize, resolve, dispatch
    void handleTranscript(const std::string& raw);

    const std::string& laneId() const { return lane; }
    std::string lastSpoken() const;
    SessionState sessionState() const;

    // Lane state callback; states are dispatched from several threads,
    // so one older than the last seen is dropped
    void sessionStateChanged(const SessionState& state);
    bool isDisambiguating() const { return disambiguation.isPending(); }

protected:
    virtual std::string context() const = 0;
    virtual std::vector<std::string> legalMoves() const = 0;

    // Called with the screen lock held
    virtual void onMove(const std::string& san) = 0;
    virtual void onQuery(const QueryCommand& query);
    virtual void onMeta(const MetaCommand& meta);

    virtual void onMounted() {}
    virtual void beforeRelease() {}
    virtual void onSessionState(const SessionState& state);

    std::shared_future<bool> announce(const std::string& text);
    std::shared_future<bool> announce(const CommandResult& result);
    void repeatLast();

    VoiceServices services;
    mutable std::mutex screenMutex;

private:
    // Lane callbacks go through the link so a released screen is never called
    struct LaneLink {
        std::recursive_mutex mtx;
        VoiceScreen* screen = nullptr;
    };

    std::string lane;
    bool protectedLane;
    bool takeover;
    std::optional<LaneHandle> handle;
    std::shared_ptr<LaneLink> link;

    mutable std::mutex spokenMutex;
    std::string spoken;
    SessionState lastState;
    std::uint64_t lastSeq = 0;

    DisambiguationController disambiguation;
};
