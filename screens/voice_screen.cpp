#include "screens/voice_screen.hpp"
#include "phonetics/normalizer.hpp"
#include "voice/transcript.hpp"
#include "response_manager.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

std::string disambiguationPrompt(const Ambiguous& outcome) {
    std::vector<std::string> origins;
    for (const auto& san : outcome.candidates) {
        auto info = San::parse(san);
        std::string origin;
        if (info && info->originFile) origin += *info->originFile;
        if (info && info->originRank) origin += *info->originRank;
        origins.push_back(origin.empty() ? san : origin);
    }

    std::map<std::string, std::string> values = {
        {"pieces", San::pieceWord(outcome.piece) + "s"},
        {"square", outcome.square}
    };
    if (origins.size() == 2) {
        values["first"] = origins[0];
        values["second"] = origins[1];
        return ResponseManager::format("disambiguate_two", values);
    }
    return ResponseManager::format("disambiguate_many", values);
}

VoiceScreen::VoiceScreen(VoiceServices services, std::string laneId, bool protectedLane, bool takeover)
    : services(services),
      lane(std::move(laneId)),
      protectedLane(protectedLane),
      takeover(takeover),
      disambiguation(services.scheduler) {
    disambiguation.setOnTimeout([this](const DisambiguationState& state) {
        LOG_DEBUG("Screen", lane + ": disambiguation for " + state.square + " timed out");
        announce(ErrorManager::report("ERR_VOICE_AMBIGUOUS_TIMEOUT"));
    });
}

VoiceScreen::~VoiceScreen() {
    unmount();
}

// ============================================================
// Lane lifecycle
// ============================================================
bool VoiceScreen::mount() {
    if (handle) return true;

    link = std::make_shared<LaneLink>();
    link->screen = this;

    std::shared_ptr<LaneLink> shared = link;
    LaneCallbacks callbacks;
    callbacks.onTranscript = [shared](const std::string& text) {
        std::lock_guard<std::recursive_mutex> lock(shared->mtx);
        if (shared->screen) shared->screen->handleTranscript(text);
    };
    callbacks.onStateChange = [shared](const SessionState& state) {
        std::lock_guard<std::recursive_mutex> lock(shared->mtx);
        if (shared->screen) shared->screen->sessionStateChanged(state);
    };

    handle = services.session.registerLane(lane, protectedLane, std::move(callbacks), takeover);
    if (!handle) {
        {
            std::lock_guard<std::recursive_mutex> lock(link->mtx);
            link->screen = nullptr;
        }
        link.reset();
        ErrorManager::report("ERR_VOICE_LANE_REJECTED", lane);
        return false;
    }

    LOG_DEBUG("Screen", "Mounted lane '" + lane + "'");
    services.session.start();
    onMounted();
    return true;
}

void VoiceScreen::unmount() {
    if (!handle) return;

    disambiguation.cancel();
    beforeRelease();
    services.session.releaseLane(*handle);

    {
        std::lock_guard<std::recursive_mutex> lock(link->mtx);
        link->screen = nullptr;
    }
    link.reset();
    handle.reset();
    LOG_DEBUG("Screen", "Unmounted lane '" + lane + "'");
}

// ============================================================
// Session state
// ============================================================
void VoiceScreen::sessionStateChanged(const SessionState& state) {
    {
        std::lock_guard<std::mutex> lock(spokenMutex);
        if (state.seq < lastSeq) {
            LOG_TRACE("Screen", lane + ": dropped stale state " + sessionStateName(state));
            return;
        }
        lastSeq = state.seq;
        if (state == lastState) return;
        lastState = state;
    }
    onSessionState(state);
}

void VoiceScreen::onSessionState(const SessionState& state) {
    if (!state.is(SessionStateKind::Failed)) return;

    const char* code = state.reason == "permission denied" ? "ERR_VOICE_PERMISSION_DENIED"
                                                           : "ERR_VOICE_DISABLED";
    announce(ErrorManager::getUserMessage(code));
}

SessionState VoiceScreen::sessionState() const {
    std::lock_guard<std::mutex> lock(spokenMutex);
    return lastState;
}

// ============================================================
// Speech
// ============================================================
std::shared_future<bool> VoiceScreen::announce(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(spokenMutex);
        spoken = text;
    }
    LOG_DEBUG("Screen", lane + " says: " + text);
    return services.session.muteForPlayback(text);
}

std::shared_future<bool> VoiceScreen::announce(const CommandResult& result) {
    return announce(result.voice.empty() ? result.message : result.voice);
}

std::string VoiceScreen::lastSpoken() const {
    std::lock_guard<std::mutex> lock(spokenMutex);
    return spoken;
}

void VoiceScreen::repeatLast() {
    std::string text = lastSpoken();
    announce(text.empty() ? ResponseManager::get("nothing_to_repeat") : text);
}

// ============================================================
// Default command handling
// ============================================================
void VoiceScreen::onQuery(const QueryCommand& query) {
    LOG_DEBUG("Screen", lane + ": query " + queryKindName(query.kind) + " not handled here");
    announce(ErrorManager::report("ERR_VOICE_UNMATCHED"));
}

void VoiceScreen::onMeta(const MetaCommand& meta) {
    if (meta.kind == MetaKind::Repeat) {
        repeatLast();
        return;
    }
    LOG_DEBUG("Screen", lane + ": meta " + metaKindName(meta.kind) + " not handled here");
    announce(ErrorManager::report("ERR_VOICE_UNMATCHED"));
}

// ============================================================
// Transcript pipeline
// ============================================================
void VoiceScreen::handleTranscript(const std::string& raw) {
    if (isTranscriptTooShort(raw)) {
        LOG_TRACE("Screen", "Transcript too short, dropped: \"" + raw + "\"");
        return;
    }

    std::lock_guard<std::mutex> lock(screenMutex);

    Phonetics::TokenSequence tokens = Phonetics::normalize(raw, services.vocab);
    std::optional<DisambiguationState> pending = disambiguation.pending();

    ResolutionOutcome outcome = services.resolver.resolve(tokens, legalMoves(), context(),
                                                          pending ? &*pending : nullptr);
    LOG_DEBUG("Screen", lane + ": \"" + raw + "\" -> " + describeOutcome(outcome));

    if (const auto* resolved = std::get_if<Resolved>(&outcome)) {
        if (const auto* move = std::get_if<MoveCommand>(&resolved->command)) {
            if (pending) disambiguation.resolved();
            onMove(move->candidates.front());
            return;
        }

        // Anything but a move abandons the open question
        if (pending) disambiguation.cancel();
        if (const auto* query = std::get_if<QueryCommand>(&resolved->command)) {
            onQuery(*query);
        } else {
            onMeta(std::get<MetaCommand>(resolved->command));
        }
        return;
    }

    if (const auto* ambiguous = std::get_if<Ambiguous>(&outcome)) {
        disambiguation.begin(*ambiguous);
        announce(disambiguationPrompt(*ambiguous));
        return;
    }

    // Unmatched: keep a pending question alive and ask again
    if (pending) {
        announce(ResponseManager::get("which_piece"));
        return;
    }
    announce(ErrorManager::report("ERR_VOICE_UNMATCHED"));
}
