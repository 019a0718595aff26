#include <gtest/gtest.h>
#include <future>
#include <thread>
#include "fakes.hpp"
#include "voice/voice_session.hpp"

using namespace std::chrono_literals;

namespace {

// Holds every playback until open() is called
class GatedSpeechOutput : public SpeechOutput {
public:
    bool speak(const std::string&) override {
        opened.wait();
        return true;
    }
    void open() { gate.set_value(); }

private:
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
};

// Records every state a lane is told about
struct StateLog {
    std::mutex mtx;
    std::vector<SessionState> states;
    std::vector<std::string> transcripts;

    LaneCallbacks callbacks() {
        LaneCallbacks cb;
        cb.onStateChange = [this](const SessionState& s) {
            std::lock_guard<std::mutex> lock(mtx);
            states.push_back(s);
        };
        cb.onTranscript = [this](const std::string& t) {
            std::lock_guard<std::mutex> lock(mtx);
            transcripts.push_back(t);
        };
        return cb;
    }

    std::vector<std::string> heard() {
        std::lock_guard<std::mutex> lock(mtx);
        return transcripts;
    }

    std::vector<std::uint64_t> seqs() {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<std::uint64_t> out;
        for (const auto& s : states) out.push_back(s.seq);
        return out;
    }

    std::vector<SessionStateKind> kinds() {
        std::lock_guard<std::mutex> lock(mtx);
        std::vector<SessionStateKind> out;
        for (const auto& s : states) out.push_back(s.kind);
        return out;
    }
};

const SessionState kListening{ SessionStateKind::Listening, {} };
const SessionState kIdle{ SessionStateKind::Idle, {} };
const SessionState kMuted{ SessionStateKind::Muted, {} };
const SessionState kDisabled{ SessionStateKind::Failed, "voice disabled" };
const SessionState kDenied{ SessionStateKind::Failed, "permission denied" };

} // namespace

class VoiceSessionTest : public ::testing::Test {
protected:
    std::unique_ptr<VoiceSessionCoordinator> make(AsrStartResult primaryResult,
                                                  std::optional<AsrStartResult> fallbackResult,
                                                  std::chrono::milliseconds startDelay = 0ms) {
        auto p = std::make_unique<FakeAsrBackend>("primary", primaryResult, startDelay);
        primary = p.get();
        std::unique_ptr<FakeAsrBackend> f;
        if (fallbackResult) {
            f = std::make_unique<FakeAsrBackend>("fallback", *fallbackResult);
            fallback = f.get();
        }
        return std::make_unique<VoiceSessionCoordinator>(std::move(p), std::move(f), speech, 0ms);
    }

    FakeSpeechOutput speech;
    FakeAsrBackend* primary = nullptr;
    FakeAsrBackend* fallback = nullptr;
};

// ============================================================
// Start / stop
// ============================================================
TEST_F(VoiceSessionTest, StartsListening) {
    auto session = make(AsrStartResult::started(), std::nullopt);
    EXPECT_EQ(session->state(), kIdle);
    EXPECT_EQ(session->start(), kListening);
    EXPECT_EQ(session->activeBackend(), "primary");
    EXPECT_EQ(primary->starts.load(), 1);
}

TEST_F(VoiceSessionTest, StartIsIdempotent) {
    auto session = make(AsrStartResult::started(), std::nullopt);
    session->start();
    EXPECT_EQ(session->start(), kListening);
    EXPECT_EQ(primary->starts.load(), 1);
}

TEST_F(VoiceSessionTest, ConcurrentStartsStartCaptureOnce) {
    auto session = make(AsrStartResult::started(), std::nullopt, 50ms);

    SessionState a, b;
    std::thread t1([&]() { a = session->start(); });
    std::thread t2([&]() { b = session->start(); });
    t1.join();
    t2.join();

    EXPECT_EQ(a, kListening);
    EXPECT_EQ(b, kListening);
    EXPECT_EQ(primary->starts.load(), 1);
}

TEST_F(VoiceSessionTest, StopReleasesCaptureOnce) {
    auto session = make(AsrStartResult::started(), std::nullopt);
    session->start();
    session->stop();
    EXPECT_EQ(session->state(), kIdle);
    EXPECT_EQ(primary->stops.load(), 1);
    EXPECT_TRUE(session->activeBackend().empty());

    session->stop();
    EXPECT_EQ(primary->stops.load(), 1);

    EXPECT_EQ(session->start(), kListening);
    EXPECT_EQ(primary->starts.load(), 2);
}

TEST_F(VoiceSessionTest, StateSequenceReachesTheLane) {
    StateLog log;
    auto session = make(AsrStartResult::started(), std::nullopt);
    ASSERT_TRUE(session->registerLane("game", true, log.callbacks()));

    session->start();
    session->stop();

    EXPECT_EQ(log.kinds(), (std::vector<SessionStateKind>{
        SessionStateKind::Idle, SessionStateKind::Starting, SessionStateKind::Listening,
        SessionStateKind::Stopping, SessionStateKind::Idle}));
}

TEST_F(VoiceSessionTest, TransitionsAreNumberedInOrder) {
    StateLog log;
    auto session = make(AsrStartResult::started(), std::nullopt);
    ASSERT_TRUE(session->registerLane("game", true, log.callbacks()));

    session->start();
    auto played = session->muteForPlayback("Knight f3");
    ASSERT_EQ(played.wait_for(5s), std::future_status::ready);
    session->stop();

    // The Listening after playback is dispatched from the playback thread
    std::vector<std::uint64_t> seqs = log.seqs();
    ASSERT_EQ(seqs.size(), 7u);
    for (size_t i = 1; i < seqs.size(); ++i) {
        EXPECT_LT(seqs[i - 1], seqs[i]) << "at " << i;
    }
    EXPECT_EQ(seqs.back(), session->state().seq);
    EXPECT_EQ(log.kinds()[4], SessionStateKind::Listening);
}

// ============================================================
// Fallback
// ============================================================
TEST_F(VoiceSessionTest, FallsBackWhenPrimaryFails) {
    auto session = make(AsrStartResult::failed("no model"), AsrStartResult::started());
    EXPECT_EQ(session->start(), kListening);
    EXPECT_EQ(session->activeBackend(), "fallback");
    EXPECT_EQ(primary->starts.load(), 1);
    EXPECT_EQ(fallback->starts.load(), 1);

    // Later starts stay on the fallback
    session->stop();
    EXPECT_EQ(session->start(), kListening);
    EXPECT_EQ(primary->starts.load(), 1);
    EXPECT_EQ(fallback->starts.load(), 2);
}

TEST_F(VoiceSessionTest, FallbackIsTriedOnlyOnce) {
    auto session = make(AsrStartResult::failed("no model"), AsrStartResult::started());
    session->start();
    session->stop();

    fallback->setResult(AsrStartResult::failed("server down"));
    EXPECT_EQ(session->start(), kDisabled);
    EXPECT_TRUE(session->isVoiceDisabled());
    EXPECT_EQ(primary->starts.load(), 1);
    EXPECT_EQ(fallback->starts.load(), 2);
}

TEST_F(VoiceSessionTest, BothBackendsFailingDisablesVoice) {
    auto session = make(AsrStartResult::failed("no model"), AsrStartResult::failed("server down"));
    EXPECT_EQ(session->start(), kDisabled);
    EXPECT_TRUE(session->isVoiceDisabled());

    // Disabled until restart: no more attempts
    EXPECT_EQ(session->start(), kDisabled);
    EXPECT_EQ(primary->starts.load(), 1);
    EXPECT_EQ(fallback->starts.load(), 1);
}

TEST_F(VoiceSessionTest, NoFallbackConfigured) {
    auto session = make(AsrStartResult::failed("no model"), std::nullopt);
    EXPECT_EQ(session->start(), kDisabled);
    EXPECT_TRUE(session->isVoiceDisabled());
}

TEST_F(VoiceSessionTest, NoBackendsAtAll) {
    VoiceSessionCoordinator session(nullptr, nullptr, speech, 0ms);
    EXPECT_EQ(session.start(), kDisabled);
    EXPECT_TRUE(session.activeBackend().empty());
}

TEST_F(VoiceSessionTest, PermissionDeniedSkipsFallback) {
    auto session = make(AsrStartResult::denied("microphone blocked"), AsrStartResult::started());
    EXPECT_EQ(session->start(), kDenied);
    EXPECT_FALSE(session->isVoiceDisabled());
    EXPECT_EQ(fallback->starts.load(), 0);

    // The user can grant access and try again
    primary->setResult(AsrStartResult::started());
    EXPECT_EQ(session->start(), kListening);
    EXPECT_EQ(primary->starts.load(), 2);
}

// ============================================================
// Lanes
// ============================================================
TEST_F(VoiceSessionTest, ProtectedLaneRejectsOthers) {
    StateLog game, training;
    auto session = make(AsrStartResult::started(), std::nullopt);

    ASSERT_TRUE(session->registerLane("game", true, game.callbacks()));
    EXPECT_FALSE(session->registerLane("training-notation", false, training.callbacks()));
    EXPECT_EQ(session->currentLane().value_or(""), "game");
    EXPECT_TRUE(session->isLaneProtected());

    // Same id may re-register
    EXPECT_TRUE(session->registerLane("game", true, game.callbacks()));
}

TEST_F(VoiceSessionTest, TakeoverAndClearProtection) {
    StateLog game, recon, training;
    auto session = make(AsrStartResult::started(), std::nullopt);

    ASSERT_TRUE(session->registerLane("game", true, game.callbacks()));
    ASSERT_TRUE(session->registerLane("reconstruction", true, recon.callbacks(), true));
    EXPECT_EQ(session->currentLane().value_or(""), "reconstruction");

    session->clearProtectedLane();
    EXPECT_FALSE(session->isLaneProtected());
    EXPECT_TRUE(session->registerLane("training-notation", false, training.callbacks()));
}

TEST_F(VoiceSessionTest, StaleReleaseIsIgnored) {
    StateLog a, b;
    auto session = make(AsrStartResult::started(), std::nullopt);

    auto first = session->registerLane("training-a", false, a.callbacks());
    auto second = session->registerLane("training-b", false, b.callbacks());
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);

    session->releaseLane(*first);
    EXPECT_EQ(session->currentLane().value_or(""), "training-b");

    session->releaseLane(*second);
    EXPECT_FALSE(session->currentLane());
}

TEST_F(VoiceSessionTest, LaneChangesNeverTouchCapture) {
    StateLog a, b;
    auto session = make(AsrStartResult::started(), std::nullopt);
    session->start();

    auto first = session->registerLane("game", false, a.callbacks());
    ASSERT_TRUE(first);
    session->releaseLane(*first);
    ASSERT_TRUE(session->registerLane("training-notation", false, b.callbacks()));

    EXPECT_EQ(primary->starts.load(), 1);
    EXPECT_EQ(primary->stops.load(), 0);
    EXPECT_EQ(session->state(), kListening);
}

TEST_F(VoiceSessionTest, TranscriptsGoToCurrentLaneOnly) {
    StateLog a, b;
    auto session = make(AsrStartResult::started(), std::nullopt);
    session->start();

    EXPECT_TRUE(primary->emit("nobody listening"));

    ASSERT_TRUE(session->registerLane("training-a", false, a.callbacks()));
    primary->emit("knight f3");
    ASSERT_TRUE(session->registerLane("training-b", false, b.callbacks()));
    primary->emit("e4");

    EXPECT_EQ(a.heard(), (std::vector<std::string>{"knight f3"}));
    EXPECT_EQ(b.heard(), (std::vector<std::string>{"e4"}));
}

// ============================================================
// Playback muting
// ============================================================
TEST(VoiceSessionMuteTest, TranscriptsDroppedWhilePlaying) {
    GatedSpeechOutput speech;
    StateLog log;
    auto backend = std::make_unique<FakeAsrBackend>("primary");
    FakeAsrBackend* primary = backend.get();
    VoiceSessionCoordinator session(std::move(backend), nullptr, speech, 0ms);

    ASSERT_TRUE(session.registerLane("game", true, log.callbacks()));
    ASSERT_EQ(session.start(), kListening);

    auto played = session.muteForPlayback("Knight f3");
    EXPECT_EQ(session.state(), kMuted);
    primary->emit("e4");

    speech.open();
    ASSERT_EQ(played.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(played.get());
    EXPECT_EQ(session.state(), kListening);

    primary->emit("d4");
    EXPECT_EQ(log.heard(), (std::vector<std::string>{"d4"}));
}

TEST(VoiceSessionMuteTest, StartDuringPlaybackSettlesMuted) {
    GatedSpeechOutput speech;
    VoiceSessionCoordinator session(std::make_unique<FakeAsrBackend>("primary"), nullptr, speech, 0ms);

    auto played = session.muteForPlayback("Welcome");
    EXPECT_EQ(session.state(), kIdle);
    EXPECT_EQ(session.start(), kMuted);

    speech.open();
    ASSERT_EQ(played.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(session.state(), kListening);
}

TEST_F(VoiceSessionTest, PlaybackWhileIdleStillSpeaks) {
    auto session = make(AsrStartResult::started(), std::nullopt);
    auto played = session->muteForPlayback("Hello");
    ASSERT_EQ(played.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(played.get());
    EXPECT_EQ(session->state(), kIdle);
    EXPECT_EQ(speech.utterances(), (std::vector<std::string>{"Hello"}));
}

TEST(SessionStateNameTest, Names) {
    EXPECT_EQ(sessionStateName(kListening), "Listening");
    EXPECT_EQ(sessionStateName(kDisabled), "Failed(voice disabled)");
}
