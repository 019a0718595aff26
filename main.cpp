#include "pch.hpp"
#include "bootstrap.hpp"
#include "resources.hpp"
#include "error_manager.hpp"
#include "scheduler.hpp"
#include "commands/command_grammar.hpp"
#include "commands/move_resolver.hpp"
#include "phonetics/vocabulary.hpp"
#include "voice/asr_backend.hpp"
#include "voice/input_devices.hpp"
#include "voice/transcript.hpp"
#include "voice/voice_session.hpp"
#include "voice/voice_speak.hpp"
#include "screens/game_screen.hpp"
#include "screens/reconstruction_screen.hpp"
#include "screens/scripted_position.hpp"
#include "screens/training_screen.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

struct Options {
    std::string resources;
    std::string position = "positions/sample_game.json";
    std::string drills   = "training/notation_drills.json";
    bool noMic = false;
};

static void printUsage() {
    std::cout << "usage: blindfold_voice [--resources DIR] [--position FILE] "
                 "[--drills FILE] [--no-mic]\n";
}

static bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };

        if (arg == "--resources") {
            if (!next(opts.resources)) return false;
        } else if (arg == "--position") {
            if (!next(opts.position)) return false;
        } else if (arg == "--drills") {
            if (!next(opts.drills)) return false;
        } else if (arg == "--no-mic") {
            opts.noMic = true;
        } else {
            return false;
        }
    }
    return true;
}

// Relative paths are looked up under the resource root
static fs::path resolveResource(const std::string& path) {
    fs::path p(path);
    return p.is_absolute() ? p : resourceFile(path);
}

static void printHelp() {
    std::cout << "Type what you would say (\"knight to f3\", \"what is on e4\").\n"
              << "  /listen            start the microphone session\n"
              << "  /stop              stop the microphone session\n"
              << "  /state             show the session state\n"
              << "  /screen NAME       game | reconstruction | training\n"
              << "  /devices           list capture devices\n"
              << "  /quit              exit\n";
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 2;
    }

    initLogger("blindfold_voice.log");
    LOG_PHASE("Startup begin", true);

    if (!opts.resources.empty()) setResourcePath(opts.resources);

    Phonetics::Vocabulary vocab;
    CommandGrammar grammar;
    bootstrap_config::LoadedConfig cfg = runBootstrapChecks(getResourcePath(), vocab, grammar);

    // ============================================================
    // Voice session
    // ============================================================
    ThreadScheduler scheduler;
    SystemSpeechOutput speech(cfg.voice.value("tts", nlohmann::json::object()));

    const nlohmann::json asr = cfg.voice.value("asr", nlohmann::json::object());
    std::unique_ptr<AsrBackend> primary;
    std::unique_ptr<AsrBackend> fallback;
    if (opts.noMic) {
        LOG_DEBUG("Voice", "Microphone disabled by --no-mic");
    } else {
        primary  = makeAsrBackend(asr.value("backend", std::string("whisper")), asr);
        fallback = makeAsrBackend(asr.value("fallback", std::string("remote")), asr);
    }

    VoiceSessionCoordinator session(std::move(primary), std::move(fallback), speech,
                                    std::chrono::milliseconds(cfg.voice.value("mute_tail_ms", 350)));
    MoveResolver resolver(vocab, grammar);
    VoiceServices services{ session, vocab, resolver, scheduler };

    // ============================================================
    // Position + first screen
    // ============================================================
    ScriptedPosition position;
    std::string err;
    if (!position.load_file(resolveResource(opts.position).string(), &err)) {
        ErrorManager::report("ERR_POSITION_LOAD", err);
        shutdownLogger();
        return 1;
    }
    LOG_PHASE("Position load", true);

    std::unique_ptr<VoiceScreen> screen = std::make_unique<GameScreen>(services, position);
    screen->mount();
    LOG_PHASE("Startup complete, entering main loop", true);

    std::cout << "Blindfold voice console (" << position.name() << "). /help for commands.\n";

    // ============================================================
    // Console REPL loop: typed lines stand in for transcripts
    // ============================================================
    std::string line;
    while (true) {
        std::cout << "[" << screen->laneId() << "] > ";
        if (!std::getline(std::cin, line)) {
            break; // EOF / Ctrl+D
        }
        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") {
            LOG_PHASE("Shutdown requested", true);
            break;
        }
        if (line == "/help") {
            printHelp();
            continue;
        }
        if (line == "/listen") {
            std::cout << sessionStateName(session.start()) << "\n";
            continue;
        }
        if (line == "/stop") {
            session.stop();
            std::cout << sessionStateName(session.state()) << "\n";
            continue;
        }
        if (line == "/state") {
            std::cout << sessionStateName(session.state())
                      << " lane=" << session.currentLane().value_or("-")
                      << " backend=" << (session.activeBackend().empty() ? "-" : session.activeBackend())
                      << "\n";
            continue;
        }
        if (line == "/devices") {
            for (const auto& d : listInputDevices()) {
                std::cout << "#" << d.index << ": " << d.name << " (" << d.hostApi << ")"
                          << (d.isDefault ? " *default*" : "") << "\n";
            }
            continue;
        }
        if (line.rfind("/screen ", 0) == 0) {
            std::string name = line.substr(8);
            std::unique_ptr<VoiceScreen> next;
            if (name == "game") {
                next = std::make_unique<GameScreen>(services, position);
            } else if (name == "reconstruction") {
                next = std::make_unique<ReconstructionScreen>(services, position.board());
            } else if (name == "training") {
                std::ifstream f(resolveResource(opts.drills));
                nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
                auto drills = drillsFromJson(j);
                if (drills.empty()) {
                    std::cout << "No drills in " << resolveResource(opts.drills).string() << "\n";
                    continue;
                }
                next = std::make_unique<TrainingScreen>(services, "notation", std::move(drills));
            } else {
                std::cout << "Unknown screen: " << name << "\n";
                continue;
            }

            // Reconstruction takes the lane over while the game is still up;
            // other screens wait for the old one to leave
            bool takesOver = (name == "reconstruction");
            if (!takesOver) screen->unmount();
            if (!next->mount()) {
                std::cout << "Lane busy: " << session.currentLane().value_or("-") << "\n";
                if (!takesOver) screen->mount();
                continue;
            }
            screen = std::move(next);
            continue;
        }

        LOG_TRACE("Console", "Typed transcript: " + line);
        screen->handleTranscript(line);
        if (!isTranscriptTooShort(line)) std::cout << screen->lastSpoken() << "\n";
    }

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    screen.reset();
    session.stop();
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}
