#include "bootstrap_config.hpp"
#include "commands/command_grammar.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "phonetics/vocabulary.hpp"
#include "voice_constants.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool mergeDefaults(nlohmann::json& cfg,
                          const nlohmann::json& defs,
                          const std::string& prefix = "",
                          int* patchedCount = nullptr) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal,
                              prefix.empty() ? key : prefix + "." + key,
                              patchedCount))
                patched = true;
        } else if (cfg[key].type() != defVal.type() &&
                   !(cfg[key].is_number() && defVal.is_number())) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

static void writeConfig(const fs::path& path, const nlohmann::json& cfg, const std::string& name) {
    std::ofstream out(path);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + name + " to " + path.string());
        return;
    }
    out << cfg.dump(2) << '\n';
}

// ----------------- defaults -----------------
namespace bootstrap_config {

nlohmann::json defaultVoiceConfig() {
    return {
        {"log_file", "blindfold_voice.log"},
        {"log_level", "debug"},
        {"mute_tail_ms", 350},

        {"asr", {
            {"backend", "whisper"},
            {"fallback", "remote"},
            {"whisper_model", "ggml-base.en.bin"},
            {"language", "en"},
            {"max_tokens", 32},
            {"input_device_index", -1},
            {"sample_rate", 16000},
            {"silence_threshold", 0.02},
            {"min_speech_ms", 300},
            {"min_silence_ms", 700},
            {"max_utterance_ms", 8000},
            {"remote_url", "http://127.0.0.1:8080"},
            {"remote_timeout_ms", 5000}
        }},

        {"tts", {
            {"enabled", true},
            {"command", "espeak-ng -w \"{out}\" \"{text}\""},
            {"output_dir", "tts_out"},
            {"phonetic", true}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_VOICE_UNMATCHED", {
            {"user", "Sorry, I didn't understand that."},
            {"debug", "Transcript matched no command and no legal move."}
        }},
        {"ERR_VOICE_AMBIGUOUS_TIMEOUT", {
            {"user", "Move cancelled."},
            {"debug", "No disambiguation follow-up before the timeout."}
        }},
        {"ERR_VOICE_SESSION_START", {
            {"user", "Voice input could not start. Trying another recognizer."},
            {"debug", "Primary ASR backend failed to start."}
        }},
        {"ERR_VOICE_DISABLED", {
            {"user", "Voice control is unavailable. Please use touch input."},
            {"debug", "Primary and fallback ASR backends both failed to start."}
        }},
        {"ERR_VOICE_PERMISSION_DENIED", {
            {"user", "Microphone access was denied. Enable it to use voice."},
            {"debug", "ASR backend reported permission denied."}
        }},
        {"ERR_VOICE_LANE_REJECTED", {
            {"user", "Voice is in use by another screen."},
            {"debug", "Lane registration refused: current lane is protected."}
        }},
        {"ERR_VOICE_MOVE_REJECTED", {
            {"user", "That move could not be played."},
            {"debug", "Rules engine rejected a resolved move."}
        }},
        {"ERR_VOICE_TTS_FAILED", {
            {"user", "Speech output failed."},
            {"debug", "Synthesizer command or audio playback failed."}
        }},
        {"ERR_VOICE_MODEL_MISSING", {
            {"user", "Speech model not found."},
            {"debug", "Whisper model file missing under resources/models."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "A config file was invalid and has been reset to defaults."},
            {"debug", "JSON config failed parsing or validation."}
        }},
        {"ERR_POSITION_LOAD", {
            {"user", "Could not load the position file."},
            {"debug", "Position JSON missing or malformed."}
        }}
    };
}

nlohmann::json defaultVocabulary() {
    // Spoken rank words, for lookaheads in the compound rules
    const std::string ranks =
        "(?:[1-8]|one|won|first|two|too|second|three|free|tree|third|four|for|fore|"
        "forth|fourth|five|fifth|six|sixth|sicks|seven|seventh|eight|ate|eighth)";
    const std::string ranksNotOne =
        "(?:[2-8]|two|too|second|three|free|tree|third|four|for|fore|"
        "forth|fourth|five|fifth|six|sixth|sicks|seven|seventh|eight|ate|eighth)";

    return {
        {"compounds", nlohmann::json::array({
            {{"pattern", R"(\bo o o\b)"},              {"replace", "castle queenside"}},
            {{"pattern", R"(\bo o\b)"},                {"replace", "castle kingside"}},
            {{"pattern", R"(\bcastl(?:es|ing)\b)"},    {"replace", "castle"}},
            {{"pattern", R"(\bking\s+side\b)"},        {"replace", "kingside"}},
            {{"pattern", R"(\bqueen\s+side\b)"},       {"replace", "queenside"}},
            {{"pattern", R"(\brookies?\b)"},           {"replace", "rook e"}},
            {{"pattern", R"(\b(?:rook|rock)\s+he\b)"}, {"replace", "rook e"}},
            {{"pattern", R"(\brock\s+([a-h])\b)"},     {"replace", "rook $1"}},
            {{"pattern", R"(\bbefore\b)"},             {"replace", "b 4"}},
            {{"pattern", "\\bhe(?=\\s+" + ranks + "\\b)"},        {"replace", "e"}},
            {{"pattern", "\\bthe(?=\\s+" + ranksNotOne + "\\b)"}, {"replace", "d"}}
        })},

        {"files", {
            {"a", {"alpha", "alfa", "ay", "aye", "eh", "apple", "able"}},
            {"b", {"bee", "be", "bravo", "boy", "baker"}},
            {"c", {"cee", "see", "sea", "charlie", "cat"}},
            {"d", {"dee", "delta", "dog", "david"}},
            {"e", {"eee", "ee", "echo", "easy", "edward"}},
            {"f", {"ef", "eff", "foxtrot", "fox", "frank"}},
            {"g", {"gee", "jee", "golf", "george"}},
            {"h", {"aitch", "ach", "hotel", "henry"}}
        }},

        {"context_ranks", {
            {"4", nlohmann::json::array({"for"})},
            {"2", nlohmann::json::array({"too"})}
        }},

        {"ranks", {
            {"1", {"one", "won", "first"}},
            {"2", {"two", "second"}},
            {"3", {"three", "free", "tree", "third"}},
            {"4", {"four", "fore", "forth", "fourth"}},
            {"5", {"five", "fifth"}},
            {"6", {"six", "sixth", "sicks"}},
            {"7", {"seven", "seventh"}},
            {"8", {"eight", "ate", "eighth"}}
        }},

        {"pieces", {
            {"knight", {"night", "nite", "knights", "nights", "horse", "horses"}},
            {"rook", {"rock", "rocks", "brook", "rooks", "ruk"}},
            {"bishop", {"bish", "bishup", "bishep", "bashop", "bishops"}},
            {"queen", nlohmann::json::array({"queens"})},
            {"king", nlohmann::json::array({"kings"})},
            {"pawn", {"pond", "pawns", "prawn"}}
        }},

        {"connectors", {"to", "takes", "take", "taking", "captures", "capture", "x", "moves", "move"}},

        {"fillers", {"um", "uh", "er", "erm", "the", "an", "like", "so", "well", "just",
                     "actually", "basically", "please", "my", "okay"}},

        {"disambiguation", {
            {"a", nlohmann::json::array({"hey"})},
            {"d", {"the", "tea", "tee"}},
            {"e", nlohmann::json::array({"ee"})},
            {"f", {"if", "off"}},
            {"1", nlohmann::json::array({"want"})},
            {"3", nlohmann::json::array({"tree"})},
            {"4", nlohmann::json::array({"fore"})},
            {"5", nlohmann::json::array({"fife"})},
            {"6", nlohmann::json::array({"sick"})},
            {"8", nlohmann::json::array({"ait"})}
        }}
    };
}

nlohmann::json defaultCommandRules() {
    auto rule = [](const std::string& intent, const std::string& description,
                   const std::string& pattern, std::vector<std::string> slots,
                   std::vector<std::string> contexts, bool exact = false) {
        return nlohmann::json{
            {"intent", intent},
            {"description", description},
            {"pattern", pattern},
            {"slot_names", slots},
            {"contexts", contexts},
            {"exact", exact}
        };
    };

    nlohmann::json rules = nlohmann::json::array({
        rule("meta.confirm_yes", "Confirm the pending question",
             R"(\b(?:yes|yeah|yep|confirm|do it|sure)\b)", {}, {"game.confirm"}),
        rule("meta.confirm_no", "Decline the pending question",
             R"(\b(?:no|nope|cancel|never mind|nevermind|don't)\b)", {}, {"game.confirm"}),
        rule("meta.repeat", "Repeat the last spoken feedback",
             R"(\b(?:repeat|say again|say that again|what was that|again)\b)", {},
             {"game", "game.confirm", "training"}),
        rule("query.square_contents", "What is on a square",
             R"(\bwhat(?:'s| is|s)?\s+(?:on\s+|at\s+)?([a-h])\s?([1-8])\b)", {"file", "rank"},
             {"game"}),
        rule("query.last_move", "Opponent's last move",
             R"(\b(?:last move|previous move|opponent'?s move|what did (?:they|you) play)\b)", {},
             {"game"}),
        rule("query.clock", "Time left on the clock",
             R"(\b(?:how much time|what(?:'s| is) the time|time left|time remaining|clock|my time)\b)",
             {}, {"game"}),
        rule("query.legal_moves_for", "Legal moves for a piece type",
             R"(\blegal\s+moves?\s+(?:for\s+)?(?:my\s+|the\s+|a\s+)?(\w+))", {"piece"}, {"game"}),
        rule("query.piece_location", "Where are my pieces of a type",
             R"(\bwhere(?:'s| is| are|s)?\s+(?:my\s+|the\s+)?(\w+))", {"piece"}, {"game"}),
        rule("query.material", "Material balance",
             R"(\b(?:material|who is ahead|who's ahead|score)\b)", {}, {"game"}),
        rule("query.evaluation", "Engine evaluation",
             R"(\b(?:eval|evaluate|evaluation|how am i doing)\b)", {}, {"game"}),
        rule("meta.resign", "Resign the game (asks for confirmation)",
             R"(\b(?:resign|give up|i quit|quit)\b)", {}, {"game"}),
        rule("meta.peek", "Briefly show the board",
             R"((?:peek|peak|show|show board|show the board|show me the board))", {},
             {"game", "training"}, true),
        rule("meta.clear_board", "Empty the reconstruction board",
             R"(\b(?:clear all|clear board|reset board|reset|start over)\b)", {},
             {"reconstruction"}),
        rule("meta.submit", "Check the reconstructed position",
             R"(\b(?:done|submit|check position|finished)\b)", {}, {"reconstruction"}),
        rule("meta.switch_color", "Set the sticky placement color",
             R"((?:switch\s+(?:to\s+)?|use\s+)?(white|black)(?:\s+pieces)?)", {"color"},
             {"reconstruction"}, true),
        rule("meta.remove_piece", "Remove the piece on a square",
             R"(\b(?:clear|remove|delete|empty)\b.*?\b([a-h])\s?([1-8])\b)", {"file", "rank"},
             {"reconstruction"}),
        rule("meta.place_piece", "Place a piece on a square",
             R"((?:\b(white|black)\s+)?\b(king|queen|rook|bishop|knight|pawn)\s+(?:on\s+|at\s+|to\s+)?([a-h])\s?([1-8])\b)",
             {"color", "piece", "file", "rank"}, {"reconstruction"})
    });

    return {
        {"version", 1},
        {"rules", rules}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        writeConfig(path, outConfig, name);

        LOG_PHASE(name + " created", true);
        return true;
    }

    std::ifstream f(path);
    nlohmann::json parsed = nlohmann::json::parse(f, nullptr, false);

    if (parsed.is_discarded() || parsed.type() != defaults.type()) {
        LOG_ERROR("Config", name + " invalid → reset to defaults");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        writeConfig(path, outConfig, name);
        return false;
    }

    outConfig = std::move(parsed);

    int patchedCount = 0;
    if (outConfig.is_object() && mergeDefaults(outConfig, defaults, "", &patchedCount)) {
        writeConfig(path, outConfig, name);
        LOG_PHASE(name + " patched", true);
        LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
    } else {
        LOG_PHASE(name + " load", true);
    }
    return true;
}

// ----------------- entry -----------------
LoadedConfig initAll(const fs::path& dir,
                     Phonetics::Vocabulary& vocab,
                     CommandGrammar& grammar) {
    LoadedConfig out;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        LOG_ERROR("Config", "Could not create config dir " + dir.string() + ": " + ec.message());
    }

    // errors.json first so later reports carry real messages
    loadConfig(dir / ERRORS_FILE, defaultErrors(), out.errors, "Errors config");
    ErrorManager::loadFromJson(out.errors);

    loadConfig(dir / VOICE_CONFIG_FILE, defaultVoiceConfig(), out.voice,
               "Voice config", "ERR_CONFIG_INVALID");

    // vocabulary.json
    nlohmann::json vocabCfg;
    loadConfig(dir / VOCABULARY_FILE, defaultVocabulary(), vocabCfg,
               "Vocabulary", "ERR_CONFIG_INVALID");
    std::string err;
    if (!vocab.load(vocabCfg, &err)) {
        ErrorManager::report("ERR_CONFIG_INVALID", "vocabulary: " + err);
        if (!vocab.load(defaultVocabulary(), &err)) {
            LOG_ERROR("Config", "Built-in vocabulary rejected: " + err);
        }
        out.vocabularyFromDefaults = true;
        LOG_PHASE("Vocabulary load", false);
    } else {
        LOG_PHASE("Vocabulary load", true);
    }

    // command_rules.json
    nlohmann::json rulesCfg;
    loadConfig(dir / COMMAND_RULES_FILE, defaultCommandRules(), rulesCfg,
               "Command rules", "ERR_CONFIG_INVALID");
    err.clear();
    if (!grammar.load_rules_from_json(rulesCfg.value("rules", nlohmann::json::array()), &err) ||
        grammar.rule_count() == 0) {
        ErrorManager::report("ERR_CONFIG_INVALID", "command rules: " + err);
        if (!grammar.load_rules_from_json(defaultCommandRules()["rules"], &err)) {
            LOG_ERROR("Config", "Built-in command rules rejected: " + err);
        }
        out.rulesFromDefaults = true;
        LOG_PHASE("Command rules load", false);
    } else {
        LOG_PHASE("Command rules load", true);
    }

    return out;
}

} // namespace bootstrap_config
