#include "voice/voice_speak.hpp"
#include "response_manager.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <chrono>
#include <cstdlib>
#include <random>
#include <thread>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

// =========================================================
// Helpers
// =========================================================
static std::string randomString(size_t length) {
    static const char charset[] =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 rg{std::random_device{}()};
    static thread_local std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; i++) {
        result.push_back(charset[dist(rg)]);
    }
    return result;
}

// Text goes inside double quotes in a shell command
static std::string shellSafe(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += '\''; break;
            case '\\': case '`': case '$': break;
            case '\n': case '\r': out += ' '; break;
            default:   out += c;
        }
    }
    return out;
}

static void replaceAll(std::string& s, const std::string& token, const std::string& value) {
    size_t pos = 0;
    while ((pos = s.find(token, pos)) != std::string::npos) {
        s.replace(pos, token.size(), value);
        pos += value.size();
    }
}

std::string buildSynthCommand(const std::string& tmpl,
                              const std::string& outFile,
                              const std::string& text) {
    std::string cmd = tmpl;
    replaceAll(cmd, "{out}", shellSafe(outFile));
    replaceAll(cmd, "{text}", shellSafe(text));
    return cmd;
}

// =========================================================
// SystemSpeechOutput
// =========================================================
SystemSpeechOutput::SystemSpeechOutput(const nlohmann::json& tts)
    : enabled(tts.value("enabled", true)),
      phonetic(tts.value("phonetic", true)),
      commandTemplate(tts.value("command", std::string("espeak-ng -w \"{out}\" \"{text}\""))),
      outputDir(tts.value("output_dir", std::string("tts_out"))) {
    if (outputDir.is_relative()) {
        outputDir = fs::path(getResourcePath()) / outputDir;
    }
}

bool SystemSpeechOutput::synthesize(const std::string& text, const fs::path& outFile) {
    std::string cmd = buildSynthCommand(commandTemplate, outFile.string(), text);
    LOG_TRACE("Voice/TTS", "Synth command: " + cmd);

    int rc = std::system(cmd.c_str());
    if (rc != 0 || !fs::exists(outFile)) {
        ErrorManager::report("ERR_VOICE_TTS_FAILED", "exit code " + std::to_string(rc));
        return false;
    }
    return true;
}

bool SystemSpeechOutput::playAudio(const fs::path& path) {
    sf::SoundBuffer buffer;
    if (!buffer.loadFromFile(path)) {
        LOG_ERROR("Voice/Audio", "Could not load file: " + path.string());
        return false;
    }

    sf::Sound sound(buffer);
    sound.setVolume(100.f);
    sound.play();

    LOG_DEBUG("Voice/Audio", "Playing: " + path.string() +
        " (duration=" + std::to_string(buffer.getDuration().asSeconds()) + "s)");

    while (sound.getStatus() == sf::SoundSource::Status::Playing) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

bool SystemSpeechOutput::speak(const std::string& utterance) {
    if (utterance.empty()) return true;

    if (!enabled) {
        LOG_DEBUG("Voice/TTS", "TTS disabled, not speaking: " + utterance);
        return true;
    }

    std::lock_guard<std::mutex> lock(playMutex);

    std::string text = phonetic ? ResponseManager::toPhonetic(utterance) : utterance;
    LOG_DEBUG("Voice", "speak(\"" + text + "\")");

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        LOG_ERROR("Voice/TTS", "Cannot create " + outputDir.string() + ": " + ec.message());
        return false;
    }

    fs::path wavPath = outputDir / (randomString(16) + ".wav");
    bool played = synthesize(text, wavPath) && playAudio(wavPath);

    fs::remove(wavPath, ec);
    return played;
}
