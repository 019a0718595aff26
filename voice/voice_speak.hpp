#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <nlohmann/json_fwd.hpp>

// ------------------------------------------------------------
// SpeechOutput: text to speech. speak() blocks until playback has
// finished and reports whether anything was played.
// ------------------------------------------------------------
class SpeechOutput {
public:
    virtual ~SpeechOutput() = default;
    virtual bool speak(const std::string& utterance) = 0;
};

// Fill {out} and {text} in a synthesizer command template
std::string buildSynthCommand(const std::string& tmpl,
                              const std::string& outFile,
                              const std::string& text);

// ------------------------------------------------------------
// SystemSpeechOutput: external synthesizer writes a WAV, SFML plays it.
// Playbacks are serialized; a second caller waits for the first.
// ------------------------------------------------------------
class SystemSpeechOutput : public SpeechOutput {
public:
    explicit SystemSpeechOutput(const nlohmann::json& ttsConfig);

    bool speak(const std::string& utterance) override;

private:
    bool synthesize(const std::string& text, const std::filesystem::path& outFile);
    bool playAudio(const std::filesystem::path& path);

    bool enabled;
    bool phonetic;
    std::string commandTemplate;
    std::filesystem::path outputDir;
    std::mutex playMutex;
};
