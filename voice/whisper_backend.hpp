#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "voice/asr_backend.hpp"
#include "voice/audio_capture.hpp"

// Forward declare
struct whisper_context;

// ------------------------------------------------------------
// WhisperBackend: local whisper.cpp recognition over AudioCapture.
// The model is loaded on the first start() and kept until destruction.
// ------------------------------------------------------------
class WhisperBackend : public AsrBackend {
public:
    explicit WhisperBackend(const nlohmann::json& asrConfig);
    ~WhisperBackend() override;

    std::string name() const override { return "whisper"; }
    AsrStartResult start(TranscriptSink sink) override;
    void stop() override;

private:
    bool ensureModelLoaded();
    std::string transcribe(const std::vector<float>& pcm);

    struct ContextDeleter {
        void operator()(whisper_context* ctx) const;
    };

    std::string modelName;
    std::string language;
    int maxTokens;
    AudioCapture capture;

    std::mutex ctxMutex;
    std::unique_ptr<whisper_context, ContextDeleter> ctx;
};
