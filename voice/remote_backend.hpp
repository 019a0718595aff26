#pragma once
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "voice/asr_backend.hpp"
#include "voice/audio_capture.hpp"

// ------------------------------------------------------------
// RemoteAsrBackend: same microphone capture, recognition done by an
// HTTP transcription server (whisper.cpp server style):
//   GET  <url>            reachability / auth probe
//   POST <url>/inference  multipart "file" = WAV, returns {"text": ...}
// ------------------------------------------------------------
class RemoteAsrBackend : public AsrBackend {
public:
    explicit RemoteAsrBackend(const nlohmann::json& asrConfig);
    ~RemoteAsrBackend() override;

    std::string name() const override { return "remote"; }
    AsrStartResult start(TranscriptSink sink) override;
    void stop() override;

private:
    AsrStartResult probe() const;
    std::string transcribe(const std::vector<float>& pcm) const;

    std::string url;
    int timeoutMs;
    int sampleRate;
    AudioCapture capture;
};
