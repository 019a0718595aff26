#pragma once
#include <optional>
#include <vector>
#include <nlohmann/json_fwd.hpp>

// Capture and segmentation tuning (voice_config.json "asr" block)
struct CaptureSettings {
    int inputDeviceIndex = -1;          // -1 = default input device
    int sampleRate = 16000;
    double silenceThreshold = 0.02;     // RMS below this is silence
    int minSpeechMs = 300;
    int minSilenceMs = 700;
    int maxUtteranceMs = 8000;

    static CaptureSettings fromJson(const nlohmann::json& asr);
};

double rmsLevel(const std::vector<float>& pcm);
bool isSilence(const std::vector<float>& pcm, double threshold);

// ------------------------------------------------------------
// UtteranceSegmenter: splits a stream of PCM chunks into
// utterances by RMS silence. Time is counted in samples, so the
// result does not depend on how fast chunks arrive.
// ------------------------------------------------------------
class UtteranceSegmenter {
public:
    explicit UtteranceSegmenter(const CaptureSettings& settings);

    // Returns a finished utterance when this chunk closes one
    std::optional<std::vector<float>> feed(const std::vector<float>& chunk);

    // Pending speech (if long enough), then reset
    std::optional<std::vector<float>> flush();

    void reset();
    bool inSpeech() const { return speaking; }

private:
    long long toMs(size_t samples) const;
    std::optional<std::vector<float>> finish();

    CaptureSettings settings;
    std::vector<float> segment;
    bool speaking = false;
    size_t speechSamples = 0;
    size_t silenceSamples = 0;
};
