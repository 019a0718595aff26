#include "voice/segmenter.hpp"
#include "logger.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

CaptureSettings CaptureSettings::fromJson(const nlohmann::json& asr) {
    CaptureSettings s;
    if (!asr.is_object()) return s;

    s.inputDeviceIndex = asr.value("input_device_index", s.inputDeviceIndex);
    s.sampleRate       = asr.value("sample_rate", s.sampleRate);
    s.silenceThreshold = asr.value("silence_threshold", s.silenceThreshold);
    s.minSpeechMs      = asr.value("min_speech_ms", s.minSpeechMs);
    s.minSilenceMs     = asr.value("min_silence_ms", s.minSilenceMs);
    s.maxUtteranceMs   = asr.value("max_utterance_ms", s.maxUtteranceMs);

    if (s.sampleRate <= 0) {
        LOG_WARN("VoiceCapture", "Invalid sample_rate, using 16000");
        s.sampleRate = 16000;
    }
    return s;
}

// ---------------- Silence Detection ----------------
double rmsLevel(const std::vector<float>& pcm) {
    if (pcm.empty()) return 0.0;
    double energy = 0.0;
    for (float s : pcm) energy += static_cast<double>(s) * s;
    energy /= pcm.size();
    return std::sqrt(energy);
}

bool isSilence(const std::vector<float>& pcm, double threshold) {
    return rmsLevel(pcm) < threshold;
}

// ---------------- Segmenter ----------------
UtteranceSegmenter::UtteranceSegmenter(const CaptureSettings& settings)
    : settings(settings) {}

long long UtteranceSegmenter::toMs(size_t samples) const {
    return static_cast<long long>(samples) * 1000 / settings.sampleRate;
}

void UtteranceSegmenter::reset() {
    segment.clear();
    speaking = false;
    speechSamples = 0;
    silenceSamples = 0;
}

std::optional<std::vector<float>> UtteranceSegmenter::finish() {
    std::optional<std::vector<float>> out;
    if (toMs(speechSamples) >= settings.minSpeechMs) {
        out = std::move(segment);
    } else {
        LOG_TRACE("VoiceCapture", "Discarding short noise burst (" +
                                  std::to_string(toMs(speechSamples)) + " ms)");
    }
    reset();
    return out;
}

std::optional<std::vector<float>> UtteranceSegmenter::feed(const std::vector<float>& chunk) {
    if (chunk.empty()) return std::nullopt;

    bool silent = isSilence(chunk, settings.silenceThreshold);

    if (!silent) {
        if (!speaking) {
            speaking = true;
            LOG_TRACE("VoiceCapture", "Speech started");
        }
        speechSamples += chunk.size();
        silenceSamples = 0;
        segment.insert(segment.end(), chunk.begin(), chunk.end());
    } else if (speaking) {
        silenceSamples += chunk.size();
        segment.insert(segment.end(), chunk.begin(), chunk.end());
        if (toMs(silenceSamples) >= settings.minSilenceMs) {
            LOG_TRACE("VoiceCapture", "End of speech detected");
            return finish();
        }
    }

    if (speaking && toMs(segment.size()) >= settings.maxUtteranceMs) {
        LOG_DEBUG("VoiceCapture", "Utterance hit max length, cutting");
        return finish();
    }
    return std::nullopt;
}

std::optional<std::vector<float>> UtteranceSegmenter::flush() {
    if (!speaking) {
        reset();
        return std::nullopt;
    }
    return finish();
}
