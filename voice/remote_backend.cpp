#include "voice/remote_backend.hpp"
#include "voice/wav.hpp"
#include "voice/transcript.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

RemoteAsrBackend::RemoteAsrBackend(const nlohmann::json& asrConfig)
    : url(asrConfig.value("remote_url", std::string("http://127.0.0.1:8080"))),
      timeoutMs(asrConfig.value("remote_timeout_ms", 5000)),
      sampleRate(asrConfig.value("sample_rate", 16000)),
      capture(CaptureSettings::fromJson(asrConfig)) {
    while (!url.empty() && url.back() == '/') url.pop_back();
}

RemoteAsrBackend::~RemoteAsrBackend() {
    stop();
}

// ============================================================
// Probe
// ============================================================
AsrStartResult RemoteAsrBackend::probe() const {
    auto r = cpr::Get(cpr::Url{url}, cpr::Timeout{timeoutMs});

    if (r.status_code == 0) {
        LOG_ERROR("RemoteASR", "Server unreachable at " + url + ": " + r.error.message);
        return AsrStartResult::failed("transcription server unreachable");
    }
    if (r.status_code == 401 || r.status_code == 403) {
        LOG_ERROR("RemoteASR", "Server refused access (HTTP " + std::to_string(r.status_code) + ")");
        return AsrStartResult::denied("transcription server refused access");
    }
    if (r.status_code >= 500) {
        LOG_ERROR("RemoteASR", "Server error (HTTP " + std::to_string(r.status_code) + ")");
        return AsrStartResult::failed("transcription server error");
    }

    LOG_DEBUG("RemoteASR", "Server reachable at " + url);
    return AsrStartResult::started();
}

std::string RemoteAsrBackend::transcribe(const std::vector<float>& pcm) const {
    std::string wav = encodeWav(pcm, sampleRate);

    auto resp = cpr::Post(
        cpr::Url{url + "/inference"},
        cpr::Multipart{
            {"file", cpr::Buffer{wav.begin(), wav.end(), "segment.wav"}},
            {"response_format", "json"}
        },
        cpr::Timeout{timeoutMs}
    );

    if (resp.status_code != 200) {
        LOG_ERROR("RemoteASR", "Transcription failed (HTTP " + std::to_string(resp.status_code) +
                               "): " + resp.error.message);
        return {};
    }

    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("text") || !j["text"].is_string()) {
        LOG_ERROR("RemoteASR", "Unexpected response: " + resp.text);
        return {};
    }
    return sanitizeTranscript(j["text"].get<std::string>());
}

// ============================================================
// AsrBackend
// ============================================================
AsrStartResult RemoteAsrBackend::start(TranscriptSink sink) {
    AsrStartResult probed = probe();
    if (!probed.ok()) return probed;

    return capture.open([this, sink](std::vector<float>&& pcm) {
        std::string text = transcribe(pcm);
        if (text.empty()) return;
        LOG_DEBUG("RemoteASR", "Heard: \"" + text + "\"");
        sink(text);
    });
}

void RemoteAsrBackend::stop() {
    capture.close();
}
