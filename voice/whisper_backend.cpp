#include "voice/whisper_backend.hpp"
#include "voice/transcript.hpp"
#include "resources.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

void WhisperBackend::ContextDeleter::operator()(whisper_context* c) const {
    if (c) whisper_free(c);
}

WhisperBackend::WhisperBackend(const nlohmann::json& asrConfig)
    : modelName(asrConfig.value("whisper_model", std::string("ggml-base.en.bin"))),
      language(asrConfig.value("language", std::string("en"))),
      maxTokens(asrConfig.value("max_tokens", 32)),
      capture(CaptureSettings::fromJson(asrConfig)) {}

WhisperBackend::~WhisperBackend() {
    stop();
}

// ============================================================
// Lazy Whisper Initialization
// ============================================================
bool WhisperBackend::ensureModelLoaded() {
    std::lock_guard<std::mutex> lock(ctxMutex);
    if (ctx) return true;

    fs::path modelPath = resourceFile("models/" + modelName);
    LOG_DEBUG("Whisper", "Looking for model at: " + modelPath.string());

    if (!fs::exists(modelPath)) {
        ErrorManager::report("ERR_VOICE_MODEL_MISSING", modelPath.string());
        return false;
    }

    whisper_context_params wparams = whisper_context_default_params();
    ctx.reset(whisper_init_from_file_with_params(modelPath.string().c_str(), wparams));
    if (!ctx) {
        LOG_ERROR("Whisper", "Failed to load model: " + modelPath.string());
        return false;
    }

    LOG_PHASE("Whisper model load", true);
    return true;
}

std::string WhisperBackend::transcribe(const std::vector<float>& pcm) {
    std::lock_guard<std::mutex> lock(ctxMutex);
    if (!ctx || pcm.empty()) return {};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.no_timestamps    = true;
    params.print_progress   = false;
    params.print_realtime   = false;
    params.single_segment   = true;
    params.max_tokens       = maxTokens;
    params.language         = language.c_str();

    if (whisper_full(ctx.get(), params, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        LOG_ERROR("Whisper", "whisper_full() failed");
        return {};
    }

    std::string transcript;
    int n = whisper_full_n_segments(ctx.get());
    for (int i = 0; i < n; i++) {
        transcript += whisper_full_get_segment_text(ctx.get(), i);
        transcript += " ";
    }
    return sanitizeTranscript(transcript);
}

// ============================================================
// AsrBackend
// ============================================================
AsrStartResult WhisperBackend::start(TranscriptSink sink) {
    if (!ensureModelLoaded()) {
        return AsrStartResult::failed("whisper model unavailable");
    }

    return capture.open([this, sink](std::vector<float>&& pcm) {
        std::string text = transcribe(pcm);
        if (text.empty()) {
            LOG_TRACE("Whisper", "Empty transcript for segment");
            return;
        }
        LOG_DEBUG("Whisper", "Heard: \"" + text + "\"");
        sink(text);
    });
}

void WhisperBackend::stop() {
    capture.close();
}
