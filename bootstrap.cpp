#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "resources.hpp"
#include "voice/whisper_backend.hpp"
#include "voice/remote_backend.hpp"
#include "voice/input_devices.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

std::unique_ptr<AsrBackend> makeAsrBackend(const std::string& name, const nlohmann::json& asrConfig) {
    if (name == "whisper") return std::make_unique<WhisperBackend>(asrConfig);
    if (name == "remote")  return std::make_unique<RemoteAsrBackend>(asrConfig);

    if (name != "none" && !name.empty()) {
        LOG_ERROR("Config", "Unknown ASR backend '" + name + "'");
    }
    return nullptr;
}

bootstrap_config::LoadedConfig runBootstrapChecks(const fs::path& resourceDir,
                                                  Phonetics::Vocabulary& vocab,
                                                  CommandGrammar& grammar) {
    // ============================================================
    // Bootstrap start
    // ============================================================
    LOG_PHASE("Bootstrap begin", true);
    LOG_DEBUG("Config", "Resource root: " + resourceDir.string());

    // ============================================================
    // Centralized config bootstrap
    // ============================================================
    beginPhaseGroup();
    bootstrap_config::LoadedConfig cfg = bootstrap_config::initAll(resourceDir, vocab, grammar);
    endPhaseGroup();
    LOG_PHASE("Configs initialized", true);

    setLogLevel(logLevelFromString(cfg.voice.value("log_level", std::string("debug"))));
    if (!setLogFile(cfg.voice.value("log_file", std::string("blindfold_voice.log")))) {
        LOG_WARN("Config", "log_file not writable, logging to stderr only");
    }

    // ============================================================
    // Recognition backends
    // ============================================================
    const nlohmann::json asr = cfg.voice.value("asr", nlohmann::json::object());
    std::string backend  = asr.value("backend", std::string("whisper"));
    std::string fallback = asr.value("fallback", std::string("remote"));

    if (backend == "whisper" || fallback == "whisper") {
        fs::path modelPath = resourceDir / "models" / asr.value("whisper_model", std::string("ggml-base.en.bin"));
        if (fs::exists(modelPath)) {
            LOG_PHASE("Whisper model present", true);
        } else {
            LOG_WARN("Voice", "Whisper model not found at " + modelPath.string() +
                              ", local recognition will fail over");
            LOG_PHASE("Whisper model present", false);
        }
    }

    auto devices = listInputDevices();
    if (devices.empty()) {
        LOG_WARN("Voice", "No capture devices found");
        LOG_PHASE("Input device scan", false);
    } else {
        for (const auto& d : devices) {
            LOG_TRACE("Voice", "Input #" + std::to_string(d.index) + ": " + d.name +
                               (d.isDefault ? " (default)" : ""));
        }
        LOG_PHASE("Input device scan", true);
    }

    LOG_DEBUG("Voice", "ASR backend=" + backend + ", fallback=" + fallback);

    // ============================================================
    // Bootstrap complete
    // ============================================================
    PhaseSummary phases = phaseSummary();
    if (phases.failed > 0) {
        LOG_WARN("Bootstrap", std::to_string(phases.failed) + " phase(s) failed, last: " + phases.lastFailed);
    }
    LOG_PHASE("Bootstrap complete", true);
    return cfg;
}
