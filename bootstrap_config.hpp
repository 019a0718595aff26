#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

namespace Phonetics { class Vocabulary; }
class CommandGrammar;

// Centralized config bootstrap for the voice subsystem
namespace bootstrap_config {

    // Everything loaded at startup; immutable afterwards
    struct LoadedConfig {
        nlohmann::json voice;      // voice_config.json
        nlohmann::json errors;     // errors.json
        bool vocabularyFromDefaults = false;
        bool rulesFromDefaults = false;
    };

    // Load/patch all config files under dir, fill vocabulary + grammar
    LoadedConfig initAll(const std::filesystem::path& dir,
                         Phonetics::Vocabulary& vocab,
                         CommandGrammar& grammar);

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Canonical defaults
    nlohmann::json defaultVoiceConfig();
    nlohmann::json defaultErrors();
    nlohmann::json defaultVocabulary();
    nlohmann::json defaultCommandRules();
}
