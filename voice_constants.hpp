#pragma once
#include <chrono>
#include <cstddef>

// Fixed interaction constants. Not read from any config file.
inline constexpr std::chrono::milliseconds DISAMBIGUATION_TIMEOUT{10000};
inline constexpr std::size_t MIN_TRANSCRIPT_CHARS = 2;

// Default config file names (resolved against getResourcePath())
inline constexpr const char* VOICE_CONFIG_FILE   = "voice_config.json";
inline constexpr const char* ERRORS_FILE         = "errors.json";
inline constexpr const char* VOCABULARY_FILE     = "vocabulary.json";
inline constexpr const char* COMMAND_RULES_FILE  = "command_rules.json";
