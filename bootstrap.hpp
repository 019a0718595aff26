#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "bootstrap_config.hpp"

class AsrBackend;

// Config, tables, logging level and model checks. Never fatal.
bootstrap_config::LoadedConfig runBootstrapChecks(const std::filesystem::path& resourceDir,
                                                  Phonetics::Vocabulary& vocab,
                                                  CommandGrammar& grammar);

// "whisper" | "remote"; nullptr for "none" or an unknown name
std::unique_ptr<AsrBackend> makeAsrBackend(const std::string& name, const nlohmann::json& asrConfig);
