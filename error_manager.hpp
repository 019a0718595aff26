#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "commands/command_result.hpp"

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from a JSON file (errors.json)
    bool load(const std::string& path);

    // Replace the table directly (bootstrap, tests)
    void loadFromJson(const nlohmann::json& table);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);
    bool hasCode(const std::string& code);

    // Report an error (logs debug text, returns user-facing result)
    CommandResult report(const std::string& code);
    CommandResult report(const std::string& code, const std::string& detail);
}
