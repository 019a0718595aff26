#pragma once
#include <string>

// ------------------------------------------------------------
// CommandResult: unified return type for screen handlers
// ------------------------------------------------------------
struct CommandResult {
    std::string message;    // user-facing text
    bool success = true;    // true if the command took effect
    std::string errorCode;  // optional error code for ErrorManager
    std::string voice;      // text to speak back (empty = silent)
    std::string category;   // "move", "query", "meta", "error", "system"
};
