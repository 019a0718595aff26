#pragma once
#include <map>
#include <string>
#include <vector>
#include "commands/command_result.hpp"

namespace ResponseManager {
    // Random variant for a phrase key; unknown keys come back unchanged
    std::string get(const std::string& key);

    // All variants registered for a key (empty when unknown)
    std::vector<std::string> variants(const std::string& key);

    // get(key) with {name} placeholders filled in
    std::string format(const std::string& key,
                       const std::map<std::string, std::string>& values);

    // Successful result that is also spoken
    CommandResult spoken(const std::string& text, const std::string& category);

    // "Nxf3+" -> "Knight takes f3, check"
    std::string moveToSpeech(const std::string& san);

    // Letters and SAN spelled out for the synthesizer ("a 4" -> "Ay 4")
    std::string toPhonetic(const std::string& text);

    // "a, b and c"
    std::string joinSpoken(const std::vector<std::string>& items);

    // 125 -> "2 minutes and 5 seconds"
    std::string formatClock(int seconds);
}
