#pragma once
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "commands/command.hpp"

// Screen contexts a rule can be active in
inline constexpr const char* CONTEXT_GAME           = "game";
inline constexpr const char* CONTEXT_GAME_CONFIRM   = "game.confirm";
inline constexpr const char* CONTEXT_RECONSTRUCTION = "reconstruction";
inline constexpr const char* CONTEXT_TRAINING       = "training";

// ------------------------------------------------------------
// CommandGrammar: regex rules over normalized text
// ------------------------------------------------------------
class CommandGrammar {
public:
    struct Rule {
        std::string intent;           // e.g. "query.square_contents"
        std::string description;      // human-readable
        std::string pattern_str;      // raw regex string
        std::regex pattern;           // compiled regex
        bool case_insensitive = true;
        bool exact = false;           // whole-text match instead of search

        std::vector<std::string> slot_names;  // names for capture groups
        std::vector<std::string> contexts;    // where the rule is active
    };

    // First rule (file order) active in context whose pattern matches
    // and whose slots convert cleanly.
    std::optional<Command> match(const std::string& text, const std::string& context) const;

    bool load_rules(const std::string& path, std::string* err = nullptr);
    bool load_rules_from_json(const nlohmann::json& j, std::string* err = nullptr);
    bool load_rules_from_string(const std::string& rulesText, std::string* err = nullptr);

    size_t rule_count() const { return rules.size(); }

private:
    std::vector<Rule> rules;
};

// Slot captures -> Command; nullopt when a slot cannot be converted
std::optional<Command> commandFromIntent(const std::string& intent,
                                         const std::map<std::string, std::string>& slots);

bool isKnownIntent(const std::string& intent);
