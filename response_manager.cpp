#include <unordered_map>
#include <mutex>
#include <random>
#include <regex>
#include "response_manager.hpp"
#include "commands/san.hpp"
#include "logger.hpp"

// Simple random picker
static std::string pickRandom(const std::vector<std::string>& options) {
    static std::mt19937 gen(std::random_device{}());
    static std::mutex genMutex;
    std::lock_guard<std::mutex> lock(genMutex);
    std::uniform_int_distribution<> dist(0, static_cast<int>(options.size()) - 1);
    return options[dist(gen)];
}

// Response database
static const std::unordered_map<std::string, std::vector<std::string>> responses = {
    // --- Understanding ---
    { "unrecognized", {
        "Sorry, I didn't understand that.",
        "I didn't catch a move there.",
        "That didn't sound like a move."
    }},
    { "which_piece", {
        "I didn't catch that. Which piece?"
    }},
    { "disambiguate_two", {
        "Two {pieces} can move to {square}. The one on {first} or {second}?"
    }},
    { "disambiguate_many", {
        "Several {pieces} can move to {square}. Which one?"
    }},
    { "move_cancelled", {
        "Move cancelled."
    }},
    { "nothing_to_repeat", {
        "There is nothing to repeat."
    }},

    // --- Game queries ---
    { "square_empty", {
        "{square} is empty."
    }},
    { "square_piece", {
        "{color} {piece} on {square}."
    }},
    { "piece_location", {
        "Your {pieces}: {squares}."
    }},
    { "piece_none", {
        "You have no {pieces}."
    }},
    { "legal_moves", {
        "Your {piece} can move to {moves}."
    }},
    { "legal_moves_none", {
        "Your {piece} has no legal moves."
    }},
    { "material_equal", {
        "Material is equal."
    }},
    { "material_up", {
        "{color} is up {amount}."
    }},
    { "clock", {
        "You have {time} left."
    }},
    { "clock_unknown", {
        "This game has no clock."
    }},
    { "last_move", {
        "The last move was {move}."
    }},
    { "last_move_none", {
        "No moves have been played yet."
    }},
    { "eval", {
        "The evaluation is {score}."
    }},
    { "eval_unknown", {
        "No evaluation is available."
    }},

    // --- Game meta ---
    { "resign_confirm", {
        "Are you sure you want to resign? Say yes or no."
    }},
    { "resigned", {
        "You resigned the game."
    }},
    { "resign_kept", {
        "Okay, let's keep playing.",
        "Resignation cancelled."
    }},
    { "peek", {
        "Showing the board."
    }},
    { "game_over", {
        "The game is over."
    }},

    // --- Reconstruction ---
    { "placed", {
        "{color} {piece} on {square}."
    }},
    { "removed", {
        "{square} cleared."
    }},
    { "remove_empty", {
        "{square} is already empty."
    }},
    { "board_cleared", {
        "Board cleared."
    }},
    { "color_set", {
        "Placing {color} pieces."
    }},
    { "reconstruction_score", {
        "You placed {correct} of {total} pieces correctly."
    }},
    { "reconstruction_perfect", {
        "Perfect reconstruction!"
    }},

    // --- Training ---
    { "drill_prompt", {
        "Play {move}."
    }},
    { "drill_correct", {
        "Correct.",
        "That's right.",
        "Well done."
    }},
    { "drill_wrong", {
        "Not quite. The move was {move}."
    }},
    { "drill_done", {
        "Drill complete. {correct} of {total} correct."
    }},

    // --- Session ---
    { "listening", {
        "Listening.",
        "Voice control on."
    }},
};

std::string ResponseManager::get(const std::string& key) {
    auto it = responses.find(key);
    if (it != responses.end() && !it->second.empty()) {
        return pickRandom(it->second);
    }
    LOG_TRACE("Responses", "No phrase for key '" + key + "', using it verbatim");
    return key;
}

std::vector<std::string> ResponseManager::variants(const std::string& key) {
    auto it = responses.find(key);
    if (it == responses.end()) return {};
    return it->second;
}

std::string ResponseManager::format(const std::string& key,
                                    const std::map<std::string, std::string>& values) {
    std::string text = get(key);
    for (const auto& [name, value] : values) {
        const std::string token = "{" + name + "}";
        size_t pos = 0;
        while ((pos = text.find(token, pos)) != std::string::npos) {
            text.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
    return text;
}

CommandResult ResponseManager::spoken(const std::string& text, const std::string& category) {
    CommandResult result;
    result.message  = text;
    result.success  = true;
    result.voice    = text;
    result.category = category;
    return result;
}

std::string ResponseManager::joinSpoken(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += (i + 1 == items.size()) ? " and " : ", ";
        out += items[i];
    }
    return out;
}

std::string ResponseManager::formatClock(int seconds) {
    if (seconds < 0) seconds = 0;
    int minutes = seconds / 60;
    int rest = seconds % 60;

    auto unit = [](int n, const char* word) {
        return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
    };

    if (minutes == 0) return unit(rest, "second");
    if (rest == 0) return unit(minutes, "minute");
    return unit(minutes, "minute") + " and " + unit(rest, "second");
}

// ------------------------------------------------------------
// Move speech
// ------------------------------------------------------------
std::string ResponseManager::moveToSpeech(const std::string& san) {
    auto info = San::parse(san);
    if (!info) return san;

    std::string spoken;
    if (info->castleShort) {
        spoken = "Castles kingside";
    } else if (info->castleLong) {
        spoken = "Castles queenside";
    } else {
        if (info->piece != San::PieceType::Pawn) {
            spoken = San::pieceName(info->piece) + " ";
        }
        if (info->originFile && (info->capture || info->piece != San::PieceType::Pawn)) {
            spoken += std::string(1, *info->originFile) + " ";
        }
        if (info->originRank) {
            spoken += std::string(1, *info->originRank) + " ";
        }
        if (info->capture) spoken += "takes ";
        spoken += info->destination;
        if (info->promotion) {
            spoken += ", promotes to " + San::pieceName(*info->promotion);
        }
    }

    if (info->mate) {
        spoken += ", checkmate!";
    } else if (info->check) {
        spoken += ", check";
    }
    return spoken;
}

std::string ResponseManager::toPhonetic(const std::string& text) {
    static const std::regex chessPattern(R"([a-h]\s*[1-8]|[NBRQK][a-h]|O-O)");
    if (!std::regex_search(text, chessPattern)) return text;

    std::string result = std::regex_replace(text, std::regex("O-O-O"), "queenside castle");
    result = std::regex_replace(result, std::regex("O-O"), "kingside castle");

    static const std::vector<std::pair<std::string, std::string>> pieces = {
        {"N", "Knight"}, {"B", "Bishop"}, {"R", "Rook"}, {"Q", "Queen"}, {"K", "King"}
    };
    for (const auto& [letter, name] : pieces) {
        result = std::regex_replace(result, std::regex("\\b" + letter + "x?([a-h][1-8])"),
                                    name + " $1");
    }

    static const std::vector<std::pair<std::string, std::string>> files = {
        {"a", "Ay"}, {"b", "Bee"}, {"c", "See"}, {"d", "Dee"}, {"g", "Gee"}
    };
    for (const auto& [letter, sound] : files) {
        result = std::regex_replace(result, std::regex("\\b" + letter + "\\s*([1-8])\\b"),
                                    sound + " $1");
    }

    return std::regex_replace(result, std::regex("\\s+"), " ");
}
