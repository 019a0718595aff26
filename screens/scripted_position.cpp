#include "screens/scripted_position.hpp"
#include "phonetics/normalizer.hpp"
#include "logger.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

std::optional<PieceOnSquare> pieceFromCode(const std::string& code) {
    if (code.size() != 2) return std::nullopt;
    auto color = colorFromString(std::string(1, code[0]));
    auto piece = San::pieceFromLetter(code[1]);
    if (!color || !piece) return std::nullopt;
    return PieceOnSquare{ *color, *piece };
}

bool ScriptedPosition::load(const nlohmann::json& j, std::string* err) {
    if (!j.is_object() || !j.contains("plies") || !j["plies"].is_array() || j["plies"].empty()) {
        if (err) *err = "position needs a non-empty \"plies\" array";
        return false;
    }

    std::vector<Ply> loaded;
    try {
        for (const auto& p : j["plies"]) {
            Ply ply;
            auto side = colorFromString(p.value("side", std::string("white")));
            if (!side) {
                if (err) *err = "bad side in ply " + std::to_string(loaded.size());
                return false;
            }
            ply.side = *side;

            for (const auto& [square, code] : p.value("board", nlohmann::json::object()).items()) {
                auto piece = pieceFromCode(code.get<std::string>());
                if (!Phonetics::isSquareToken(square) || !piece) {
                    if (err) *err = "bad board entry " + square + " in ply " + std::to_string(loaded.size());
                    return false;
                }
                ply.board[square] = *piece;
            }

            ply.legal = p.value("legal", std::vector<std::string>{});
            if (p.contains("eval") && p["eval"].is_number()) {
                ply.eval = p["eval"].get<double>();
            }
            loaded.push_back(std::move(ply));
        }

        title = j.value("name", std::string("scripted"));
        whiteClock.reset();
        blackClock.reset();
        if (j.contains("clock") && j["clock"].is_object()) {
            const auto& c = j["clock"];
            if (c.contains("white")) whiteClock = c["white"].get<int>();
            if (c.contains("black")) blackClock = c["black"].get<int>();
        }
    } catch (const nlohmann::json::exception& e) {
        if (err) *err = e.what();
        return false;
    }

    plies = std::move(loaded);
    current = 0;
    played.reset();
    LOG_DEBUG("Position", "Loaded '" + title + "' (" + std::to_string(plies.size()) + " plies)");
    return true;
}

bool ScriptedPosition::load_file(const std::string& path, std::string* err) {
    std::ifstream f(path);
    if (!f.is_open()) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        if (err) *err = "invalid JSON in " + path;
        return false;
    }
    return load(j, err);
}

std::vector<std::string> ScriptedPosition::legalMoves() const {
    if (current >= plies.size()) return {};
    return plies[current].legal;
}

std::optional<PieceOnSquare> ScriptedPosition::pieceAt(const std::string& square) const {
    if (current >= plies.size()) return std::nullopt;
    const auto& b = plies[current].board;
    auto it = b.find(square);
    if (it == b.end()) return std::nullopt;
    return it->second;
}

Color ScriptedPosition::sideToMove() const {
    if (current >= plies.size()) return Color::White;
    return plies[current].side;
}

bool ScriptedPosition::applyMove(const std::string& san) {
    if (current >= plies.size()) return false;
    const auto& legal = plies[current].legal;
    if (std::find(legal.begin(), legal.end(), san) == legal.end()) {
        LOG_DEBUG("Position", "Rejected move " + san);
        return false;
    }

    played = san;
    // The last ply keeps its board; with no script left there are no legal moves
    if (current + 1 < plies.size()) {
        ++current;
    } else {
        plies[current].legal.clear();
    }
    return true;
}

std::optional<std::string> ScriptedPosition::lastMove() const {
    return played;
}

BoardMap ScriptedPosition::board() const {
    if (current >= plies.size()) return {};
    return plies[current].board;
}

std::optional<int> ScriptedPosition::clockSeconds(Color side) const {
    return side == Color::White ? whiteClock : blackClock;
}

std::optional<double> ScriptedPosition::evaluation() const {
    if (current >= plies.size()) return std::nullopt;
    return plies[current].eval;
}
