#pragma once
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "screens/chess_position.hpp"

// ------------------------------------------------------------
// ScriptedPosition: a game replayed from JSON. Each ply lists the
// board, side to move and legal moves; a legal move advances to the
// next ply. Stands in for a rules engine in the console harness.
//
//   { "name": "...", "clock": {"white": 300, "black": 300},
//     "plies": [ { "side": "white", "board": {"e1": "wK", ...},
//                  "legal": ["e4", ...], "eval": 0.3 }, ... ] }
// ------------------------------------------------------------
class ScriptedPosition : public ChessPosition {
public:
    bool load(const nlohmann::json& j, std::string* err = nullptr);
    bool load_file(const std::string& path, std::string* err = nullptr);

    std::vector<std::string> legalMoves() const override;
    std::optional<PieceOnSquare> pieceAt(const std::string& square) const override;
    Color sideToMove() const override;
    bool applyMove(const std::string& san) override;
    std::optional<std::string> lastMove() const override;
    BoardMap board() const override;
    std::optional<int> clockSeconds(Color side) const override;
    std::optional<double> evaluation() const override;

    const std::string& name() const { return title; }
    size_t plyIndex() const { return current; }

private:
    struct Ply {
        Color side = Color::White;
        BoardMap board;
        std::vector<std::string> legal;
        std::optional<double> eval;
    };

    std::string title;
    std::vector<Ply> plies;
    size_t current = 0;
    std::optional<std::string> played;
    std::optional<int> whiteClock;
    std::optional<int> blackClock;
};

// "wN" -> white knight
std::optional<PieceOnSquare> pieceFromCode(const std::string& code);
