#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "commands/san.hpp"

enum class Color { White, Black };

inline std::string colorName(Color c) { return c == Color::White ? "white" : "black"; }
inline Color opposite(Color c) { return c == Color::White ? Color::Black : Color::White; }

inline std::optional<Color> colorFromString(const std::string& s) {
    if (s == "white" || s == "w") return Color::White;
    if (s == "black" || s == "b") return Color::Black;
    return std::nullopt;
}

struct PieceOnSquare {
    Color color = Color::White;
    San::PieceType piece = San::PieceType::Pawn;

    bool operator==(const PieceOnSquare& o) const { return color == o.color && piece == o.piece; }
    bool operator!=(const PieceOnSquare& o) const { return !(*this == o); }
};

// Square ("e4") -> piece
using BoardMap = std::map<std::string, PieceOnSquare>;

// ------------------------------------------------------------
// ChessPosition: the rules engine as seen by the voice screens.
// Move strings are SAN for the side to move.
// ------------------------------------------------------------
class ChessPosition {
public:
    virtual ~ChessPosition() = default;

    virtual std::vector<std::string> legalMoves() const = 0;
    virtual std::optional<PieceOnSquare> pieceAt(const std::string& square) const = 0;
    virtual Color sideToMove() const = 0;
    virtual bool applyMove(const std::string& san) = 0;
    virtual std::optional<std::string> lastMove() const = 0;
    virtual BoardMap board() const = 0;

    // Optional extras; engines without a clock or evaluation keep the defaults
    virtual std::optional<int> clockSeconds(Color) const { return std::nullopt; }
    virtual std::optional<double> evaluation() const { return std::nullopt; }
};
