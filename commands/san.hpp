#pragma once
#include <optional>
#include <string>

// Standard Algebraic Notation helpers. Legal move strings come from the
// rules engine; nothing here checks chess legality.
namespace San {

enum class PieceType { Pawn, Knight, Bishop, Rook, Queen, King };

struct MoveInfo {
    PieceType piece = PieceType::Pawn;
    std::string destination;              // "d1"; empty for castling
    std::optional<char> originFile;       // disambiguator or pawn capture file
    std::optional<char> originRank;
    std::optional<PieceType> promotion;
    bool capture = false;
    bool castleShort = false;
    bool castleLong = false;
    bool check = false;
    bool mate = false;
};

// Parse a SAN move ("Rad1", "exd5", "e8=Q+", "O-O-O")
std::optional<MoveInfo> parse(const std::string& san);

// Strip x + # ! ? = and lowercase ("Nxf3+" -> "nf3")
std::string canonical(const std::string& san);

std::string pieceName(PieceType piece);            // "Knight"
std::string pieceWord(PieceType piece);            // "knight"
std::optional<PieceType> pieceFromLetter(char letter);
std::optional<PieceType> pieceFromWord(const std::string& word);

// pieceFromWord plus spoken aliases used in questions ("castle", plurals)
std::optional<PieceType> pieceFromSpoken(const std::string& word);

int pieceValue(PieceType piece);

} // namespace San
