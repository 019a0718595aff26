#include "commands/san.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace San {

std::optional<MoveInfo> parse(const std::string& san) {
    std::string s = san;
    MoveInfo info;

    while (!s.empty() && (s.back() == '+' || s.back() == '#' ||
                          s.back() == '!' || s.back() == '?')) {
        if (s.back() == '+') info.check = true;
        if (s.back() == '#') info.mate = true;
        s.pop_back();
    }

    if (s == "O-O" || s == "0-0") {
        info.piece = PieceType::King;
        info.castleShort = true;
        return info;
    }
    if (s == "O-O-O" || s == "0-0-0") {
        info.piece = PieceType::King;
        info.castleLong = true;
        return info;
    }

    static const std::regex sanRe(R"(^([KQRBN])?([a-h])?([1-8])?(x)?([a-h][1-8])(?:=?([QRBN]))?$)");
    std::smatch m;
    if (!std::regex_match(s, m, sanRe)) return std::nullopt;

    if (m[1].matched) {
        auto piece = pieceFromLetter(m[1].str()[0]);
        if (!piece) return std::nullopt;
        info.piece = *piece;
    }
    if (m[2].matched) info.originFile = m[2].str()[0];
    if (m[3].matched) info.originRank = m[3].str()[0];
    info.capture = m[4].matched;
    info.destination = m[5].str();
    if (m[6].matched) info.promotion = pieceFromLetter(m[6].str()[0]);

    return info;
}

std::string canonical(const std::string& san) {
    std::string out;
    out.reserve(san.size());
    for (char c : san) {
        if (c == 'x' || c == '+' || c == '#' || c == '!' || c == '?' || c == '=') continue;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string pieceName(PieceType piece) {
    switch (piece) {
        case PieceType::Pawn:   return "Pawn";
        case PieceType::Knight: return "Knight";
        case PieceType::Bishop: return "Bishop";
        case PieceType::Rook:   return "Rook";
        case PieceType::Queen:  return "Queen";
        case PieceType::King:   return "King";
    }
    return "Piece";
}

std::string pieceWord(PieceType piece) {
    std::string name = pieceName(piece);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

std::optional<PieceType> pieceFromLetter(char letter) {
    switch (std::toupper(static_cast<unsigned char>(letter))) {
        case 'P': return PieceType::Pawn;
        case 'N': return PieceType::Knight;
        case 'B': return PieceType::Bishop;
        case 'R': return PieceType::Rook;
        case 'Q': return PieceType::Queen;
        case 'K': return PieceType::King;
        default:  return std::nullopt;
    }
}

std::optional<PieceType> pieceFromWord(const std::string& word) {
    if (word == "pawn")   return PieceType::Pawn;
    if (word == "knight") return PieceType::Knight;
    if (word == "bishop") return PieceType::Bishop;
    if (word == "rook")   return PieceType::Rook;
    if (word == "queen")  return PieceType::Queen;
    if (word == "king")   return PieceType::King;
    return std::nullopt;
}

std::optional<PieceType> pieceFromSpoken(const std::string& word) {
    if (auto p = pieceFromWord(word)) return p;
    if (word == "castle" || word == "castles") return PieceType::Rook;
    if (word.size() > 1 && word.back() == 's') {
        return pieceFromWord(word.substr(0, word.size() - 1));
    }
    return std::nullopt;
}

int pieceValue(PieceType piece) {
    switch (piece) {
        case PieceType::Pawn:   return 1;
        case PieceType::Knight: return 3;
        case PieceType::Bishop: return 3;
        case PieceType::Rook:   return 5;
        case PieceType::Queen:  return 9;
        case PieceType::King:   return 0;
    }
    return 0;
}

} // namespace San
