#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "commands/san.hpp"

// ------------------------------------------------------------
// Commands produced by the resolver
// ------------------------------------------------------------
enum class QueryKind {
    MaterialBalance,
    PieceLocation,
    SquareContents,
    LegalMovesFor,
    ClockRemaining,
    LastMove,
    Evaluation
};

enum class MetaKind {
    Repeat,
    Resign,
    Peek,
    ClearBoard,
    SwitchColor,
    ConfirmYes,
    ConfirmNo,
    Submit,
    PlacePiece,
    RemovePiece
};

// Move candidates in legal-move order; a resolved move carries one
struct MoveCommand {
    std::vector<std::string> candidates;
};

struct QueryCommand {
    QueryKind kind = QueryKind::MaterialBalance;
    std::optional<San::PieceType> piece;   // PieceLocation, LegalMovesFor
    std::string square;                    // SquareContents
};

struct MetaCommand {
    MetaKind kind = MetaKind::Repeat;
    std::string color;                     // "white" / "black" when given
    std::optional<San::PieceType> piece;   // PlacePiece
    std::string square;                    // PlacePiece, RemovePiece
};

using Command = std::variant<MoveCommand, QueryCommand, MetaCommand>;

// ------------------------------------------------------------
// Resolution outcome: exactly one alternative per call
// ------------------------------------------------------------
struct Resolved {
    Command command;
};

struct Ambiguous {
    std::vector<std::string> candidates;   // legal-move order
    San::PieceType piece = San::PieceType::Pawn;
    std::string square;                    // shared destination
};

struct Unmatched {};

using ResolutionOutcome = std::variant<Resolved, Ambiguous, Unmatched>;

std::string queryKindName(QueryKind kind);
std::string metaKindName(MetaKind kind);
std::string describeOutcome(const ResolutionOutcome& outcome);
