#include "commands/command.hpp"

std::string queryKindName(QueryKind kind) {
    switch (kind) {
        case QueryKind::MaterialBalance: return "material";
        case QueryKind::PieceLocation:   return "piece_location";
        case QueryKind::SquareContents:  return "square_contents";
        case QueryKind::LegalMovesFor:   return "legal_moves_for";
        case QueryKind::ClockRemaining:  return "clock";
        case QueryKind::LastMove:        return "last_move";
        case QueryKind::Evaluation:      return "evaluation";
    }
    return "unknown";
}

std::string metaKindName(MetaKind kind) {
    switch (kind) {
        case MetaKind::Repeat:      return "repeat";
        case MetaKind::Resign:      return "resign";
        case MetaKind::Peek:        return "peek";
        case MetaKind::ClearBoard:  return "clear_board";
        case MetaKind::SwitchColor: return "switch_color";
        case MetaKind::ConfirmYes:  return "confirm_yes";
        case MetaKind::ConfirmNo:   return "confirm_no";
        case MetaKind::Submit:      return "submit";
        case MetaKind::PlacePiece:  return "place_piece";
        case MetaKind::RemovePiece: return "remove_piece";
    }
    return "unknown";
}

static std::string joinMoves(const std::vector<std::string>& moves) {
    std::string out;
    for (size_t i = 0; i < moves.size(); ++i) {
        if (i) out += ",";
        out += moves[i];
    }
    return out;
}

// One-line summary for logs
std::string describeOutcome(const ResolutionOutcome& outcome) {
    if (const auto* r = std::get_if<Resolved>(&outcome)) {
        if (const auto* mv = std::get_if<MoveCommand>(&r->command)) {
            return "Resolved(Move " + joinMoves(mv->candidates) + ")";
        }
        if (const auto* q = std::get_if<QueryCommand>(&r->command)) {
            return "Resolved(Query " + queryKindName(q->kind) + ")";
        }
        const auto& m = std::get<MetaCommand>(r->command);
        return "Resolved(Meta " + metaKindName(m.kind) + ")";
    }
    if (const auto* a = std::get_if<Ambiguous>(&outcome)) {
        return "Ambiguous(" + San::pieceName(a->piece) + " -> " + a->square +
               " [" + joinMoves(a->candidates) + "])";
    }
    return "Unmatched";
}
