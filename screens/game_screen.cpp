#include "screens/game_screen.hpp"
#include "commands/command_grammar.hpp"
#include "response_manager.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

static std::string capitalize(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

GameScreen::GameScreen(VoiceServices services, ChessPosition& position)
    : VoiceScreen(services, "game", true, false),
      position(position) {}

GameScreen::~GameScreen() {
    unmount();
}

int GameScreen::peekCount() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return peeks;
}

bool GameScreen::hasResigned() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return resigned;
}

bool GameScreen::inConfirmMode() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return confirmingResign;
}

std::string GameScreen::context() const {
    return confirmingResign ? CONTEXT_GAME_CONFIRM : CONTEXT_GAME;
}

std::vector<std::string> GameScreen::legalMoves() const {
    if (confirmingResign || resigned) return {};
    return position.legalMoves();
}

// ============================================================
// Moves
// ============================================================
void GameScreen::onMove(const std::string& san) {
    if (!position.applyMove(san)) {
        announce(ErrorManager::report("ERR_VOICE_MOVE_REJECTED", san));
        return;
    }
    LOG_DEBUG("Game", "Played " + san);
    announce(ResponseManager::moveToSpeech(san));
}

// ============================================================
// Queries
// ============================================================
std::string GameScreen::describeSquare(const std::string& square) const {
    auto piece = position.pieceAt(square);
    if (!piece) {
        return ResponseManager::format("square_empty", {{"square", capitalize(square)}});
    }
    return ResponseManager::format("square_piece", {
        {"color", capitalize(colorName(piece->color))},
        {"piece", San::pieceName(piece->piece)},
        {"square", square}
    });
}

std::string GameScreen::describePieces(San::PieceType piece) const {
    Color side = position.sideToMove();
    std::vector<std::string> squares;
    for (const auto& [square, p] : position.board()) {
        if (p.color == side && p.piece == piece) squares.push_back(square);
    }

    std::string plural = San::pieceWord(piece) + "s";
    if (squares.empty()) {
        return ResponseManager::format("piece_none", {{"pieces", plural}});
    }
    return ResponseManager::format("piece_location", {
        {"pieces", squares.size() == 1 ? San::pieceWord(piece) : plural},
        {"squares", ResponseManager::joinSpoken(squares)}
    });
}

std::string GameScreen::describeMaterial() const {
    int white = 0, black = 0;
    for (const auto& [square, p] : position.board()) {
        (p.color == Color::White ? white : black) += San::pieceValue(p.piece);
    }
    if (white == black) return ResponseManager::get("material_equal");

    int diff = std::abs(white - black);
    return ResponseManager::format("material_up", {
        {"color", white > black ? "White" : "Black"},
        {"amount", std::to_string(diff) + (diff == 1 ? " point" : " points")}
    });
}

std::string GameScreen::describeLegalMoves(San::PieceType piece) const {
    std::vector<std::string> targets;
    for (const auto& san : position.legalMoves()) {
        auto info = San::parse(san);
        if (!info || info->piece != piece) continue;

        std::string target = info->castleShort ? "castle kingside"
                           : info->castleLong  ? "castle queenside"
                           : info->destination;
        if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
            targets.push_back(target);
        }
    }

    if (targets.empty()) {
        return ResponseManager::format("legal_moves_none", {{"piece", San::pieceWord(piece)}});
    }
    return ResponseManager::format("legal_moves", {
        {"piece", San::pieceWord(piece)},
        {"moves", ResponseManager::joinSpoken(targets)}
    });
}

void GameScreen::onQuery(const QueryCommand& query) {
    switch (query.kind) {
        case QueryKind::SquareContents:
            announce(describeSquare(query.square));
            return;

        case QueryKind::PieceLocation:
            announce(describePieces(query.piece.value_or(San::PieceType::Pawn)));
            return;

        case QueryKind::MaterialBalance:
            announce(describeMaterial());
            return;

        case QueryKind::LegalMovesFor:
            announce(describeLegalMoves(query.piece.value_or(San::PieceType::Pawn)));
            return;

        case QueryKind::ClockRemaining: {
            auto seconds = position.clockSeconds(position.sideToMove());
            announce(seconds ? ResponseManager::format("clock", {{"time", ResponseManager::formatClock(*seconds)}})
                             : ResponseManager::get("clock_unknown"));
            return;
        }

        case QueryKind::LastMove: {
            auto last = position.lastMove();
            announce(last ? ResponseManager::format("last_move", {{"move", ResponseManager::moveToSpeech(*last)}})
                          : ResponseManager::get("last_move_none"));
            return;
        }

        case QueryKind::Evaluation: {
            auto eval = position.evaluation();
            if (!eval) {
                announce(ResponseManager::get("eval_unknown"));
                return;
            }
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%+.1f", *eval);
            announce(ResponseManager::format("eval", {{"score", buf}}));
            return;
        }
    }
}

// ============================================================
// Meta actions
// ============================================================
void GameScreen::onMeta(const MetaCommand& meta) {
    switch (meta.kind) {
        case MetaKind::Resign:
            if (resigned) {
                announce(ResponseManager::get("game_over"));
                return;
            }
            confirmingResign = true;
            announce(ResponseManager::get("resign_confirm"));
            return;

        case MetaKind::ConfirmYes:
            confirmingResign = false;
            resigned = true;
            LOG_DEBUG("Game", "Player resigned");
            announce(ResponseManager::get("resigned"));
            return;

        case MetaKind::ConfirmNo:
            confirmingResign = false;
            announce(ResponseManager::get("resign_kept"));
            return;

        case MetaKind::Peek:
            ++peeks;
            LOG_DEBUG("Game", "Peek #" + std::to_string(peeks));
            announce(ResponseManager::get("peek"));
            return;

        default:
            VoiceScreen::onMeta(meta);
    }
}
