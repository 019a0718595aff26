#include "screens/reconstruction_screen.hpp"
#include "commands/command_grammar.hpp"
#include "response_manager.hpp"
#include "logger.hpp"

#include <cctype>

static std::string titleCase(const std::string& s) {
    std::string out = s;
    if (!out.empty()) out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
    return out;
}

ReconstructionScreen::ReconstructionScreen(VoiceServices services, BoardMap target)
    : VoiceScreen(services, "reconstruction", true, true),
      target(std::move(target)) {}

ReconstructionScreen::~ReconstructionScreen() {
    unmount();
}

BoardMap ReconstructionScreen::placed() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return board;
}

Color ReconstructionScreen::placementColor() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return stickyColor;
}

std::optional<ReconstructionScore> ReconstructionScreen::lastScore() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return submitted;
}

std::string ReconstructionScreen::context() const {
    return CONTEXT_RECONSTRUCTION;
}

ReconstructionScore ReconstructionScreen::score(const BoardMap& target, const BoardMap& placed) {
    ReconstructionScore s;
    s.total = static_cast<int>(target.size());
    for (const auto& [square, piece] : placed) {
        auto it = target.find(square);
        if (it == target.end()) {
            ++s.extra;
        } else if (it->second == piece) {
            ++s.correct;
        }
    }
    return s;
}

// No moves on this screen; the resolver never produces one
void ReconstructionScreen::onMove(const std::string& san) {
    LOG_DEBUG("Reconstruction", "Ignoring move " + san);
}

void ReconstructionScreen::onMeta(const MetaCommand& meta) {
    switch (meta.kind) {
        case MetaKind::PlacePiece: {
            if (auto c = colorFromString(meta.color)) stickyColor = *c;
            PieceOnSquare piece{ stickyColor, meta.piece.value_or(San::PieceType::Pawn) };
            board[meta.square] = piece;
            announce(ResponseManager::format("placed", {
                {"color", titleCase(colorName(piece.color))},
                {"piece", San::pieceName(piece.piece)},
                {"square", meta.square}
            }));
            return;
        }

        case MetaKind::RemovePiece:
            if (board.erase(meta.square) == 0) {
                announce(ResponseManager::format("remove_empty", {{"square", titleCase(meta.square)}}));
            } else {
                announce(ResponseManager::format("removed", {{"square", titleCase(meta.square)}}));
            }
            return;

        case MetaKind::ClearBoard:
            board.clear();
            announce(ResponseManager::get("board_cleared"));
            return;

        case MetaKind::SwitchColor: {
            auto c = colorFromString(meta.color);
            stickyColor = c ? *c : opposite(stickyColor);
            announce(ResponseManager::format("color_set", {{"color", colorName(stickyColor)}}));
            return;
        }

        case MetaKind::Submit: {
            ReconstructionScore s = score(target, board);
            submitted = s;
            LOG_DEBUG("Reconstruction", "Submitted: " + std::to_string(s.correct) + "/" +
                                        std::to_string(s.total) + ", extra " + std::to_string(s.extra));
            if (s.correct == s.total && s.extra == 0) {
                announce(ResponseManager::get("reconstruction_perfect"));
            } else {
                announce(ResponseManager::format("reconstruction_score", {
                    {"correct", std::to_string(s.correct)},
                    {"total", std::to_string(s.total)}
                }));
            }
            return;
        }

        default:
            VoiceScreen::onMeta(meta);
    }
}

void ReconstructionScreen::beforeRelease() {
    if (services.session.currentLane() == laneId()) {
        services.session.clearProtectedLane();
    }
}
