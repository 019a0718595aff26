#pragma once
#include "screens/chess_position.hpp"
#include "screens/voice_screen.hpp"

// ------------------------------------------------------------
// GameScreen: live game on lane "game" (protected).
// Plays moves for the side to move, answers board questions and
// asks for a yes/no before resigning.
// ------------------------------------------------------------
class GameScreen : public VoiceScreen {
public:
    GameScreen(VoiceServices services, ChessPosition& position);
    ~GameScreen() override;

    int peekCount() const;
    bool hasResigned() const;
    bool inConfirmMode() const;

protected:
    std::string context() const override;
    std::vector<std::string> legalMoves() const override;

    void onMove(const std::string& san) override;
    void onQuery(const QueryCommand& query) override;
    void onMeta(const MetaCommand& meta) override;

private:
    std::string describeSquare(const std::string& square) const;
    std::string describePieces(San::PieceType piece) const;
    std::string describeMaterial() const;
    std::string describeLegalMoves(San::PieceType piece) const;

    ChessPosition& position;
    bool confirmingResign = false;
    bool resigned = false;
    int peeks = 0;
};
