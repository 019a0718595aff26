#pragma once
#include "screens/chess_position.hpp"
#include "screens/voice_screen.hpp"

struct ReconstructionScore {
    int correct = 0;          // target squares placed with the right piece
    int total = 0;            // pieces in the target position
    int extra = 0;            // placed pieces on squares that should be empty
};

// ------------------------------------------------------------
// ReconstructionScreen: after a blindfold game the player rebuilds
// the final position square by square. Takes the session over from
// the game lane and keeps it protected until it unmounts.
// ------------------------------------------------------------
class ReconstructionScreen : public VoiceScreen {
public:
    ReconstructionScreen(VoiceServices services, BoardMap target);
    ~ReconstructionScreen() override;

    BoardMap placed() const;
    Color placementColor() const;
    std::optional<ReconstructionScore> lastScore() const;

    static ReconstructionScore score(const BoardMap& target, const BoardMap& placed);

protected:
    std::string context() const override;
    std::vector<std::string> legalMoves() const override { return {}; }

    void onMove(const std::string& san) override;
    void onMeta(const MetaCommand& meta) override;
    void beforeRelease() override;

private:
    BoardMap target;
    BoardMap board;
    Color stickyColor = Color::White;
    std::optional<ReconstructionScore> submitted;
};
