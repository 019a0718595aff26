#pragma once
#include <nlohmann/json_fwd.hpp>
#include "screens/voice_screen.hpp"

// One drill step: the move to say and the moves legal at that point
struct TrainingDrill {
    std::string target;
    std::vector<std::string> legal;
};

// "drills": [ {"target": "Nf3", "legal": ["Nf3", "Nc3", ...]}, ... ]
std::vector<TrainingDrill> drillsFromJson(const nlohmann::json& j);

// ------------------------------------------------------------
// TrainingScreen: lane "training-<mode>" (unprotected). Speaks a
// target move, checks what the player says against it, moves on.
// ------------------------------------------------------------
class TrainingScreen : public VoiceScreen {
public:
    TrainingScreen(VoiceServices services, const std::string& mode, std::vector<TrainingDrill> drills);
    ~TrainingScreen() override;

    int correctCount() const;
    size_t currentDrill() const;
    bool isFinished() const;

protected:
    std::string context() const override;
    std::vector<std::string> legalMoves() const override;

    void onMove(const std::string& san) override;
    void onMeta(const MetaCommand& meta) override;
    void onMounted() override;

private:
    std::string prompt() const;

    std::vector<TrainingDrill> drills;
    size_t index = 0;
    int correct = 0;
};
