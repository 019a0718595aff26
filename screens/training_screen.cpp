#include "screens/training_screen.hpp"
#include "commands/command_grammar.hpp"
#include "response_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

std::vector<TrainingDrill> drillsFromJson(const nlohmann::json& j) {
    std::vector<TrainingDrill> out;
    if (!j.is_object() || !j.contains("drills") || !j["drills"].is_array()) return out;

    for (const auto& d : j["drills"]) {
        if (!d.is_object()) continue;
        TrainingDrill drill;
        drill.target = d.value("target", std::string());
        drill.legal = d.value("legal", std::vector<std::string>{});
        if (drill.target.empty()) {
            LOG_WARN("Training", "Drill without target skipped");
            continue;
        }
        if (std::find(drill.legal.begin(), drill.legal.end(), drill.target) == drill.legal.end()) {
            drill.legal.push_back(drill.target);
        }
        out.push_back(std::move(drill));
    }
    return out;
}

TrainingScreen::TrainingScreen(VoiceServices services, const std::string& mode,
                               std::vector<TrainingDrill> drills)
    : VoiceScreen(services, "training-" + mode, false, false),
      drills(std::move(drills)) {}

TrainingScreen::~TrainingScreen() {
    unmount();
}

int TrainingScreen::correctCount() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return correct;
}

size_t TrainingScreen::currentDrill() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return index;
}

bool TrainingScreen::isFinished() const {
    std::lock_guard<std::mutex> lock(screenMutex);
    return index >= drills.size();
}

std::string TrainingScreen::context() const {
    return CONTEXT_TRAINING;
}

std::vector<std::string> TrainingScreen::legalMoves() const {
    if (index >= drills.size()) return {};
    return drills[index].legal;
}

std::string TrainingScreen::prompt() const {
    if (index >= drills.size()) {
        return ResponseManager::format("drill_done", {
            {"correct", std::to_string(correct)},
            {"total", std::to_string(drills.size())}
        });
    }
    return ResponseManager::format("drill_prompt",
                                   {{"move", ResponseManager::moveToSpeech(drills[index].target)}});
}

void TrainingScreen::onMounted() {
    std::lock_guard<std::mutex> lock(screenMutex);
    announce(prompt());
}

void TrainingScreen::onMove(const std::string& san) {
    if (index >= drills.size()) return;

    const std::string& target = drills[index].target;
    std::string feedback;
    if (san == target) {
        ++correct;
        feedback = ResponseManager::get("drill_correct");
    } else {
        feedback = ResponseManager::format("drill_wrong", {{"move", ResponseManager::moveToSpeech(target)}});
    }
    LOG_DEBUG("Training", laneId() + ": drill " + std::to_string(index) + " said " + san +
                          ", wanted " + target);

    ++index;
    announce(feedback + " " + prompt());
}

void TrainingScreen::onMeta(const MetaCommand& meta) {
    if (meta.kind == MetaKind::Repeat) {
        announce(prompt());
        return;
    }
    VoiceScreen::onMeta(meta);
}
