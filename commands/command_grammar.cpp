#include "commands/command_grammar.hpp"
#include "phonetics/normalizer.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>

// ------------------------------------------------------------
// Slot conversion
// ------------------------------------------------------------
static std::string slotSquare(const std::map<std::string, std::string>& slots) {
    auto sq = slots.find("square");
    if (sq != slots.end() && Phonetics::isSquareToken(sq->second)) return sq->second;

    auto file = slots.find("file");
    auto rank = slots.find("rank");
    if (file != slots.end() && rank != slots.end() &&
        Phonetics::isFileToken(file->second) && Phonetics::isRankToken(rank->second)) {
        return file->second + rank->second;
    }
    return "";
}

static std::optional<San::PieceType> slotPiece(const std::map<std::string, std::string>& slots) {
    auto it = slots.find("piece");
    if (it == slots.end()) return std::nullopt;
    return San::pieceFromSpoken(it->second);
}

static std::string slotColor(const std::map<std::string, std::string>& slots) {
    auto it = slots.find("color");
    if (it == slots.end()) return "";
    if (it->second == "white" || it->second == "black") return it->second;
    return "";
}

static QueryCommand query(QueryKind kind) {
    QueryCommand q;
    q.kind = kind;
    return q;
}

static MetaCommand meta(MetaKind kind) {
    MetaCommand m;
    m.kind = kind;
    return m;
}

bool isKnownIntent(const std::string& intent) {
    static const std::vector<std::string> known = {
        "query.material", "query.piece_location", "query.square_contents",
        "query.legal_moves_for", "query.clock", "query.last_move", "query.evaluation",
        "meta.repeat", "meta.resign", "meta.peek", "meta.clear_board",
        "meta.switch_color", "meta.confirm_yes", "meta.confirm_no", "meta.submit",
        "meta.place_piece", "meta.remove_piece"
    };
    return std::find(known.begin(), known.end(), intent) != known.end();
}

std::optional<Command> commandFromIntent(const std::string& intent,
                                         const std::map<std::string, std::string>& slots) {
    if (intent == "query.material")   return query(QueryKind::MaterialBalance);
    if (intent == "query.clock")      return query(QueryKind::ClockRemaining);
    if (intent == "query.last_move")  return query(QueryKind::LastMove);
    if (intent == "query.evaluation") return query(QueryKind::Evaluation);

    if (intent == "query.square_contents") {
        std::string square = slotSquare(slots);
        if (square.empty()) return std::nullopt;
        QueryCommand q = query(QueryKind::SquareContents);
        q.square = square;
        return q;
    }

    if (intent == "query.piece_location" || intent == "query.legal_moves_for") {
        auto piece = slotPiece(slots);
        if (!piece) return std::nullopt;
        QueryCommand q = query(intent == "query.piece_location" ? QueryKind::PieceLocation
                                                                 : QueryKind::LegalMovesFor);
        q.piece = piece;
        return q;
    }

    if (intent == "meta.repeat")      return meta(MetaKind::Repeat);
    if (intent == "meta.resign")      return meta(MetaKind::Resign);
    if (intent == "meta.peek")        return meta(MetaKind::Peek);
    if (intent == "meta.clear_board") return meta(MetaKind::ClearBoard);
    if (intent == "meta.confirm_yes") return meta(MetaKind::ConfirmYes);
    if (intent == "meta.confirm_no")  return meta(MetaKind::ConfirmNo);
    if (intent == "meta.submit")      return meta(MetaKind::Submit);

    if (intent == "meta.switch_color") {
        std::string color = slotColor(slots);
        if (color.empty()) return std::nullopt;
        MetaCommand m = meta(MetaKind::SwitchColor);
        m.color = color;
        return m;
    }

    if (intent == "meta.remove_piece") {
        std::string square = slotSquare(slots);
        if (square.empty()) return std::nullopt;
        MetaCommand m = meta(MetaKind::RemovePiece);
        m.square = square;
        return m;
    }

    if (intent == "meta.place_piece") {
        std::string square = slotSquare(slots);
        auto piece = slotPiece(slots);
        if (square.empty() || !piece) return std::nullopt;
        MetaCommand m = meta(MetaKind::PlacePiece);
        m.square = square;
        m.piece = piece;
        m.color = slotColor(slots);
        return m;
    }

    return std::nullopt;
}

// ------------------------------------------------------------
// Matching
// ------------------------------------------------------------
std::optional<Command> CommandGrammar::match(const std::string& text,
                                             const std::string& context) const {
    for (const auto& rule : rules) {
        if (std::find(rule.contexts.begin(), rule.contexts.end(), context) == rule.contexts.end()) {
            continue;
        }

        std::smatch m;
        bool hit = rule.exact ? std::regex_match(text, m, rule.pattern)
                              : std::regex_search(text, m, rule.pattern);
        if (!hit) continue;

        std::map<std::string, std::string> slots;
        for (size_t i = 1; i < m.size() && i <= rule.slot_names.size(); i++) {
            if (m[i].matched) slots[rule.slot_names[i - 1]] = m[i].str();
        }

        if (auto cmd = commandFromIntent(rule.intent, slots)) {
            LOG_TRACE("Grammar", "Matched " + rule.intent + " on \"" + text + "\"");
            return cmd;
        }
        LOG_TRACE("Grammar", rule.intent + " matched but slots did not convert, trying next rule");
    }
    return std::nullopt;
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------
bool CommandGrammar::load_rules_from_json(const nlohmann::json& j, std::string* err) {
    if (!j.is_array()) {
        if (err) *err = "command rules must be a JSON array";
        return false;
    }

    std::vector<Rule> loaded;
    try {
        for (auto& r : j) {
            Rule rule;
            rule.intent = r.value("intent", "");
            rule.description = r.value("description", "");
            rule.pattern_str = r.value("pattern", "");
            rule.slot_names = r.value("slot_names", std::vector<std::string>{});
            rule.contexts = r.value("contexts", std::vector<std::string>{CONTEXT_GAME});
            rule.case_insensitive = r.value("case_insensitive", true);
            rule.exact = r.value("exact", false);

            if (!isKnownIntent(rule.intent)) {
                LOG_ERROR("Grammar", "Unknown intent '" + rule.intent + "', rule skipped");
                continue;
            }

            try {
                std::regex::flag_type flags = std::regex::ECMAScript;
                if (rule.case_insensitive) {
                    flags |= std::regex::icase;
                }
                rule.pattern = std::regex(rule.pattern_str, flags);
            } catch (const std::regex_error& e) {
                LOG_ERROR("Grammar", "Invalid regex for intent " + rule.intent + ": " + e.what());
                continue;
            }

            loaded.push_back(std::move(rule));
        }
    } catch (const nlohmann::json::exception& e) {
        if (err) *err = e.what();
        return false;
    }

    rules = std::move(loaded);
    LOG_DEBUG("Grammar", "Loaded " + std::to_string(rules.size()) + " command rules");
    return true;
}

bool CommandGrammar::load_rules_from_string(const std::string& rulesText, std::string* err) {
    nlohmann::json j = nlohmann::json::parse(rulesText, nullptr, false);
    if (j.is_discarded()) {
        if (err) *err = "command rules are not valid JSON";
        return false;
    }
    return load_rules_from_json(j, err);
}

bool CommandGrammar::load_rules(const std::string& path, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "Could not open file: " + path;
        return false;
    }
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded()) {
        if (err) *err = "Could not parse " + path;
        return false;
    }
    return load_rules_from_json(j, err);
}
