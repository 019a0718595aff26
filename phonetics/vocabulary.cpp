#include "phonetics/vocabulary.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace Phonetics {

// ---------------- Helpers ----------------
static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string collapseSpaces(const std::string& s) {
    std::istringstream iss(s);
    std::string word, out;
    while (iss >> word) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

static std::string escapeRegex(const std::string& word) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : word) {
        if (c == ' ') {
            out += "\\s+";
            continue;
        }
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

// { "canonical": ["variant", ...] } -> WordTable
static WordTable buildTable(const nlohmann::json& partition) {
    WordTable table;
    if (!partition.is_object()) return table;

    for (auto& [canonical, variants] : partition.items()) {
        for (const auto& v : variants) {
            std::string variant = collapseSpaces(toLower(v.get<std::string>()));
            if (variant.empty() || variant == canonical) continue;
            table.lookup[variant] = toLower(canonical);
        }
    }

    if (table.lookup.empty()) return table;

    std::vector<std::string> keys;
    keys.reserve(table.lookup.size());
    for (auto& [variant, _] : table.lookup) keys.push_back(variant);

    std::sort(keys.begin(), keys.end(), [](const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return a.size() > b.size();
        return a < b;
    });

    std::string pattern = "\\b(?:";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i) pattern += '|';
        pattern += escapeRegex(keys[i]);
    }
    pattern += ")\\b";

    table.matcher = std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    table.empty = false;
    return table;
}

// { "canonical": ["alias", ...] } -> alias -> canonical
static std::unordered_map<std::string, std::string> buildAliasMap(const nlohmann::json& partition) {
    std::unordered_map<std::string, std::string> out;
    if (!partition.is_object()) return out;
    for (auto& [canonical, aliases] : partition.items()) {
        for (const auto& a : aliases) {
            out[toLower(a.get<std::string>())] = toLower(canonical);
        }
    }
    return out;
}

static std::unordered_set<std::string> buildWordSet(const nlohmann::json& list) {
    std::unordered_set<std::string> out;
    if (!list.is_array()) return out;
    for (const auto& w : list) out.insert(toLower(w.get<std::string>()));
    return out;
}

// ---------------- WordTable ----------------
std::string WordTable::substitute(const std::string& text) const {
    if (empty || text.empty()) return text;

    std::string out;
    auto begin = std::sregex_iterator(text.begin(), text.end(), matcher);
    auto end   = std::sregex_iterator();
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const std::smatch& m = *it;
        out.append(text, last, static_cast<size_t>(m.position(0)) - last);

        auto found = lookup.find(collapseSpaces(m.str(0)));
        out += (found != lookup.end()) ? found->second : m.str(0);
        last = static_cast<size_t>(m.position(0) + m.length(0));
    }
    out.append(text, last, std::string::npos);
    return out;
}

std::optional<std::string> WordTable::find(const std::string& word) const {
    auto it = lookup.find(word);
    if (it == lookup.end()) return std::nullopt;
    return it->second;
}

// ---------------- Vocabulary ----------------
bool Vocabulary::load(const nlohmann::json& j, std::string* err) {
    if (!j.is_object()) {
        if (err) *err = "vocabulary root must be an object";
        return false;
    }

    // Build everything first so a bad table leaves the old state intact
    std::vector<CompoundRule> compounds;
    WordTable files, ranks, pieces;
    std::unordered_map<std::string, std::string> ctxRanks, aliases;
    std::unordered_set<std::string> conn, fill;

    try {
        for (const auto& r : j.value("compounds", nlohmann::json::array())) {
            CompoundRule rule;
            rule.pattern_str = r.value("pattern", "");
            rule.replacement = r.value("replace", "");
            if (rule.pattern_str.empty()) continue;
            rule.pattern = std::regex(rule.pattern_str, std::regex::ECMAScript | std::regex::icase);
            compounds.push_back(std::move(rule));
        }

        files   = buildTable(j.value("files", nlohmann::json::object()));
        ranks   = buildTable(j.value("ranks", nlohmann::json::object()));
        pieces  = buildTable(j.value("pieces", nlohmann::json::object()));
        ctxRanks = buildAliasMap(j.value("context_ranks", nlohmann::json::object()));
        aliases  = buildAliasMap(j.value("disambiguation", nlohmann::json::object()));
        conn = buildWordSet(j.value("connectors", nlohmann::json::array()));
        fill = buildWordSet(j.value("fillers", nlohmann::json::array()));
    } catch (const std::regex_error& e) {
        if (err) *err = std::string("invalid vocabulary pattern: ") + e.what();
        return false;
    } catch (const nlohmann::json::exception& e) {
        if (err) *err = std::string("malformed vocabulary: ") + e.what();
        return false;
    }

    compoundRules = std::move(compounds);
    fileTable = std::move(files);
    rankTable = std::move(ranks);
    pieceTable = std::move(pieces);
    contextRanks = std::move(ctxRanks);
    disambiguationAliases = std::move(aliases);
    connectors = std::move(conn);
    fillers = std::move(fill);

    LOG_DEBUG("Vocabulary", "Loaded " + std::to_string(entry_count()) + " entries (" +
                            std::to_string(compoundRules.size()) + " compounds)");
    return true;
}

bool Vocabulary::load_file(const std::string& path, std::string* err) {
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
    return load(j, err);
}

std::optional<std::string> Vocabulary::contextRank(const std::string& word) const {
    auto it = contextRanks.find(word);
    if (it == contextRanks.end()) return std::nullopt;
    return it->second;
}

bool Vocabulary::isConnector(const std::string& word) const {
    return connectors.count(word) > 0;
}

bool Vocabulary::isFiller(const std::string& word) const {
    return fillers.count(word) > 0;
}

std::optional<std::string> Vocabulary::disambiguationAlias(const std::string& word) const {
    auto it = disambiguationAliases.find(word);
    if (it == disambiguationAliases.end()) return std::nullopt;
    return it->second;
}

size_t Vocabulary::entry_count() const {
    return compoundRules.size() + fileTable.lookup.size() + rankTable.lookup.size() +
           pieceTable.lookup.size() + contextRanks.size() + disambiguationAliases.size() +
           connectors.size() + fillers.size();
}

} // namespace Phonetics
