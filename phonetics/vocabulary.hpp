#pragma once
#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace Phonetics {

// ------------------------------------------------------------
// WordTable: spoken variant -> canonical token, whole words only.
// The matcher alternation is ordered longest variant first so a
// multi-word or longer variant wins over any prefix of it.
// ------------------------------------------------------------
struct WordTable {
    std::unordered_map<std::string, std::string> lookup;
    std::regex matcher;
    bool empty = true;

    // Replace every whole-word variant occurrence in text
    std::string substitute(const std::string& text) const;

    // Canonical form of a single token, if it is a known variant
    std::optional<std::string> find(const std::string& word) const;
};

// Whole-phrase regex correction applied before word tables
struct CompoundRule {
    std::string pattern_str;
    std::regex pattern;
    std::string replacement;
};

// ------------------------------------------------------------
// Vocabulary: phonetic tables, loaded once then read-only
// ------------------------------------------------------------
class Vocabulary {
public:
    bool load(const nlohmann::json& j, std::string* err = nullptr);
    bool load_file(const std::string& path, std::string* err = nullptr);

    const std::vector<CompoundRule>& compounds() const { return compoundRules; }
    const WordTable& files() const { return fileTable; }
    const WordTable& ranks() const { return rankTable; }
    const WordTable& pieces() const { return pieceTable; }

    // Rank digit for a word that only means a rank after a file letter
    std::optional<std::string> contextRank(const std::string& word) const;

    bool isConnector(const std::string& word) const;
    bool isFiller(const std::string& word) const;

    // Follow-up-only alias ("the" -> "d", "fife" -> "5")
    std::optional<std::string> disambiguationAlias(const std::string& word) const;

    size_t entry_count() const;

private:
    std::vector<CompoundRule> compoundRules;
    WordTable fileTable;
    WordTable rankTable;
    WordTable pieceTable;
    std::unordered_map<std::string, std::string> contextRanks;
    std::unordered_map<std::string, std::string> disambiguationAliases;
    std::unordered_set<std::string> connectors;
    std::unordered_set<std::string> fillers;
};

} // namespace Phonetics
