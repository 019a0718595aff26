#pragma once
#include <string>
#include <vector>
#include "phonetics/vocabulary.hpp"

namespace Phonetics {

using TokenSequence = std::vector<std::string>;

// Raw ASR transcript -> canonical tokens. Steps run in this order:
//   1. compound corrections   ("rookie" -> "rook e")
//   2. file letters           ("delta" -> "d")
//   3. context ranks          ("e for" -> "e 4")
//   4. rank words             ("three" -> "3")
//   5. piece names            ("night" -> "knight")
// Connector and filler words are kept; the resolver decides what to skip.
TokenSequence normalize(const std::string& raw, const Vocabulary& vocab);

// Lowercase, fold typographic apostrophes, map punctuation to spaces
std::string prepareTranscript(const std::string& raw);

std::string joinTokens(const TokenSequence& tokens, const std::string& sep = " ");
TokenSequence splitTokens(const std::string& text);

bool isFileToken(const std::string& token);
bool isRankToken(const std::string& token);
bool isSquareToken(const std::string& token);

} // namespace Phonetics
