#include "phonetics/normalizer.hpp"
#include "logger.hpp"

#include <cctype>
#include <sstream>

namespace Phonetics {

// ---------------- Token helpers ----------------
bool isFileToken(const std::string& token) {
    return token.size() == 1 && token[0] >= 'a' && token[0] <= 'h';
}

bool isRankToken(const std::string& token) {
    return token.size() == 1 && token[0] >= '1' && token[0] <= '8';
}

bool isSquareToken(const std::string& token) {
    return token.size() == 2 &&
           token[0] >= 'a' && token[0] <= 'h' &&
           token[1] >= '1' && token[1] <= '8';
}

std::string joinTokens(const TokenSequence& tokens, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i) out += sep;
        out += tokens[i];
    }
    return out;
}

TokenSequence splitTokens(const std::string& text) {
    TokenSequence out;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) out.push_back(word);
    return out;
}

std::string prepareTranscript(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());

    for (size_t i = 0; i < raw.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(raw[i]);

        // U+2019 RIGHT SINGLE QUOTATION MARK
        if (c == 0xE2 && i + 2 < raw.size() &&
            static_cast<unsigned char>(raw[i + 1]) == 0x80 &&
            static_cast<unsigned char>(raw[i + 2]) == 0x99) {
            out += '\'';
            i += 2;
            continue;
        }

        char lc = static_cast<char>(std::tolower(c));
        if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9') || lc == '\'') {
            out += lc;
        } else {
            out += ' ';
        }
    }
    return joinTokens(splitTokens(out));
}

// ---------------- Pipeline ----------------
TokenSequence normalize(const std::string& raw, const Vocabulary& vocab) {
    std::string text = prepareTranscript(raw);
    if (text.empty()) return {};

    // 1. compound corrections
    for (const auto& rule : vocab.compounds()) {
        text = std::regex_replace(text, rule.pattern, rule.replacement);
    }
    text = joinTokens(splitTokens(text));

    // 2. file letters
    text = vocab.files().substitute(text);

    // 3. context ranks ("for" is only a 4 right after a file letter)
    TokenSequence tokens = splitTokens(text);
    for (size_t i = 1; i < tokens.size(); ++i) {
        if (!isFileToken(tokens[i - 1])) continue;
        if (auto digit = vocab.contextRank(tokens[i])) {
            tokens[i] = *digit;
        }
    }
    text = joinTokens(tokens);

    // 4. rank words
    text = vocab.ranks().substitute(text);

    // 5. piece names
    text = vocab.pieces().substitute(text);

    tokens = splitTokens(text);
    LOG_TRACE("Normalizer", "\"" + raw + "\" -> \"" + joinTokens(tokens) + "\"");
    return tokens;
}

} // namespace Phonetics
