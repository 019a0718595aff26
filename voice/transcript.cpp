#include "voice/transcript.hpp"
#include "voice_constants.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

// ---------------- Transcript Sanitizer ----------------
std::string sanitizeTranscript(const std::string& input) {
    static const std::regex markers(R"(\[[^\]]*\]|\([^)]*\)|\*[^*]*\*)");
    std::string out = std::regex_replace(input, markers, " ");

    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });

    while (!out.empty() && (std::ispunct(static_cast<unsigned char>(out.back())) ||
                            std::isspace(static_cast<unsigned char>(out.back())))) {
        out.pop_back();
    }
    while (!out.empty() && std::isspace(static_cast<unsigned char>(out.front()))) {
        out.erase(out.begin());
    }
    return out;
}

bool isTranscriptTooShort(const std::string& transcript) {
    auto chars = std::count_if(transcript.begin(), transcript.end(),
                               [](unsigned char c){ return !std::isspace(c); });
    return static_cast<std::size_t>(chars) < MIN_TRANSCRIPT_CHARS;
}
