#pragma once
#include <string>

// Lowercase, trim, drop trailing punctuation and non-speech tags
// ("[BLANK_AUDIO]", "(music)", "*coughs*")
std::string sanitizeTranscript(const std::string& input);

// Fewer than MIN_TRANSCRIPT_CHARS non-space characters
bool isTranscriptTooShort(const std::string& transcript);
