#pragma once
#include <string>
#include <vector>

// Mono float PCM [-1, 1] -> 16-bit PCM RIFF/WAVE bytes
std::string encodeWav(const std::vector<float>& pcm, int sampleRate);
