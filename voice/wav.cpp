#include "voice/wav.hpp"

#include <algorithm>
#include <cstdint>

static void putU32(std::string& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

static void putU16(std::string& out, std::uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

std::string encodeWav(const std::vector<float>& pcm, int sampleRate) {
    const std::uint16_t channels = 1;
    const std::uint16_t bitsPerSample = 16;
    const std::uint32_t dataBytes = static_cast<std::uint32_t>(pcm.size() * sizeof(std::int16_t));
    const std::uint32_t byteRate = static_cast<std::uint32_t>(sampleRate) * channels * bitsPerSample / 8;

    std::string out;
    out.reserve(44 + dataBytes);

    out += "RIFF";
    putU32(out, 36 + dataBytes);
    out += "WAVE";

    out += "fmt ";
    putU32(out, 16);                       // PCM header size
    putU16(out, 1);                        // format: PCM
    putU16(out, channels);
    putU32(out, static_cast<std::uint32_t>(sampleRate));
    putU32(out, byteRate);
    putU16(out, channels * bitsPerSample / 8);
    putU16(out, bitsPerSample);

    out += "data";
    putU32(out, dataBytes);
    for (float s : pcm) {
        float clamped = std::clamp(s, -1.0f, 1.0f);
        auto v = static_cast<std::int16_t>(clamped * 32767.0f);
        putU16(out, static_cast<std::uint16_t>(v));
    }
    return out;
}
