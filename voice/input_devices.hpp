#pragma once
#include <string>
#include <vector>

struct InputDevice {
    int index = -1;                  // PortAudio device index (asr.input_device_index)
    std::string name;
    std::string hostApi;
    int maxInputChannels = 0;
    double defaultSampleRate = 0.0;
    bool isDefault = false;
};

// Capture-capable devices; empty when PortAudio cannot start
std::vector<InputDevice> listInputDevices();
