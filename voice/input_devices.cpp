#include "voice/input_devices.hpp"
#include "logger.hpp"

#include <portaudio.h>

std::vector<InputDevice> listInputDevices() {
    std::vector<InputDevice> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("VoiceCapture", std::string("PortAudio error: ") + Pa_GetErrorText(err));
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    if (numDevices < 0) {
        LOG_ERROR("VoiceCapture", "Pa_GetDeviceCount returned " + std::to_string(numDevices));
        Pa_Terminate();
        return devices;
    }

    int defaultInput = Pa_GetDefaultInputDevice();
    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0) continue;

        const PaHostApiInfo* hostApiInfo = Pa_GetHostApiInfo(info->hostApi);

        InputDevice d;
        d.index = i;
        d.name = info->name;
        d.hostApi = hostApiInfo ? hostApiInfo->name : "unknown";
        d.maxInputChannels = info->maxInputChannels;
        d.defaultSampleRate = info->defaultSampleRate;
        d.isDefault = (i == defaultInput);
        devices.push_back(std::move(d));
    }

    Pa_Terminate();
    LOG_DEBUG("VoiceCapture", "Found " + std::to_string(devices.size()) + " input devices");
    return devices;
}
