#include "voice/audio_capture.hpp"
#include "logger.hpp"

#include <portaudio.h>
#include <exception>

// Samples pulled from the callback buffer per segmenter step (~100ms at 16kHz)
constexpr size_t CHUNK_SAMPLES = 1600;
constexpr unsigned long FRAMES_PER_BUFFER = 512;

// ============================================================
// PortAudio Callback
// ============================================================
static int recordCallback(const void* input,
                          void* /*output*/,
                          unsigned long frameCount,
                          const PaStreamCallbackTimeInfo*,
                          PaStreamCallbackFlags,
                          void* userData) {
    auto* data = reinterpret_cast<AudioCapture::AudioData*>(userData);
    const float* in = reinterpret_cast<const float*>(input);
    if (in) {
        std::lock_guard<std::mutex> lock(data->mtx);
        data->buffer.insert(data->buffer.end(), in, in + frameCount);
    }
    return paContinue;
}

AudioCapture::AudioCapture(const CaptureSettings& settings)
    : settings(settings) {}

AudioCapture::~AudioCapture() {
    close();
}

// ============================================================
// Open / Close
// ============================================================
AsrStartResult AudioCapture::open(SegmentHandler segmentHandler) {
    if (running) return AsrStartResult::started();

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        LOG_ERROR("VoiceCapture", std::string("PortAudio init failed: ") + Pa_GetErrorText(err));
        return AsrStartResult::failed("audio system unavailable");
    }
    paInitialized = true;

    int deviceIndex = (settings.inputDeviceIndex >= 0) ? settings.inputDeviceIndex
                                                       : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        LOG_ERROR("VoiceCapture", "No valid input device (index " + std::to_string(deviceIndex) + ")");
        releaseStream();
        return AsrStartResult::failed("no input device");
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);
    if (!devInfo) {
        releaseStream();
        return AsrStartResult::failed("no input device");
    }
    LOG_DEBUG("VoiceCapture", "Using input device: " + std::string(devInfo->name));

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    {
        std::lock_guard<std::mutex> lock(audio.mtx);
        audio.buffer.clear();
    }

    err = Pa_OpenStream(&stream, &inputParams, nullptr,
                        settings.sampleRate, FRAMES_PER_BUFFER,
                        paNoFlag, recordCallback, &audio);
    if (err != paNoError || !stream) {
        LOG_ERROR("VoiceCapture", std::string("Could not open mic stream: ") + Pa_GetErrorText(err));
        stream = nullptr;
        releaseStream();
        // The host API refuses the device outright when access is blocked
        if (err == paDeviceUnavailable) {
            return AsrStartResult::denied("microphone access refused");
        }
        return AsrStartResult::failed("could not open microphone");
    }

    err = Pa_StartStream(stream);
    if (err != paNoError) {
        LOG_ERROR("VoiceCapture", std::string("Could not start mic stream: ") + Pa_GetErrorText(err));
        releaseStream();
        return AsrStartResult::failed("could not start microphone");
    }

    handler = std::move(segmentHandler);
    running = true;
    worker = std::thread(&AudioCapture::run, this);

    LOG_PHASE("Microphone stream open", true);
    return AsrStartResult::started();
}

void AudioCapture::close() {
    running = false;
    if (worker.joinable()) worker.join();
    releaseStream();
}

void AudioCapture::releaseStream() {
    if (stream) {
        Pa_StopStream(stream);
        Pa_CloseStream(stream);
        stream = nullptr;
        LOG_DEBUG("VoiceCapture", "Stream stopped");
    }
    if (paInitialized) {
        Pa_Terminate();
        paInitialized = false;
    }
}

// ============================================================
// Worker
// ============================================================
void AudioCapture::run() {
    UtteranceSegmenter segmenter(settings);

    while (running) {
        std::vector<float> chunk;
        {
            std::lock_guard<std::mutex> lock(audio.mtx);
            if (audio.buffer.size() >= CHUNK_SAMPLES) {
                chunk.assign(audio.buffer.begin(), audio.buffer.begin() + CHUNK_SAMPLES);
                audio.buffer.erase(audio.buffer.begin(), audio.buffer.begin() + CHUNK_SAMPLES);
            }
        }

        if (chunk.empty()) {
            Pa_Sleep(20);
            continue;
        }

        auto utterance = segmenter.feed(chunk);
        if (!utterance) continue;

        LOG_TRACE("VoiceCapture", "Utterance ready (" + std::to_string(utterance->size()) + " samples)");
        try {
            handler(std::move(*utterance));
        } catch (const std::exception& e) {
            LOG_ERROR("VoiceCapture", std::string("Segment handler failed: ") + e.what());
        }
    }
}
