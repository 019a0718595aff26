#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>
#include "voice/asr_backend.hpp"
#include "voice/segmenter.hpp"

// Forward declare
typedef void PaStream;

// ------------------------------------------------------------
// AudioCapture: PortAudio mono float32 input stream plus a worker
// thread that cuts utterances and hands them to a handler.
// ------------------------------------------------------------
class AudioCapture {
public:
    using SegmentHandler = std::function<void(std::vector<float>&&)>;

    explicit AudioCapture(const CaptureSettings& settings);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // Opens the device and starts the worker; handler runs on the worker
    AsrStartResult open(SegmentHandler handler);

    // Stops the worker and releases the device; safe to call twice
    void close();

    bool isOpen() const { return running; }

    struct AudioData {
        std::vector<float> buffer;
        std::mutex mtx;
    };

private:
    void run();
    void releaseStream();

    CaptureSettings settings;
    SegmentHandler handler;
    AudioData audio;
    PaStream* stream = nullptr;
    bool paInitialized = false;
    std::atomic<bool> running{false};
    std::thread worker;
};
