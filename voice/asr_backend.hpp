#pragma once
#include <functional>
#include <string>

// Receives one finished utterance per call, on the backend's worker thread
using TranscriptSink = std::function<void(const std::string&)>;

enum class AsrStartStatus {
    Started,
    Failed,
    PermissionDenied
};

struct AsrStartResult {
    AsrStartStatus status = AsrStartStatus::Started;
    std::string reason;

    bool ok() const { return status == AsrStartStatus::Started; }

    static AsrStartResult started() { return {}; }
    static AsrStartResult failed(const std::string& why) {
        return { AsrStartStatus::Failed, why };
    }
    static AsrStartResult denied(const std::string& why) {
        return { AsrStartStatus::PermissionDenied, why };
    }
};

// ------------------------------------------------------------
// AsrBackend: one recognition engine behind the voice session.
// start() returns once capture is live (or has failed); stop()
// blocks until the sink will not be called again.
// ------------------------------------------------------------
class AsrBackend {
public:
    virtual ~AsrBackend() = default;

    virtual std::string name() const = 0;
    virtual AsrStartResult start(TranscriptSink sink) = 0;
    virtual void stop() = 0;
};
