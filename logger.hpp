#pragma once
#include <string>

// =====================================================
// Log Levels
// =====================================================
enum class LogLevel {
    Trace = 0,
    Debug,
    Warn,
    Error
};

// =====================================================
// Phase tally (bootstrap + lifecycle phases)
// =====================================================
struct PhaseSummary {
    int passed = 0;
    int failed = 0;
    std::string lastFailed;   // name of the most recent failed phase
};

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename);
void shutdownLogger();

// Close the current file and continue in another (voice_config "log_file")
bool setLogFile(const std::string& filename);

// Lines below this level are dropped
void setLogLevel(LogLevel level);
LogLevel logLevelFromString(const std::string& name);

// Mirror log lines to stderr (on by default)
void setConsoleLogging(bool enabled);

PhaseSummary phaseSummary();

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logDebug(const std::string& tag, const std::string& msg);
void logTrace(const std::string& tag, const std::string& msg);
void logWarn(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Phase Group Controls (buffered block logging)
// =====================================================
void beginPhaseGroup();
void endPhaseGroup();

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_WARN(tag, msg) logWarn(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
