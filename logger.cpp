#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

// =====================================================
// Globals
// =====================================================
static std::mutex g_logMutex;
static std::ofstream g_logFile;
static std::string g_logPath;

// Phase lines held back while a group is open
static bool g_buffering = false;
static std::vector<std::string> g_phaseBuffer;
static PhaseSummary g_phases;

#if defined(NDEBUG)
static std::atomic<int> g_minLevel{static_cast<int>(LogLevel::Debug)};
#else
static std::atomic<int> g_minLevel{static_cast<int>(LogLevel::Trace)};
#endif
static std::atomic<bool> g_console{true};

// Capture, scheduler and playback threads get short stable names: t0, t1, ...
static std::map<std::thread::id, int> g_threadNames;

// =====================================================
// Helpers
// =====================================================
static std::string nowTimestamp() {
    auto tp = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  tp.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

// Caller holds g_logMutex
static std::string threadName() {
    auto id = std::this_thread::get_id();
    auto it = g_threadNames.find(id);
    if (it == g_threadNames.end()) {
        it = g_threadNames.emplace(id, static_cast<int>(g_threadNames.size())).first;
    }
    return "t" + std::to_string(it->second);
}

// Caller holds g_logMutex
static void writeLine(const std::string& line) {
    if (g_logFile.is_open()) {
        g_logFile << line << '\n';
        g_logFile.flush();
    }
    if (g_console.load()) {
        std::cerr << line << '\n';
    }
}

static void writeTagged(LogLevel level, const char* label,
                        const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < g_minLevel.load()) return;

    std::lock_guard<std::mutex> lock(g_logMutex);
    writeLine(nowTimestamp() + " " + label + " [" + threadName() + "][" + tag + "] " + msg);
}

// Caller holds g_logMutex
static bool openLocked(const std::string& filename) {
    if (g_logFile.is_open()) {
        g_logFile << "---- log continues elsewhere ----\n";
        g_logFile.close();
    }

    fs::path logPath = fs::absolute(filename);
    g_logFile.open(logPath, std::ios::out | std::ios::app);
    if (!g_logFile.is_open()) {
        std::cerr << "[Logger] Could not open log file: " << logPath.string() << '\n';
        g_logPath.clear();
        return false;
    }

    g_logPath = logPath.string();
    g_logFile << "==== Blindfold Voice Log Started ====" << '\n';
    return true;
}

// =====================================================
// Level / console controls
// =====================================================
void setLogLevel(LogLevel level) {
    g_minLevel.store(static_cast<int>(level));
}

LogLevel logLevelFromString(const std::string& name) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Debug;
}

void setConsoleLogging(bool enabled) {
    g_console.store(enabled);
}

PhaseSummary phaseSummary() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_phases;
}

// =====================================================
// Phase groups
// =====================================================
void beginPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_buffering = true;
    g_phaseBuffer.clear();
}

void endPhaseGroup() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    for (const auto& line : g_phaseBuffer) {
        writeLine(line);
    }
    g_phaseBuffer.clear();
    g_buffering = false;
}

// =====================================================
// Phase Logging
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (success) {
        g_phases.passed++;
    } else {
        g_phases.failed++;
        g_phases.lastFailed = phase;
    }

    std::ostringstream oss;
    oss << "| " << nowTimestamp()
        << " | " << fs::path(file).filename().string()
        << " | " << phase
        << " | " << (success ? "ok" : "FAILED")
        << " |";

    if (g_buffering) {
        g_phaseBuffer.push_back(oss.str());
    } else {
        writeLine(oss.str());
    }
}

// =====================================================
// Debug / Trace / Warn / Error Logging
// =====================================================
void logDebug(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Debug, "DEBUG", tag, msg);
}

void logTrace(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Trace, "TRACE", tag, msg);
}

void logWarn(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Warn, "WARN ", tag, msg);
}

void logError(const std::string& tag, const std::string& msg) {
    writeTagged(LogLevel::Error, "ERROR", tag, msg);
}

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (openLocked(filename)) {
        writeLine(nowTimestamp() + " [Logger] Writing logs to: " + g_logPath);
    }
}

bool setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (!g_logPath.empty() && fs::absolute(filename).string() == g_logPath) return true;
    if (!openLocked(filename)) return false;
    writeLine(nowTimestamp() + " [Logger] Writing logs to: " + g_logPath);
    return true;
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== Blindfold Voice Log Ended ====" << '\n';
        g_logFile.close();
    }
    g_logPath.clear();
}
