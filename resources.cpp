#include "resources.hpp"
#include "logger.hpp"

#include <mutex>
#include <vector>

#if defined(__APPLE__)
    #include <mach-o/dyld.h>
#elif defined(__linux__)
    #include <unistd.h>
    #include <climits>
#endif

namespace fs = std::filesystem;

static std::mutex g_resourceMutex;
static std::string g_resourceOverride;

void setResourcePath(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_resourceMutex);
    g_resourceOverride = path;
    if (!path.empty()) {
        LOG_DEBUG("Resources", "Resource path overridden: " + path);
    }
}

#if defined(BLINDFOLD_PORTABLE_ONLY)
static fs::path executableDir() {
    fs::path exePath = fs::current_path();
  #if defined(__APPLE__)
    char buffer[1024];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) == 0) {
        exePath = fs::path(buffer).parent_path();
    }
  #elif defined(__linux__)
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len > 0) {
        buffer[len] = '\0';
        exePath = fs::path(buffer).parent_path();
    }
  #endif
    return exePath;
}
#endif

// A folder that already carries positions or drills beats an empty one
// that only holds generated configs
static bool hasGameData(const fs::path& dir) {
    std::error_code ec;
    return fs::is_directory(dir / "positions", ec) || fs::is_directory(dir / "training", ec);
}

// -------------------------------------------------------------
// Locate resource root
// -------------------------------------------------------------
std::string getResourcePath() {
    {
        std::lock_guard<std::mutex> lock(g_resourceMutex);
        if (!g_resourceOverride.empty()) return g_resourceOverride;
    }

#if defined(BLINDFOLD_PORTABLE_ONLY)
    fs::path portable = executableDir() / "resources";
    LOG_TRACE("Resources", "Portable resource path: " + portable.string());
    return portable.string();
#else
    const std::vector<fs::path> candidates = {
        fs::current_path().parent_path() / "resources",   // run from build/
        fs::current_path() / "resources"
    };

    for (const auto& dir : candidates) {
        if (hasGameData(dir)) {
            LOG_TRACE("Resources", "Using resource path: " + dir.string());
            return dir.string();
        }
    }
    for (const auto& dir : candidates) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            LOG_TRACE("Resources", "Using resource path without game data: " + dir.string());
            return dir.string();
        }
    }

    LOG_TRACE("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}

fs::path resourceFile(const std::string& relative) {
    return fs::path(getResourcePath()) / relative;
}
