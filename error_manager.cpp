#include "error_manager.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>

namespace {
    std::mutex g_errorsMutex;
    nlohmann::json g_root = nlohmann::json::object();
}

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------
void ErrorManager::loadFromJson(const nlohmann::json& table) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (table.contains("errors") && table["errors"].is_object()) {
        g_root = table["errors"];
    } else if (table.is_object()) {
        g_root = table;
    } else {
        g_root = nlohmann::json::object();
    }
    LOG_DEBUG("ErrorManager", "Error codes loaded: " + std::to_string(g_root.size()));
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path);
        return false;
    }

    loadFromJson(j);
    LOG_DEBUG("ErrorManager", "Loaded errors from: " + fs::absolute(path).string());
    return true;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------
bool ErrorManager::hasCode(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    return g_root.contains(code);
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.contains(code) && g_root[code].contains("user")) {
        return g_root[code]["user"].get<std::string>();
    }
    return "Unknown error: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.contains(code) && g_root[code].contains("debug")) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "No debug message for code: " + code;
}

// ------------------------------------------------------------
// Reporting
// ------------------------------------------------------------
CommandResult ErrorManager::report(const std::string& code) {
    return report(code, "");
}

CommandResult ErrorManager::report(const std::string& code, const std::string& detail) {
    std::string userMsg  = getUserMessage(code);
    std::string debugMsg = getDebugMessage(code);

    CommandResult result;
    result.success   = false;
    result.message   = userMsg;
    result.errorCode = code;
    result.voice     = userMsg;
    result.category  = "error";

    LOG_ERROR("ErrorManager", code + " -> " + debugMsg +
                              (detail.empty() ? "" : " (" + detail + ")"));
    return result;
}
