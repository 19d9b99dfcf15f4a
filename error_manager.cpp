#include "error_manager.hpp"
#include "bootstrap_config.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>

// ------------------------------------------------------------
// Catalogue storage
// ------------------------------------------------------------
static nlohmann::json g_root;
static bool g_loaded = false;
static std::mutex g_errorsMutex;

// Caller holds g_errorsMutex.
static const nlohmann::json& catalogue() {
    if (!g_loaded) {
        g_root = bootstrap_config::defaultErrors();
        g_loaded = true;
    }
    return g_root;
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json errors;
        in >> errors;

        nlohmann::json merged = bootstrap_config::defaultErrors();
        const nlohmann::json& src =
            (errors.contains("errors") && errors["errors"].is_object()) ? errors["errors"] : errors;
        for (auto& [key, val] : src.items()) {
            merged[key] = val;
        }

        {
            std::lock_guard<std::mutex> lock(g_errorsMutex);
            g_root = std::move(merged);
            g_loaded = true;
        }

        LOG_DEBUG("ErrorManager", "Loaded errors.json from: " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

void ErrorManager::loadFromJson(const nlohmann::json& catalogueJson) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    g_root = catalogueJson;
    g_loaded = true;
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    const auto& root = catalogue();
    if (root.contains(code) && root[code].contains("user")) {
        return root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    const auto& root = catalogue();
    if (root.contains(code) && root[code].contains("debug")) {
        return root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

SessionResult ErrorManager::report(const std::string& code) {
    return report(code, "");
}

SessionResult ErrorManager::report(const std::string& code, const std::string& detail) {
    SessionResult result;
    result.success   = false;
    result.message   = getUserMessage(code);
    result.errorCode = code;

    std::string line = code + " -> " + getDebugMessage(code);
    if (!detail.empty()) {
        line += " (" + detail + ")";
    }
    LOG_ERROR("ErrorManager", line);
    return result;
}

SessionResult ErrorManager::notice(const std::string& code) {
    LOG_DEBUG("ErrorManager", code + " -> " + getDebugMessage(code));
    return { getUserMessage(code), true, code };
}

SessionResult ErrorManager::ok(const std::string& message) {
    return { message, true, ErrorCode::None };
}
