#include "bootstrap.hpp"
#include "resources.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

BootstrapResult runBootstrapChecks(const CliOptions& cli) {
    BootstrapResult result;
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Error catalogue (optional override file in resources/)
    // ============================================================
    fs::path errorsPath = fs::path(getResourcePath()) / "errors.json";
    std::error_code ec;
    if (fs::exists(errorsPath, ec)) {
        ErrorManager::load(errorsPath.string());
    }

    // ============================================================
    // Config file → Settings
    // ============================================================
    beginPhaseGroup();
    nlohmann::json cfg;
    bootstrap_config::loadConfig(cli.configPath, bootstrap_config::defaultSettings(),
                                 cfg, "Config", ErrorCode::ConfigInvalid);
    endPhaseGroup();

    std::string err;
    if (!bootstrap_config::loadSettings(cfg, result.settings, &err)) {
        result.status = ErrorManager::report(ErrorCode::ConfigInvalid, err);
        result.status.message += " (" + err + ")";
        LOG_PHASE("Settings", false);
        return result;
    }
    bootstrap_config::applyOverrides(cli, result.settings);
    LOG_PHASE("Settings", true);

    // ============================================================
    // System detection
    // ============================================================
    result.system = detectSystem();
    logSystemInfo(result.system);

    Settings& s = result.settings;
    if (s.threads <= 0) {
        s.threads = result.system.suggestedThreads;
    }
    if (s.model == "auto") {
        s.model = result.system.suggestedModel;
        LOG_DEBUG("Bootstrap", "Model 'auto' resolved to '" + s.model + "'");
    }

    // ============================================================
    // Whisper model file
    // ============================================================
    result.modelPath = resolveModelPath(s.model, getModelsPath());
    if (result.modelPath.empty()) {
        result.status = ErrorManager::report(ErrorCode::ModelLoadFailed,
                                             "no model file for '" + s.model + "' in " + getModelsPath().string());
        LOG_PHASE("Model lookup", false);
        return result;
    }
    LOG_DEBUG("Bootstrap", "Model: " + result.modelPath.string());
    LOG_PHASE("Model lookup", true);

    result.status = ErrorManager::ok("Ready");
    return result;
}
