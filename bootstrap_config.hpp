#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* LIVESCRIBE_CONFIG_FILE = "livescribe_config.json";

// ------------------------------------------------------------
// Typed runtime settings (built from the JSON config + CLI)
// ------------------------------------------------------------
struct Settings {
    // Recognition
    std::string model = "base";      // size name, "auto", or a path to a ggml file
    std::string language = "en";     // "auto" enables detection
    int threads = 0;                 // 0 = recommendedThreads()

    // Commit loop
    double chunkIntervalSec = 2.0;
    double minSpanSec = 0.3;
    float silenceThreshold = 0.005f; // peak amplitude

    // Capture
    int sampleRate = 16000;
    int blockMs = 100;
    int inputDeviceIndex = -1;       // -1 = default input

    // whisper.cpp VAD (disabled while vadModel is empty)
    std::string vadModel;
    int vadMinSilenceMs = 300;
    int vadSpeechPadMs = 100;

    // Output
    bool clipboardAutoCopy = true;
    int maxTranscripts = 100;        // 0 = unbounded
    std::string historyFile = "transcripts.json";
    std::string saveAudio;           // empty = do not record
    std::string logFile = "livescribe.log";
};

// ------------------------------------------------------------
// Command line
// ------------------------------------------------------------
struct CliOptions {
    std::string configPath = LIVESCRIBE_CONFIG_FILE;
    bool listDevices = false;
    bool verbose = false;
    bool help = false;

    // Overrides; only applied when set
    std::string model;
    double chunkIntervalSec = 0.0;
    bool hasDevice = false;
    int inputDeviceIndex = -1;
    std::string saveAudio;
    bool noClipboard = false;

    std::string error;               // non-empty when parsing failed
};

// Centralized config bootstrap for LiveScribe
namespace bootstrap_config {

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Recursively add missing / wrongly-typed keys from defs into cfg.
    // Returns true if anything was patched.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // JSON → Settings. Returns false and names the offending key in err
    // when a value is out of range.
    bool loadSettings(const nlohmann::json& cfg, Settings& out, std::string* err = nullptr);

    CliOptions parseCommandLine(int argc, char** argv);
    void applyOverrides(const CliOptions& cli, Settings& settings);
    std::string usage(const std::string& program);

    // Canonical defaults
    nlohmann::json defaultSettings();
    nlohmann::json defaultErrors();
}
