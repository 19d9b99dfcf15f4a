#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "voice/recognition_engine.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

// ----------------- helpers -----------------
static bool sameKind(const nlohmann::json& a, const nlohmann::json& b) {
    // 2 and 2.0 are both acceptable for a numeric key
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

static bool parseDouble(const std::string& text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool parseInt(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

// ----------------- defaults -----------------
namespace bootstrap_config {

nlohmann::json defaultSettings() {
    return {
        {"model", "base"},
        {"language", "en"},
        {"threads", 0},

        {"chunk_interval_s", 2.0},
        {"min_span_s", 0.3},
        {"silence_threshold", 0.005},

        {"sample_rate", 16000},
        {"block_ms", 100},
        {"input_device_index", -1},

        {"vad", {
            {"model", ""},
            {"min_silence_duration_ms", 300},
            {"speech_pad_ms", 100}
        }},

        {"clipboard_auto_copy", true},
        {"max_transcripts", 100},
        {"history_file", "transcripts.json"},
        {"save_audio", ""},
        {"log_file", "livescribe.log"}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_SILENT_INPUT", {
            {"user", "(No speech detected)"},
            {"debug", "Every evaluated span was below the silence threshold."}
        }},
        {"ERR_NO_SPEECH", {
            {"user", "(No speech detected)"},
            {"debug", "Audio was above the silence threshold but recognition returned no text."}
        }},
        {"ERR_RECOGNITION_FAILED", {
            {"user", "[Recognition] A chunk could not be transcribed and was skipped."},
            {"debug", "RecognitionEngine::transcribe threw; span marked committed."}
        }},
        {"ERR_CAPTURE_FAILED", {
            {"user", "[Audio] Input device stopped delivering audio; finishing transcript."},
            {"debug", "Capture stream ended without a stop request."}
        }},
        {"ERR_CAPTURE_START", {
            {"user", "[Audio] Could not open the microphone. Try --list-devices and --device <index>."},
            {"debug", "PortAudio initialization, open or start failed."}
        }},
        {"ERR_MODEL_LOAD_FAILED", {
            {"user", "[Model] Whisper model could not be loaded. Place a ggml model under resources/models/."},
            {"debug", "whisper_init_from_file_with_params returned null or model file missing."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Config file invalid."},
            {"debug", "livescribe_config.json failed parsing or validation."}
        }},
        {"ERR_CLIPBOARD_FAILED", {
            {"user", "Install 'wl-copy' or 'xclip' to auto-copy to clipboard"},
            {"debug", "Neither wl-copy nor xclip accepted the transcript."}
        }},
        {"ERR_HISTORY_WRITE", {
            {"user", "[History] Transcript history could not be saved."},
            {"debug", "Writing the transcript history JSON file failed."}
        }},
        {"ERR_AUDIO_SAVE", {
            {"user", "[Audio] Session recording could not be written."},
            {"debug", "sf::OutputSoundFile open or write failed."}
        }}
    };
}

// ----------------- merge -----------------
bool mergeDefaults(nlohmann::json& cfg, const nlohmann::json& defs, int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (!sameKind(cfg[key], defVal)) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error("top level is not an object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            std::ofstream(path) << outConfig.dump(2);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode);

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    }
}

bool loadSettings(const nlohmann::json& cfg, Settings& out, std::string* err) {
    auto fail = [&](const std::string& key, const std::string& hint = std::string()) {
        if (err) *err = "invalid value for '" + key + "'" + (hint.empty() ? "" : ", " + hint);
        return false;
    };

    try {
        Settings s;
        s.model            = cfg.value("model", s.model);
        s.language         = cfg.value("language", s.language);
        s.threads          = cfg.value("threads", s.threads);
        s.chunkIntervalSec = cfg.value("chunk_interval_s", s.chunkIntervalSec);
        s.minSpanSec       = cfg.value("min_span_s", s.minSpanSec);
        s.silenceThreshold = cfg.value("silence_threshold", s.silenceThreshold);
        s.sampleRate       = cfg.value("sample_rate", s.sampleRate);
        s.blockMs          = cfg.value("block_ms", s.blockMs);
        s.inputDeviceIndex = cfg.value("input_device_index", s.inputDeviceIndex);
        s.clipboardAutoCopy = cfg.value("clipboard_auto_copy", s.clipboardAutoCopy);
        s.maxTranscripts   = cfg.value("max_transcripts", s.maxTranscripts);
        s.historyFile      = cfg.value("history_file", s.historyFile);
        s.saveAudio        = cfg.value("save_audio", s.saveAudio);
        s.logFile          = cfg.value("log_file", s.logFile);

        if (cfg.contains("vad") && cfg["vad"].is_object()) {
            const auto& vad = cfg["vad"];
            s.vadModel        = vad.value("model", s.vadModel);
            s.vadMinSilenceMs = vad.value("min_silence_duration_ms", s.vadMinSilenceMs);
            s.vadSpeechPadMs  = vad.value("speech_pad_ms", s.vadSpeechPadMs);
        }

        if (s.model.empty())            return fail("model");
        if (s.threads < 0)              return fail("threads");
        if (s.chunkIntervalSec <= 0.0)  return fail("chunk_interval_s");
        if (s.minSpanSec < 0.0)         return fail("min_span_s");
        if (s.silenceThreshold < 0.0f)  return fail("silence_threshold");
        if (s.sampleRate != Voice::kRecognitionSampleRate)
            return fail("sample_rate", "must be " + std::to_string(Voice::kRecognitionSampleRate));
        if (s.blockMs <= 0)             return fail("block_ms");
        if (s.inputDeviceIndex < -1)    return fail("input_device_index");
        if (s.maxTranscripts < 0)       return fail("max_transcripts");
        if (s.vadMinSilenceMs < 0)      return fail("vad.min_silence_duration_ms");
        if (s.vadSpeechPadMs < 0)       return fail("vad.speech_pad_ms");

        out = s;
        return true;
    } catch (const nlohmann::json::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

// ----------------- command line -----------------
CliOptions parseCommandLine(int argc, char** argv) {
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](std::string& value) {
            if (i + 1 >= argc) {
                cli.error = "missing value for " + a;
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (a == "-h" || a == "--help") {
            cli.help = true;
        } else if (a == "-v" || a == "--verbose") {
            cli.verbose = true;
        } else if (a == "--list-devices") {
            cli.listDevices = true;
        } else if (a == "--no-clipboard") {
            cli.noClipboard = true;
        } else if (a == "-m" || a == "--model") {
            if (!next(value)) break;
            cli.model = value;
        } else if (a == "-c" || a == "--chunk") {
            if (!next(value)) break;
            if (!parseDouble(value, cli.chunkIntervalSec) || cli.chunkIntervalSec <= 0.0) {
                cli.error = "--chunk expects a positive number of seconds, got '" + value + "'";
                break;
            }
        } else if (a == "--device") {
            if (!next(value)) break;
            if (!parseInt(value, cli.inputDeviceIndex) || cli.inputDeviceIndex < 0) {
                cli.error = "--device expects a device index, got '" + value + "'";
                break;
            }
            cli.hasDevice = true;
        } else if (a == "--config") {
            if (!next(value)) break;
            cli.configPath = value;
        } else if (a == "--save-audio") {
            if (!next(value)) break;
            cli.saveAudio = value;
        } else {
            cli.error = "unknown argument '" + a + "'";
            break;
        }
    }
    return cli;
}

void applyOverrides(const CliOptions& cli, Settings& settings) {
    if (!cli.model.empty())          settings.model = cli.model;
    if (cli.chunkIntervalSec > 0.0)  settings.chunkIntervalSec = cli.chunkIntervalSec;
    if (cli.hasDevice)               settings.inputDeviceIndex = cli.inputDeviceIndex;
    if (!cli.saveAudio.empty())      settings.saveAudio = cli.saveAudio;
    if (cli.noClipboard)             settings.clipboardAutoCopy = false;
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "Real-time voice-to-text dictation. Press Ctrl+C to stop.\n\n"
           "  -m, --model <name>     Whisper model: base, small, medium, auto or a .bin path\n"
           "  -c, --chunk <seconds>  Process audio every N seconds (default: 2)\n"
           "      --device <index>   Audio input device index (see --list-devices)\n"
           "      --config <path>    Config file (default: livescribe_config.json)\n"
           "      --save-audio <wav> Record the session to a WAV file\n"
           "      --no-clipboard     Do not copy the final transcript\n"
           "      --list-devices     List audio devices and exit\n"
           "  -v, --verbose          Echo debug logging to the console\n"
           "  -h, --help             Show this help\n";
}

} // namespace bootstrap_config
