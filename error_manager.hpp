#pragma once

#include <string>
#include <nlohmann/json.hpp>

// ------------------------------------------------------------
// SessionResult: unified outcome for startup steps and sessions
// ------------------------------------------------------------
struct SessionResult {
    std::string message;    // user-facing text
    bool success = false;   // true if the step / session succeeded
    std::string errorCode;  // "ERR_NONE" or a catalogue code
};

// ------------------------------------------------------------
// Error codes
// ------------------------------------------------------------
namespace ErrorCode {
    inline constexpr const char* None              = "ERR_NONE";
    inline constexpr const char* SilentInput       = "ERR_SILENT_INPUT";
    inline constexpr const char* NoSpeech          = "ERR_NO_SPEECH";
    inline constexpr const char* RecognitionFailed = "ERR_RECOGNITION_FAILED";
    inline constexpr const char* CaptureFailed     = "ERR_CAPTURE_FAILED";
    inline constexpr const char* CaptureStart      = "ERR_CAPTURE_START";
    inline constexpr const char* ModelLoadFailed   = "ERR_MODEL_LOAD_FAILED";
    inline constexpr const char* ConfigInvalid     = "ERR_CONFIG_INVALID";
    inline constexpr const char* ClipboardFailed   = "ERR_CLIPBOARD_FAILED";
    inline constexpr const char* HistoryWrite      = "ERR_HISTORY_WRITE";
    inline constexpr const char* AudioSave         = "ERR_AUDIO_SAVE";
}

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json). Built-in defaults stay
    // available for codes the file does not define.
    bool load(const std::string& path);

    // Replace the catalogue with the given object (code -> {user, debug})
    void loadFromJson(const nlohmann::json& catalogue);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Log the debug message and return a failed SessionResult
    SessionResult report(const std::string& code);

    // Same as report(), with extra context appended to the debug log line
    SessionResult report(const std::string& code, const std::string& detail);

    // Terminal conditions that are not failures (no speech, silent input):
    // success stays true, the code tells the caller which message to show
    SessionResult notice(const std::string& code);

    // Successful result carrying a user message
    SessionResult ok(const std::string& message);
}
