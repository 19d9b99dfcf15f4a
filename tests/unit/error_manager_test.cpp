#include <cassert>
#include <filesystem>
#include <fstream>

#include "error_manager.hpp"

int main() {
    // Built-in catalogue covers every code
    for (const char* code : {ErrorCode::SilentInput, ErrorCode::NoSpeech, ErrorCode::RecognitionFailed,
                             ErrorCode::CaptureFailed, ErrorCode::CaptureStart, ErrorCode::ModelLoadFailed,
                             ErrorCode::ConfigInvalid, ErrorCode::ClipboardFailed, ErrorCode::HistoryWrite,
                             ErrorCode::AudioSave}) {
        assert(ErrorManager::getUserMessage(code).find("Unknown error code") == std::string::npos);
    }

    SessionResult r = ErrorManager::report(ErrorCode::RecognitionFailed, "unit test");
    assert(!r.success);
    assert(r.errorCode == ErrorCode::RecognitionFailed);
    assert(!r.message.empty());

    SessionResult n = ErrorManager::notice(ErrorCode::NoSpeech);
    assert(n.success);
    assert(n.message == "(No speech detected)");

    SessionResult ok = ErrorManager::ok("done");
    assert(ok.success && ok.errorCode == ErrorCode::None && ok.message == "done");

    assert(ErrorManager::getUserMessage("ERR_DOES_NOT_EXIST").find("ERR_DOES_NOT_EXIST") != std::string::npos);

    // A file overrides some messages and keeps the rest
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "livescribe_errors_test.json";
    { std::ofstream(path) << R"({"ERR_NO_SPEECH": {"user": "Nothing heard", "debug": "d"}})"; }
    assert(ErrorManager::load(path.string()));
    assert(ErrorManager::getUserMessage(ErrorCode::NoSpeech) == "Nothing heard");
    assert(ErrorManager::getUserMessage(ErrorCode::SilentInput) == "(No speech detected)");

    { std::ofstream(path) << "not json"; }
    assert(!ErrorManager::load(path.string()));
    assert(!ErrorManager::load((fs::temp_directory_path() / "livescribe_missing_errors.json").string()));
    fs::remove(path);
    return 0;
}
