#include "output/clipboard_sink.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <ctime>

#include <pthread.h>

namespace Output {

namespace {

    // Blocks SIGPIPE on the calling thread while a pipe is written. A tool
    // that exits without reading stdin then surfaces as EPIPE instead of
    // terminating the process. A SIGPIPE raised meanwhile is consumed
    // before the old mask comes back.
    class SigpipeBlock {
    public:
        SigpipeBlock() {
            sigemptyset(&pipeSet_);
            sigaddset(&pipeSet_, SIGPIPE);
            sigset_t pending;
            sigemptyset(&pending);
            wasPending_ = sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
            active_ = pthread_sigmask(SIG_BLOCK, &pipeSet_, &oldSet_) == 0;
        }

        ~SigpipeBlock() {
            if (!active_) return;
            if (!wasPending_) {
                const timespec zero{0, 0};
                while (sigtimedwait(&pipeSet_, nullptr, &zero) == -1 && errno == EINTR) {
                }
            }
            pthread_sigmask(SIG_SETMASK, &oldSet_, nullptr);
        }

        SigpipeBlock(const SigpipeBlock&) = delete;
        SigpipeBlock& operator=(const SigpipeBlock&) = delete;

    private:
        sigset_t pipeSet_;
        sigset_t oldSet_;
        bool active_ = false;
        bool wasPending_ = false;
    };

} // namespace

bool runClipboardCommand(const std::string& command, const std::string& text) {
    // Discard the tool's own output so it does not land on the transcript line
    const std::string full = command + " >/dev/null 2>&1";

    FILE* pipe = popen(full.c_str(), "w");
    if (!pipe) {
        return false;
    }
    // After popen so the tool does not inherit the blocked mask
    SigpipeBlock guard;
    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    bool writeFailed = written != text.size() || fflush(pipe) != 0 || ferror(pipe) != 0;
    int rc = pclose(pipe);
    if (writeFailed) {
        LOG_TRACE("Clipboard", command + " closed its input early");
        return false;
    }
    return rc == 0;
}

const std::vector<std::string>& ClipboardSink::commands() {
    static const std::vector<std::string> cmds = {
        "wl-copy",
        "xclip -selection clipboard"
    };
    return cmds;
}

ClipboardSink::ClipboardSink(ClipboardRunner runner) : runner_(std::move(runner)) {}

void ClipboardSink::onFinal(const std::string& transcript) {
    lastTool_.clear();
    if (transcript.empty()) {
        return;
    }

    for (const auto& cmd : commands()) {
        if (runner_(cmd, transcript)) {
            lastTool_ = cmd.substr(0, cmd.find(' '));
            LOG_DEBUG("Clipboard", "Transcript copied with " + lastTool_);
            return;
        }
        LOG_TRACE("Clipboard", cmd + " failed");
    }

    ErrorManager::report(ErrorCode::ClipboardFailed);
}

} // namespace Output
