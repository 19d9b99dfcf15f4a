#pragma once
#include <functional>
#include <string>
#include <vector>

#include "output/transcript_sink.hpp"

namespace Output {

    // Runs one clipboard command with text on stdin, true on exit status 0
    using ClipboardRunner = std::function<bool(const std::string& command, const std::string& text)>;

    // Pipe text into `command` through popen
    bool runClipboardCommand(const std::string& command, const std::string& text);

    // Copies the final transcript. Tries wl-copy first, then xclip.
    class ClipboardSink : public TranscriptSink {
    public:
        explicit ClipboardSink(ClipboardRunner runner = runClipboardCommand);

        void onPartial(const std::string&) override {}
        void onFinal(const std::string& transcript) override;

        // Command that copied the last transcript ("" if none / failed)
        const std::string& lastTool() const { return lastTool_; }

        static const std::vector<std::string>& commands();

    private:
        ClipboardRunner runner_;
        std::string lastTool_;
    };

} // namespace Output
